/*
 * gpio_avr.h
 *
 * Project: Wristwatch Firmware
 * Purpose: AVR GPIO pin definitions for the watch board
 *
 * This header defines the canonical mapping between ATmega328P pins
 * and physical functions on the watch PCB.
 *
 * IMPORTANT DESIGN RULES:
 *  - All mappings in this file are LOCKED to the board schematic.
 *  - Do NOT reassign a pin here unless the PCB changes accordingly.
 *
 * Updated:
 *   2026-10-16 (first watch board revision)
 */

#pragma once

#include <avr/io.h>
#include <stdint.h>

/* --------------------------------------------------------------------------
 * Push buttons (PCINT2 group)
 * --------------------------------------------------------------------------
 *
 * Electrical behavior (LOCKED):
 *  - External pull-down, button connects to VCC
 *  - Pressed = HIGH, interrupt on the rising edge
 *  - No internal pull-up (would fight the pull-down)
 * -------------------------------------------------------------------------- */
#define BTN_ALARM_BIT   PD2     /* PCINT18 */
#define BTN_MODE_BIT    PD3     /* PCINT19 */

/* --------------------------------------------------------------------------
 * Piezo buzzer
 * --------------------------------------------------------------------------
 *
 *  - Driven directly from OC1A
 *  - Must idle LOW so the piezo carries no DC bias
 * -------------------------------------------------------------------------- */
#define BUZZER_BIT      PB1     /* OC1A */

/* --------------------------------------------------------------------------
 * Segment LCD controller (HT1621 compatible, write-only)
 * -------------------------------------------------------------------------- */
#define LCD_CS_BIT      PC0
#define LCD_WR_BIT      PC1
#define LCD_DATA_BIT    PC2

/* --------------------------------------------------------------------------
 * Crystal
 * --------------------------------------------------------------------------
 *
 *  - 32.768 kHz watch crystal on TOSC1/TOSC2 (PB6/PB7)
 *  - Those pins are not available as GPIO
 * -------------------------------------------------------------------------- */

static inline void gpio_buttons_input_init(void)
{
    DDRD  &= (uint8_t)~((1u << BTN_ALARM_BIT) | (1u << BTN_MODE_BIT));
    PORTD &= (uint8_t)~((1u << BTN_ALARM_BIT) | (1u << BTN_MODE_BIT));
}

static inline uint8_t gpio_buttons_read(void)
{
    return (uint8_t)(PIND & ((1u << BTN_ALARM_BIT) | (1u << BTN_MODE_BIT)));
}

static inline void gpio_buzzer_output_init(void)
{
    PORTB &= (uint8_t)~(1u << BUZZER_BIT);
    DDRB  |= (uint8_t)(1u << BUZZER_BIT);
}

static inline void gpio_lcd_output_init(void)
{
    PORTC |= (uint8_t)((1u << LCD_CS_BIT) | (1u << LCD_WR_BIT));
    PORTC &= (uint8_t)~(1u << LCD_DATA_BIT);
    DDRC  |= (uint8_t)((1u << LCD_CS_BIT) | (1u << LCD_WR_BIT) | (1u << LCD_DATA_BIT));
}
