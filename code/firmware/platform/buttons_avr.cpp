/*
 * buttons_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Push buttons on pin-change interrupts (AVR)
 *
 * Notes:
 *  - PCINT fires on both edges; only rising edges set a pending flag
 *  - Pin-change interrupts wake the core from power-save
 *
 * Updated: 2026-10-16
 */

#include "buttons_hw.h"
#include "gpio_avr.h"
#include "irq_avr.h"

#include <avr/interrupt.h>
#include <avr/io.h>

static volatile uint8_t g_last;
static volatile bool    g_pending[BUTTON_COUNT];

ISR(PCINT2_vect)
{
    uint8_t now  = gpio_buttons_read();
    uint8_t rise = (uint8_t)(now & (uint8_t)~g_last);
    g_last = now;

    if (rise & (1u << BTN_ALARM_BIT)) {
        g_pending[BUTTON_ALARM] = true;
        irq_avr_handle(IRQ_ALARM_BTN);
    }

    if (rise & (1u << BTN_MODE_BIT)) {
        g_pending[BUTTON_MODE] = true;
        irq_avr_handle(IRQ_MODE_BTN);
    }

    irq_avr_exit();
}

void buttons_hw_init(void)
{
    gpio_buttons_input_init();
    g_last = gpio_buttons_read();
    g_pending[BUTTON_ALARM] = false;
    g_pending[BUTTON_MODE]  = false;
}

void buttons_hw_enable_interrupts(void)
{
    PCMSK2 |= (uint8_t)((1u << PCINT18) | (1u << PCINT19));
    PCIFR   = (uint8_t)(1u << PCIF2);
    PCICR  |= (uint8_t)(1u << PCIE2);
}

bool buttons_hw_pending(button_t button)
{
    return g_pending[button];
}

void buttons_hw_clear_pending(button_t button)
{
    g_pending[button] = false;
}
