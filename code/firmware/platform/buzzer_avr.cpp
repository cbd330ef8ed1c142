/*
 * buzzer_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Buzzer on Timer1 (AVR)
 *
 * Mode:
 *   Fast PWM, TOP = ICR1 (mode 14), non-inverting on OC1A
 *   ICR1  = auto-reload, OCR1A = compare
 *   enable = clock select (clk/1), disable = no clock source
 *
 * Updated: 2026-10-16
 */

#include "buzzer_hw.h"
#include "config.h"
#include "gpio_avr.h"

#include <avr/io.h>

static_assert(BUZZER_TIMER_PRESCALER == 0, "Timer1 clock select assumes clk/1");

#define T1_CLOCK_MASK ((1u << CS12) | (1u << CS11) | (1u << CS10))

void buzzer_hw_init(void)
{
    gpio_buzzer_output_init();

    TCCR1B = 0;
    TCNT1  = 0;
    TCCR1A = (uint8_t)((1u << COM1A1) | (1u << WGM11));
    TCCR1B = (uint8_t)((1u << WGM13) | (1u << WGM12));
}

void buzzer_hw_counter_enable(bool on)
{
    if (on) {
        TCNT1   = 0;
        TCCR1A |= (uint8_t)(1u << COM1A1);
        TCCR1B |= (uint8_t)(1u << CS10);
    } else {
        TCCR1B &= (uint8_t)~T1_CLOCK_MASK;
        /* hand the pin back to PORTB, which idles low */
        TCCR1A &= (uint8_t)~(1u << COM1A1);
    }
}

bool buzzer_hw_counter_enabled(void)
{
    return (TCCR1B & T1_CLOCK_MASK) != 0;
}

void buzzer_hw_set_auto_reload(uint16_t value)
{
    ICR1 = value;
}

void buzzer_hw_set_compare(uint16_t value)
{
    OCR1A = value;
}
