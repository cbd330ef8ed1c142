/*
 * system_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Clock/power manager and fault state (AVR)
 *
 * Design:
 *  - 8 MHz internal RC divided to 1 MHz
 *  - Every peripheral gated off in PRR except the console USART;
 *    drivers enable their own clocks
 *  - Analog comparator off, watchdog off
 *  - The part has no regulator to configure; brown-out is disabled
 *    during sleep instead (system_sleep_avr.cpp)
 *
 * Updated: 2026-10-16
 */

#include "system_hw.h"
#include "console/mini_printf.h"

#include <avr/interrupt.h>
#include <avr/io.h>
#include <avr/power.h>
#include <avr/sleep.h>
#include <avr/wdt.h>

static uint8_t g_reset_flags;
static bool    g_claimed;

void system_hw_configure(void)
{
    g_reset_flags = MCUSR;
    MCUSR = 0;
    wdt_disable();

    clock_prescale_set(clock_div_8);

    ACSR = (uint8_t)(1u << ACD);

    power_all_disable();
    power_usart0_enable();
}

void system_hw_clock_enable(periph_clock_t clk)
{
    switch (clk) {
    case PCLK_ADC:          power_adc_enable();    break;
    case PCLK_BUZZER_TIMER: power_timer1_enable(); break;
    case PCLK_RTC_TIMER:    power_timer2_enable(); break;
    case PCLK_CONSOLE:      power_usart0_enable(); break;
    default:                                       break;
    }
}

bool system_hw_power_on_reset(void)
{
    return (g_reset_flags & ((1u << PORF) | (1u << BORF))) != 0;
}

bool system_hw_claim_peripherals(void)
{
    uint8_t sreg = SREG;
    cli();
    bool first = !g_claimed;
    g_claimed = true;
    SREG = sreg;
    return first;
}

void system_fault(const char *reason)
{
    cli();
    mini_printf("FAULT: %s\n", reason);

    set_sleep_mode(SLEEP_MODE_PWR_DOWN);
    sleep_enable();
    for (;;)
        sleep_cpu();
}
