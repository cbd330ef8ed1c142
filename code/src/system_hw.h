/*
 * system_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Clock/power manager and system fault state
 *
 * Notes:
 *  - system_hw_configure() runs once, first thing after reset
 *  - Peripheral clocks start gated off; drivers enable their own
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdbool.h>

typedef enum {
    PCLK_ADC = 0,
    PCLK_BUZZER_TIMER,
    PCLK_RTC_TIMER,
    PCLK_CONSOLE,
    PCLK_COUNT
} periph_clock_t;

void system_hw_configure(void);

void system_hw_clock_enable(periph_clock_t clk);

/* Reset was caused by power being applied */
bool system_hw_power_on_reset(void);

/* First call returns true, every later call false */
bool system_hw_claim_peripherals(void);

/*
 * Non-recoverable fault.
 * Logs the reason and halts forward progress; never returns.
 */
void system_fault(const char *reason) __attribute__((noreturn));
