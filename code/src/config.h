/*
 * config.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Compile-time configuration
 *
 * Notes:
 *  - The watch has no runtime configuration surface
 *  - Everything here is fixed at build time
 *  - Derived timer values live next to the driver that uses them
 *
 * Updated: 2026-10-11
 */

#pragma once

#include <stdint.h>

/* --------------------------------------------------------------------------
 * Clocks
 * -------------------------------------------------------------------------- */

/* System clock after the power manager has run (8 MHz RC / 8) */
#define WATCH_CLK_FREQ_HZ        1000000UL

/* Timebase: 32.768 kHz crystal / 8 / 256 = 16 ticks per second */
#define WATCH_TICKS_PER_SECOND   16u

/* --------------------------------------------------------------------------
 * Buzzer
 * -------------------------------------------------------------------------- */

#define BUZZER_FREQ_HZ           2048u
#define BUZZER_DUTY_PERCENT      50u

/*
 * Timer prescaler register value (timer clock = clk / (prescaler + 1)).
 * Buzzer timer runs undivided so an audible tone fits the auto-reload.
 */
#define BUZZER_TIMER_PRESCALER   0u

#define BEEP_DURATION_MS         1000UL

/* --------------------------------------------------------------------------
 * ADC calibration
 * -------------------------------------------------------------------------- */

/* Reference conditions of the calibration points */
#define VREFINT_CAL_VREF_MV      3000u
#define TS_CAL1_TEMP_C           30
#define TS_CAL2_TEMP_C           130

/* Self-calibration and diagnostic reading every 15 minutes */
#define CALIBRATION_INTERVAL_MS  (15UL * 60UL * 1000UL)

/* --------------------------------------------------------------------------
 * Task priorities (0 = idle, higher preempts lower)
 * -------------------------------------------------------------------------- */

#define PRIO_CALIBRATE           1u
#define PRIO_BEEP                2u
#define PRIO_REFRESH             2u
#define PRIO_ALARM_BTN           3u
#define PRIO_MODE_BTN            3u
#define PRIO_WAKEUP              4u

#define PRIO_MAX                 PRIO_WAKEUP

/* --------------------------------------------------------------------------
 * Resource ceilings (highest priority of any task touching the resource)
 * -------------------------------------------------------------------------- */

#define CEIL_BUZZER_ENABLED      PRIO_WAKEUP     /* wakeup, alarm_btn   */
#define CEIL_TIME                PRIO_WAKEUP     /* wakeup, refresh     */
#define CEIL_MEASUREMENT         PRIO_REFRESH    /* calibrate, refresh  */
#define CEIL_POWER               PRIO_MAX        /* idle                */
