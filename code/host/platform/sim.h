/*
 * sim.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Host simulation knobs
 *
 * Notes:
 *  - Host only; firmware never includes this
 *  - Simulated time advances only when told to (or from
 *    system_sleep_enter), one 1/16 s tick at a time
 *  - Interrupts raised while masked stay pending and are delivered,
 *    lowest line first, when the mask drops
 *
 * Updated: 2026-10-15
 */

#pragma once

#include <stdbool.h>
#include <stdint.h>

#include "buttons_hw.h"
#include "irq_hw.h"

/* Power-on state of every simulated block, backup domain included */
void sim_reset(void);

/* Remove power from everything but the backup domain and the RTC */
void sim_power_cycle_except_backup(void);

/* ---------------- time ---------------- */

void     sim_advance_ticks(uint32_t ticks);
void     sim_advance_seconds(uint32_t seconds);
uint32_t sim_ticks(void);

/* Jump the timebase to `ticks` since boot; nothing runs on the way */
void     sim_set_ticks(uint32_t ticks);

/* ---------------- interrupts ---------------- */

void sim_irq_raise(irq_line_t line);
bool sim_irq_pending(irq_line_t line);

/* ---------------- RTC ---------------- */

void     sim_rtc_set_register(uint32_t tr);
uint32_t sim_rtc_register(void);
void     sim_rtc_set_time_lost(bool lost);
bool     sim_rtc_wakeup_enabled(void);

/* Wakeup flag and interrupt without the clock moving */
void     sim_rtc_fire_wakeup(void);

/* Clock ticks one second right after the n-th read (1-based, 0 = never) */
void     sim_rtc_tick_after_read(uint16_t n);
void     sim_rtc_reset_reads(void);
uint16_t sim_rtc_reads(void);

/* Status polls before an init/run request is acknowledged */
void sim_rtc_set_sync_latency(uint8_t polls);

/* ---------------- ADC ---------------- */

void     sim_adc_set_samples(uint16_t vrefint, uint16_t tsense);
void     sim_adc_set_calibration_result(uint8_t factor);
void     sim_adc_set_factory_cal(uint16_t vrefint_cal, uint16_t ts_cal1,
                                 uint16_t ts_cal2);

/* Status polls before any ADC flag reports completion */
void     sim_adc_set_latency(uint8_t polls);
uint32_t sim_adc_status_polls(void);

bool     sim_adc_powered(void);
uint8_t  sim_adc_applied_calibration(void);
uint16_t sim_adc_calibrations(void);
uint16_t sim_adc_sequences(void);
bool     sim_adc_last_sequence_masked(void);

/* Register sequencing errors (calibration while powered, converting while off) */
uint16_t sim_adc_misuse(void);

/* ---------------- buzzer ---------------- */

bool     sim_buzzer_running(void);
uint16_t sim_buzzer_starts(void);
uint16_t sim_buzzer_auto_reload(void);
uint16_t sim_buzzer_compare(void);

/* ---------------- buttons ---------------- */

void sim_button_press(button_t button);

/* ---------------- display ---------------- */

void     sim_lcd_frame(uint32_t out[3]);
uint16_t sim_lcd_writes(void);

/* ---------------- system ---------------- */

uint16_t sim_sleeps(void);
bool     sim_last_sleep_ultra_low_power(void);
bool     sim_clock_enabled(int clk);

/* ---------------- console ---------------- */

void sim_console_echo(bool on);
void sim_console_clear(void);
bool sim_console_contains(const char *needle);
