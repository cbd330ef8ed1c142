/*
 * rtc_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Real-time clock hardware interface
 *
 * Time register (packed BCD, 24 h):
 *   bits 21:20  hour tens
 *   bits 19:16  hour units
 *   bits 14:12  minute tens
 *   bits 11:8   minute units
 *   bits 6:4    second tens
 *   bits 3:0    second units
 *
 * Notes:
 *  - The read path is slower than the clock itself, consecutive
 *    reads may straddle a tick
 *  - Writes to the time register only take effect in init mode
 *  - The wakeup flag stays set until cleared
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

void     rtc_hw_init(void);

uint32_t rtc_hw_read_tr(void);
void     rtc_hw_write_tr(uint32_t tr);

/* Init mode handshake */
void rtc_hw_request_init(void);
void rtc_hw_request_run(void);
bool rtc_hw_init_allowed(void);

/* 1 Hz wakeup */
void rtc_hw_wakeup_enable(void);
bool rtc_hw_wakeup_flag(void);
void rtc_hw_clear_wakeup_flag(void);

/* Clock has never been set since the backup domain lost power */
bool rtc_hw_time_lost(void);
