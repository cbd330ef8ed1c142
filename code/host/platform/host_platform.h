/*
 * host_platform.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Wiring between the host simulation modules
 *
 * Updated: 2026-10-15
 */

#pragma once

#include <stdint.h>

void irq_host_reset(void);
void adc_host_reset(void);
void adc_host_power_loss(void);
void rtc_host_reset(void);
void rtc_host_tick(void);
void backup_host_reset(void);
void buzzer_host_reset(void);
void buzzer_host_power_loss(void);
void buttons_host_reset(void);
void lcd_host_reset(void);
void system_host_reset(void);
void sleep_host_reset(void);
void uptime_host_reset(void);
void uptime_host_tick(void);
void console_host_reset(void);
