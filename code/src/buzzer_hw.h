/*
 * buzzer_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Buzzer PWM timer hardware interface
 *
 * Notes:
 *  - Counter enable is the single bit that starts or stops the tone
 *  - Auto-reload and compare may be written with the counter running
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

void buzzer_hw_init(void);
void buzzer_hw_counter_enable(bool on);
bool buzzer_hw_counter_enabled(void);
void buzzer_hw_set_auto_reload(uint16_t value);
void buzzer_hw_set_compare(uint16_t value);
