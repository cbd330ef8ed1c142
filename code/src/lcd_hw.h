/*
 * lcd_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Segment display controller
 *
 * Notes:
 *  - Three COM lines, 32 segment lines each
 *  - Bit n of com[c] drives MCU segment line n on COM c
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>

#define LCD_COM_COUNT 3u

void lcd_hw_init(void);
void lcd_hw_write(const uint32_t com[LCD_COM_COUNT]);
