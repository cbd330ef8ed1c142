/*
 * backup_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Backup register (always-powered domain)
 *
 * Notes:
 *  - Single 8-bit slot
 *  - Retained through every sleep mode while the battery is connected
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>

void    backup_hw_write(uint8_t value);
uint8_t backup_hw_read(void);
