/*
 * backup_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Backup register (AVR)
 *
 * Notes:
 *  - The watch never removes power from SRAM, so one .noinit byte
 *    keeps its value through every sleep mode and warm reset
 *  - Not EEPROM: rewritten every calibration cycle
 *
 * Updated: 2026-10-16
 */

#include "backup_hw.h"

static volatile uint8_t g_backup __attribute__((section(".noinit")));

void backup_hw_write(uint8_t value)
{
    g_backup = value;
}

uint8_t backup_hw_read(void)
{
    return g_backup;
}
