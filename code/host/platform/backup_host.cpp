/*
 * backup_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host backup register
 *
 * Notes:
 *  - Cleared only by sim_reset() (battery removed)
 *
 * Updated: 2026-10-15
 */

#include "backup_hw.h"
#include "host_platform.h"

static uint8_t g_backup;

void backup_host_reset(void)
{
    g_backup = 0;
}

void backup_hw_write(uint8_t value)
{
    g_backup = value;
}

uint8_t backup_hw_read(void)
{
    return g_backup;
}
