/*
 * uptime_avr.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Timebase tick hook
 *
 * Notes:
 *  - Called from the Timer2 overflow vector only
 *
 * Updated: 2026-10-16
 */

#pragma once

void uptime_avr_tick(void);
