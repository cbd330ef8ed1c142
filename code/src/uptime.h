/*
 * uptime.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Monotonic timebase
 *
 * Notes:
 *  - Driven by the 16 Hz timebase tick (62.5 ms resolution)
 *  - Wraps after 2^32 ms (~49.7 days); compare with signed differences
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>

// Initialize uptime timebase (firmware). Host may stub.
void uptime_init(void);

// Monotonic milliseconds since boot.
uint32_t uptime_millis(void);
