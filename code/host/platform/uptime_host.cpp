/*
 * uptime_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host uptime implementation
 *
 * Notes:
 *  - Simulated time, advanced by the simulation tick
 *  - Same 62.5 ms resolution and 62/63 ms accumulation as the watch board
 *
 * Updated: 2026-10-15
 */

#include "uptime.h"
#include "sim.h"
#include "host_platform.h"

#include <stdint.h>

static uint32_t g_ticks;
static uint32_t g_millis;

void uptime_host_reset(void)
{
    g_ticks  = 0;
    g_millis = 0;
}

void uptime_host_tick(void)
{
    g_ticks++;
    g_millis += (g_ticks & 1u) ? 62u : 63u;
}

void uptime_init(void)
{
}

uint32_t uptime_millis(void)
{
    return g_millis;
}

uint32_t sim_ticks(void)
{
    return g_ticks;
}

void sim_set_ticks(uint32_t ticks)
{
    g_ticks  = ticks;
    g_millis = ticks * 62u + ticks / 2u;
}
