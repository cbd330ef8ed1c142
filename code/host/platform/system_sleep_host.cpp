/*
 * system_sleep_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host sleep
 *
 * Notes:
 *  - "Sleeping" lets one timebase tick of simulated time pass
 *
 * Updated: 2026-10-15
 */

#include "system_sleep.h"
#include "irq_hw.h"
#include "sim.h"
#include "host_platform.h"

static uint16_t g_sleeps;
static bool     g_ulp;

void sleep_host_reset(void)
{
    g_sleeps = 0;
    g_ulp    = false;
}

void system_sleep_init(void)
{
}

void system_sleep_enter(const struct sleep_config *cfg)
{
    g_sleeps++;
    g_ulp = cfg->ultra_low_power;

    irq_hw_enable();
    sim_advance_ticks(1);
    irq_hw_disable();
}

uint16_t sim_sleeps(void)
{
    return g_sleeps;
}

bool sim_last_sleep_ultra_low_power(void)
{
    return g_ulp;
}
