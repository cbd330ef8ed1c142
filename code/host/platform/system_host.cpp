/*
 * system_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host clock/power manager and fault state
 *
 * Notes:
 *  - A fault ends the process; there is nothing to recover to
 *
 * Updated: 2026-10-15
 */

#include "system_hw.h"
#include "sim.h"
#include "host_platform.h"

#include <stdio.h>
#include <stdlib.h>

static bool g_claimed;
static bool g_clock[PCLK_COUNT];

void system_host_reset(void)
{
    g_claimed = false;
    for (int i = 0; i < PCLK_COUNT; i++)
        g_clock[i] = false;
}

void system_hw_configure(void)
{
    for (int i = 0; i < PCLK_COUNT; i++)
        g_clock[i] = false;
    g_clock[PCLK_CONSOLE] = true;
}

void system_hw_clock_enable(periph_clock_t clk)
{
    g_clock[clk] = true;
}

bool system_hw_power_on_reset(void)
{
    return true;
}

bool system_hw_claim_peripherals(void)
{
    if (g_claimed)
        return false;
    g_claimed = true;
    return true;
}

void system_fault(const char *reason)
{
    fprintf(stderr, "FAULT: %s\n", reason);
    fflush(stdout);
    exit(2);
}

bool sim_clock_enabled(int clk)
{
    if (clk < 0 || clk >= PCLK_COUNT)
        return false;
    return g_clock[clk];
}
