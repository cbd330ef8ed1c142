/*
 * buzzer_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host buzzer timer model
 *
 * Updated: 2026-10-15
 */

#include "buzzer_hw.h"
#include "sim.h"
#include "host_platform.h"

static bool     g_enabled;
static uint16_t g_arr;
static uint16_t g_ccr;
static uint16_t g_starts;

void buzzer_host_reset(void)
{
    g_enabled = false;
    g_arr     = 0;
    g_ccr     = 0;
    g_starts  = 0;
}

void buzzer_host_power_loss(void)
{
    g_enabled = false;
}

void buzzer_hw_init(void)
{
    g_enabled = false;
}

void buzzer_hw_counter_enable(bool on)
{
    if (on && !g_enabled)
        g_starts++;
    g_enabled = on;
}

bool buzzer_hw_counter_enabled(void)
{
    return g_enabled;
}

void buzzer_hw_set_auto_reload(uint16_t value)
{
    g_arr = value;
}

void buzzer_hw_set_compare(uint16_t value)
{
    g_ccr = value;
}

bool sim_buzzer_running(void)
{
    return g_enabled;
}

uint16_t sim_buzzer_starts(void)
{
    return g_starts;
}

uint16_t sim_buzzer_auto_reload(void)
{
    return g_arr;
}

uint16_t sim_buzzer_compare(void)
{
    return g_ccr;
}
