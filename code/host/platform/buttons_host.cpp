/*
 * buttons_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host push buttons
 *
 * Updated: 2026-10-15
 */

#include "buttons_hw.h"
#include "sim.h"
#include "host_platform.h"

static bool g_irq_enabled;
static bool g_pending[BUTTON_COUNT];

static irq_line_t button_line(button_t button)
{
    return (button == BUTTON_ALARM) ? IRQ_ALARM_BTN : IRQ_MODE_BTN;
}

void buttons_host_reset(void)
{
    g_irq_enabled = false;
    for (int i = 0; i < BUTTON_COUNT; i++)
        g_pending[i] = false;
}

void buttons_hw_init(void)
{
    for (int i = 0; i < BUTTON_COUNT; i++)
        g_pending[i] = false;
}

void buttons_hw_enable_interrupts(void)
{
    g_irq_enabled = true;
}

bool buttons_hw_pending(button_t button)
{
    return g_pending[button];
}

void buttons_hw_clear_pending(button_t button)
{
    g_pending[button] = false;
}

void sim_button_press(button_t button)
{
    g_pending[button] = true;
    if (g_irq_enabled)
        sim_irq_raise(button_line(button));
}
