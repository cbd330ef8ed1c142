/*
 * lcd_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host display controller
 *
 * Updated: 2026-10-15
 */

#include "lcd_hw.h"
#include "sim.h"
#include "host_platform.h"

static uint32_t g_frame[LCD_COM_COUNT];
static uint16_t g_writes;

void lcd_host_reset(void)
{
    for (unsigned i = 0; i < LCD_COM_COUNT; i++)
        g_frame[i] = 0;
    g_writes = 0;
}

void lcd_hw_init(void)
{
}

void lcd_hw_write(const uint32_t com[LCD_COM_COUNT])
{
    for (unsigned i = 0; i < LCD_COM_COUNT; i++)
        g_frame[i] = com[i];
    g_writes++;
}

void sim_lcd_frame(uint32_t out[3])
{
    for (unsigned i = 0; i < LCD_COM_COUNT; i++)
        out[i] = g_frame[i];
}

uint16_t sim_lcd_writes(void)
{
    return g_writes;
}
