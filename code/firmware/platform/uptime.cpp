/*
 * uptime.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Monotonic timebase (AVR)
 *
 * Notes:
 *  - Counts Timer2 overflows: 32.768 kHz / 8 / 256 = 16 Hz
 *  - Timer2 keeps running in power-save sleep, so uptime does too
 *  - Timer2 itself belongs to rtc_avr.cpp
 *  - Milliseconds accumulate 62 and 63 alternately (62.5 ms per tick),
 *    so the count wraps only at 2^32 ms
 *
 * Updated: 2026-10-16
 */

#include "uptime.h"
#include "uptime_avr.h"

#include <avr/interrupt.h>
#include <stdint.h>

static volatile uint32_t g_ticks  = 0;
static volatile uint32_t g_millis = 0;

void uptime_avr_tick(void)
{
    g_ticks++;
    g_millis += (g_ticks & 1u) ? 62u : 63u;
}

void uptime_init(void)
{
    uint8_t sreg = SREG;
    cli();
    g_ticks  = 0;
    g_millis = 0;
    SREG = sreg;
}

uint32_t uptime_millis(void)
{
    uint32_t ms;
    uint8_t sreg = SREG;
    cli();
    ms = g_millis;
    SREG = sreg;

    return ms;
}
