/*
 * rtc_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Real-time clock on Timer2 (AVR)
 *
 * Clock source:
 *   32.768 kHz crystal on TOSC1/TOSC2, Timer2 asynchronous mode
 *   prescaler 8, overflow every 256 counts -> 16 Hz
 *
 * Design:
 *  - BCD time kept in .noinit SRAM, survives any reset but power-on
 *  - Overflow vector drives uptime, the timebase line and, every
 *    16th overflow, the seconds count and the 1 Hz wakeup
 *  - Init mode freezes the seconds count; the request is acknowledged
 *    once Timer2's asynchronous registers have synchronised
 *  - Register reads are byte-wise and may straddle an overflow
 *
 * Updated: 2026-10-16
 */

#include "rtc_hw.h"
#include "system_hw.h"
#include "config.h"
#include "irq_avr.h"
#include "uptime_avr.h"

#include <avr/interrupt.h>
#include <avr/io.h>

#define ASSR_BUSY ((1u << TCN2UB) | (1u << OCR2AUB) | (1u << OCR2BUB) | \
                   (1u << TCR2AUB) | (1u << TCR2BUB))

/* hour tens, hour units, minute tens, minute units, second tens, second units */
static volatile uint8_t g_digits[6] __attribute__((section(".noinit")));

static volatile uint8_t g_subsec;
static volatile bool    g_init_req;
static volatile bool    g_wakeup_en;
static volatile bool    g_wakeup_flag;
static bool             g_time_lost;

static void advance_second(void)
{
    if (++g_digits[5] <= 9)
        return;
    g_digits[5] = 0;

    if (++g_digits[4] <= 5)
        return;
    g_digits[4] = 0;

    if (++g_digits[3] <= 9)
        return;
    g_digits[3] = 0;

    if (++g_digits[2] <= 5)
        return;
    g_digits[2] = 0;

    if (g_digits[0] == 2 && g_digits[1] == 3) {
        g_digits[0] = 0;
        g_digits[1] = 0;
        return;
    }

    if (++g_digits[1] <= 9)
        return;
    g_digits[1] = 0;
    g_digits[0]++;
}

ISR(TIMER2_OVF_vect)
{
    uptime_avr_tick();
    irq_avr_handle(IRQ_TIMEBASE);

    if (++g_subsec >= WATCH_TICKS_PER_SECOND) {
        g_subsec = 0;

        if (!g_init_req)
            advance_second();

        g_wakeup_flag = true;
        if (g_wakeup_en)
            irq_avr_handle(IRQ_RTC_WAKEUP);
    }

    irq_avr_exit();
}

void rtc_hw_init(void)
{
    g_time_lost   = system_hw_power_on_reset();
    g_subsec      = 0;
    g_init_req    = false;
    g_wakeup_en   = false;
    g_wakeup_flag = false;

    if (g_time_lost) {
        for (uint8_t i = 0; i < 6; i++)
            g_digits[i] = 0;
    }

    TIMSK2 = 0;
    ASSR   = (uint8_t)(1u << AS2);
    TCNT2  = 0;
    TCCR2A = 0;
    TCCR2B = (uint8_t)(1u << CS21);

    while (ASSR & ASSR_BUSY) {
    }

    TIFR2  = (uint8_t)(1u << TOV2);
    TIMSK2 = (uint8_t)(1u << TOIE2);
}

uint32_t rtc_hw_read_tr(void)
{
    return ((uint32_t)(g_digits[0] & 0x3u) << 20) |
           ((uint32_t)(g_digits[1] & 0xFu) << 16) |
           ((uint32_t)(g_digits[2] & 0x7u) << 12) |
           ((uint32_t)(g_digits[3] & 0xFu) << 8)  |
           ((uint32_t)(g_digits[4] & 0x7u) << 4)  |
           ((uint32_t)(g_digits[5] & 0xFu));
}

void rtc_hw_write_tr(uint32_t tr)
{
    if (!g_init_req)
        return;

    uint8_t sreg = SREG;
    cli();
    g_digits[0] = (uint8_t)((tr >> 20) & 0x3u);
    g_digits[1] = (uint8_t)((tr >> 16) & 0xFu);
    g_digits[2] = (uint8_t)((tr >> 12) & 0x7u);
    g_digits[3] = (uint8_t)((tr >> 8)  & 0xFu);
    g_digits[4] = (uint8_t)((tr >> 4)  & 0x7u);
    g_digits[5] = (uint8_t)(tr & 0xFu);
    SREG = sreg;

    g_time_lost = false;
}

void rtc_hw_request_init(void)
{
    g_init_req = true;
    OCR2A = 0;      /* async write; OCR2AUB clears once synchronised */
}

void rtc_hw_request_run(void)
{
    g_subsec   = 0;
    g_init_req = false;
    TCNT2 = 0;      /* restart the second from here */
}

bool rtc_hw_init_allowed(void)
{
    /* While synchronising, the previous mode still applies */
    if (ASSR & ((1u << TCN2UB) | (1u << OCR2AUB)))
        return !g_init_req;
    return g_init_req;
}

void rtc_hw_wakeup_enable(void)
{
    g_wakeup_en = true;
}

bool rtc_hw_wakeup_flag(void)
{
    return g_wakeup_flag;
}

void rtc_hw_clear_wakeup_flag(void)
{
    g_wakeup_flag = false;
}

bool rtc_hw_time_lost(void)
{
    return g_time_lost;
}
