/*
 * rtc_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host RTC model
 *
 * Notes:
 *  - Packed BCD time register, advanced once per 16 ticks
 *  - Time is held while init mode is requested
 *  - Tearing injection: the clock can be made to tick between two reads
 *
 * Updated: 2026-10-15
 */

#include "rtc_hw.h"
#include "sim.h"
#include "config.h"
#include "host_platform.h"

static uint32_t g_tr;
static uint8_t  g_subsec;
static bool     g_init_req;
static uint8_t  g_sync_latency;
static uint8_t  g_sync_countdown;
static bool     g_wakeup_en;
static bool     g_wakeup_flag;
static bool     g_time_lost;
static uint16_t g_reads;
static uint16_t g_tick_after_read;

static uint8_t bcd_field(uint32_t tr, uint8_t shift, uint8_t mask)
{
    return (uint8_t)((tr >> shift) & mask);
}

static void advance_second(void)
{
    uint8_t h = (uint8_t)(bcd_field(g_tr, 20, 0x3) * 10 + bcd_field(g_tr, 16, 0xF));
    uint8_t m = (uint8_t)(bcd_field(g_tr, 12, 0x7) * 10 + bcd_field(g_tr, 8, 0xF));
    uint8_t s = (uint8_t)(bcd_field(g_tr, 4, 0x7) * 10 + bcd_field(g_tr, 0, 0xF));

    if (++s >= 60) {
        s = 0;
        if (++m >= 60) {
            m = 0;
            if (++h >= 24)
                h = 0;
        }
    }

    g_tr = ((uint32_t)(h / 10) << 20) | ((uint32_t)(h % 10) << 16) |
           ((uint32_t)(m / 10) << 12) | ((uint32_t)(m % 10) << 8) |
           ((uint32_t)(s / 10) << 4)  | (uint32_t)(s % 10);
}

void rtc_host_reset(void)
{
    g_tr              = 0x00120000ul;   /* 12:00:00 */
    g_subsec          = 0;
    g_init_req        = false;
    g_sync_latency    = 2;
    g_sync_countdown  = 0;
    g_wakeup_en       = false;
    g_wakeup_flag     = false;
    g_time_lost       = false;
    g_reads           = 0;
    g_tick_after_read = 0;
}

void rtc_host_tick(void)
{
    if (++g_subsec < WATCH_TICKS_PER_SECOND)
        return;

    g_subsec = 0;
    if (!g_init_req)
        advance_second();

    g_wakeup_flag = true;
    if (g_wakeup_en)
        sim_irq_raise(IRQ_RTC_WAKEUP);
}

void rtc_hw_init(void)
{
    g_wakeup_en   = false;
    g_wakeup_flag = false;
}

uint32_t rtc_hw_read_tr(void)
{
    uint32_t v = g_tr;

    g_reads++;
    if (g_tick_after_read != 0 && g_reads == g_tick_after_read)
        advance_second();

    return v;
}

void rtc_hw_write_tr(uint32_t tr)
{
    if (!g_init_req || g_sync_countdown > 0)
        return;

    g_tr        = tr;
    g_time_lost = false;
}

void rtc_hw_request_init(void)
{
    g_init_req       = true;
    g_sync_countdown = g_sync_latency;
}

void rtc_hw_request_run(void)
{
    g_init_req       = false;
    g_subsec         = 0;
    g_sync_countdown = g_sync_latency;
}

bool rtc_hw_init_allowed(void)
{
    /* Until the request is synchronised the previous mode is reported */
    if (g_sync_countdown > 0) {
        g_sync_countdown--;
        return !g_init_req;
    }
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

/* ---------------- knobs ---------------- */

void sim_rtc_set_register(uint32_t tr)
{
    g_tr        = tr;
    g_subsec    = 0;
    g_time_lost = false;
}

uint32_t sim_rtc_register(void)
{
    return g_tr;
}

void sim_rtc_set_time_lost(bool lost)
{
    g_time_lost = lost;
}

bool sim_rtc_wakeup_enabled(void)
{
    return g_wakeup_en;
}

void sim_rtc_fire_wakeup(void)
{
    g_wakeup_flag = true;
    if (g_wakeup_en)
        sim_irq_raise(IRQ_RTC_WAKEUP);
}

void sim_rtc_tick_after_read(uint16_t n)
{
    g_tick_after_read = n;
}

void sim_rtc_reset_reads(void)
{
    g_reads = 0;
}

uint16_t sim_rtc_reads(void)
{
    return g_reads;
}

void sim_rtc_set_sync_latency(uint8_t polls)
{
    g_sync_latency = polls;
}
