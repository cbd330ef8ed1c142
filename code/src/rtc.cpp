/*
 * rtc.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged real-time clock driver
 *
 * Updated: 2026-10-13
 */

#include "rtc.h"

#include "rtc_hw.h"
#include "system_hw.h"

namespace watch {

typedef Rtc<rtc_state::Run>  RtcRun;
typedef Rtc<rtc_state::Init> RtcInit;

#define TR_SU_MASK 0x0000000Ful

/* ---------------- Time ---------------- */

uint32_t time_to_register(const Time &t)
{
    return ((uint32_t)(t.hour_tens    & 0x3u) << 20) |
           ((uint32_t)(t.hour_units   & 0xFu) << 16) |
           ((uint32_t)(t.minute_tens  & 0x7u) << 12) |
           ((uint32_t)(t.minute_units & 0xFu) << 8)  |
           ((uint32_t)(t.second_tens  & 0x7u) << 4)  |
           ((uint32_t)(t.second_units & 0xFu));
}

Time time_from_register(uint32_t tr)
{
    Time t;
    t.hour_tens    = (uint8_t)((tr >> 20) & 0x3u);
    t.hour_units   = (uint8_t)((tr >> 16) & 0xFu);
    t.minute_tens  = (uint8_t)((tr >> 12) & 0x7u);
    t.minute_units = (uint8_t)((tr >> 8)  & 0xFu);
    t.second_tens  = (uint8_t)((tr >> 4)  & 0x7u);
    t.second_units = (uint8_t)(tr & 0xFu);
    return t;
}

bool time_is_valid(const Time &t)
{
    if (t.hour_tens > 2 || t.hour_units > 9)
        return false;
    if (t.hour_tens == 2 && t.hour_units > 3)
        return false;
    if (t.minute_tens > 5 || t.minute_units > 9)
        return false;
    if (t.second_tens > 5 || t.second_units > 9)
        return false;
    return true;
}

bool time_is_top_of_hour(const Time &t)
{
    return t.minute_tens == 0 && t.minute_units == 0 &&
           t.second_tens == 0 && t.second_units == 0;
}

static bool parse_digit(char c, uint8_t *out)
{
    if (c < '0' || c > '9')
        return false;
    *out = (uint8_t)(c - '0');
    return true;
}

bool time_parse(const char *s, Time *out)
{
    if (!s)
        return false;

    Time t;
    if (!parse_digit(s[0], &t.hour_tens)    ||
        !parse_digit(s[1], &t.hour_units)   || s[2] != ':' ||
        !parse_digit(s[3], &t.minute_tens)  ||
        !parse_digit(s[4], &t.minute_units) || s[5] != ':' ||
        !parse_digit(s[6], &t.second_tens)  ||
        !parse_digit(s[7], &t.second_units) || s[8] != '\0')
        return false;

    if (!time_is_valid(t))
        return false;

    *out = t;
    return true;
}

/* ---------------- Run ---------------- */

RtcRun RtcRun::configure(Raw<RtcTag> raw)
{
    raw.surrender("rtc");

    system_hw_clock_enable(PCLK_RTC_TIMER);
    rtc_hw_init();

    return RtcRun(true);
}

Time RtcRun::time() const
{
    require_live("rtc");

    uint32_t first  = rtc_hw_read_tr();
    uint32_t second = rtc_hw_read_tr();

    /* A tick landed between the reads; the third read is authoritative */
    if ((first & TR_SU_MASK) != (second & TR_SU_MASK))
        second = rtc_hw_read_tr();

    return time_from_register(second);
}

bool RtcRun::time_lost() const
{
    require_live("rtc");
    return rtc_hw_time_lost();
}

void RtcRun::start_wakeup()
{
    require_live("rtc");
    rtc_hw_clear_wakeup_flag();
    rtc_hw_wakeup_enable();
}

bool RtcRun::take_wakeup_flag()
{
    require_live("rtc");

    if (!rtc_hw_wakeup_flag())
        return false;

    rtc_hw_clear_wakeup_flag();
    return true;
}

RtcInit RtcRun::init() &&
{
    require_live("rtc");

    rtc_hw_request_init();
    while (!rtc_hw_init_allowed()) {
    }

    hollow();
    return RtcInit(true);
}

/* ---------------- Init ---------------- */

bool RtcInit::set_time(const Time &t)
{
    require_live("rtc");

    if (!time_is_valid(t))
        return false;

    rtc_hw_write_tr(time_to_register(t));
    return true;
}

RtcRun RtcInit::run() &&
{
    require_live("rtc");

    rtc_hw_request_run();
    while (rtc_hw_init_allowed()) {
    }

    hollow();
    return RtcRun(true);
}

} // namespace watch
