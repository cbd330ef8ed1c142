/*
 * rtc.h
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged real-time clock driver
 *
 * States:
 *   Rtc<rtc_state::Run>   clock running, time is read-only
 *   Rtc<rtc_state::Init>  clock held, time may be written
 *
 * Notes:
 *  - Time is six decimal digits, never a binary timestamp
 *  - 24-hour notation
 *  - Transitions block on the init-allowed status flag
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdbool.h>
#include <stdint.h>

#include "handle.h"
#include "peripherals.h"

namespace watch {

struct Time {
    uint8_t hour_tens;
    uint8_t hour_units;
    uint8_t minute_tens;
    uint8_t minute_units;
    uint8_t second_tens;
    uint8_t second_units;
};

/* Packed BCD time register layout (see rtc_hw.h) */
uint32_t time_to_register(const Time &t);
Time     time_from_register(uint32_t tr);

bool time_is_valid(const Time &t);
bool time_is_top_of_hour(const Time &t);

/* "HH:MM:SS", the format of __TIME__ */
bool time_parse(const char *hhmmss, Time *out);

namespace rtc_state {
struct Run {};
struct Init {};
} // namespace rtc_state

template <typename State>
class Rtc;

template <>
class Rtc<rtc_state::Init>;

template <>
class Rtc<rtc_state::Run> : public PeripheralHandle {
public:
    Rtc() {}
    Rtc(Rtc &&) = default;
    Rtc &operator=(Rtc &&) = default;

    static Rtc configure(Raw<RtcTag> raw);

    /* Tear-free read of the running clock */
    Time time() const;

    /* Clock holds no valid time (backup domain lost power) */
    bool time_lost() const;

    void start_wakeup();

    /* Returns the wakeup flag and clears it */
    bool take_wakeup_flag();

    Rtc<rtc_state::Init> init() &&;

private:
    friend class Rtc<rtc_state::Init>;
    explicit Rtc(bool live) : PeripheralHandle(live) {}
};

template <>
class Rtc<rtc_state::Init> : public PeripheralHandle {
public:
    Rtc() {}
    Rtc(Rtc &&) = default;
    Rtc &operator=(Rtc &&) = default;

    /* Rejects an invalid time, leaving the clock untouched */
    bool set_time(const Time &t);

    Rtc<rtc_state::Run> run() &&;

private:
    friend class Rtc<rtc_state::Run>;
    explicit Rtc(bool live) : PeripheralHandle(live) {}
};

} // namespace watch
