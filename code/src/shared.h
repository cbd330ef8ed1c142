/*
 * shared.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Ceiling-locked shared application state
 *
 * Notes:
 *  - A Shared<T> value is reachable only through lock(), which holds the
 *    field's priority ceiling for the duration of the body
 *  - Bodies must be short and must not suspend
 *  - Peripheral handles never live here; each is owned by one task
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdbool.h>
#include <stdint.h>

#include "config.h"
#include "measurement.h"
#include "rtc.h"
#include "scheduler.h"
#include "system_sleep.h"

namespace watch {

template <typename T>
class Shared {
public:
    Shared(Scheduler &sched, Priority ceiling, const T &initial)
        : sched_(sched), ceiling_(ceiling), value_(initial)
    {
    }

    Shared(const Shared &) = delete;
    Shared &operator=(const Shared &) = delete;

    template <typename Body>
    void lock(Body body)
    {
        Scheduler::Ceiling hold(sched_, ceiling_);
        body(value_);
    }

private:
    Scheduler &sched_;
    Priority   ceiling_;
    T          value_;
};

struct PowerControl {
    sleep_config sleep;
};

struct SharedAppState {
    explicit SharedAppState(Scheduler &sched);

    Shared<bool>         buzzer_enabled;
    Shared<Time>         now;
    Shared<Measurement>  last_measurement;
    Shared<PowerControl> power;

    /*
     * Written only by mode_btn, read only by refresh.
     * Single-byte access is atomic on the core, no ceiling.
     */
    volatile uint8_t display_mode;
};

} // namespace watch
