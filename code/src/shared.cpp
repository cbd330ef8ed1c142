/*
 * shared.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Ceiling-locked shared application state
 *
 * Updated: 2026-10-14
 */

#include "shared.h"

#include "display.h"

namespace watch {

static Time midnight()
{
    Time t = { 0, 0, 0, 0, 0, 0 };
    return t;
}

static Measurement no_measurement()
{
    Measurement m = { false, 0, 0 };
    return m;
}

static PowerControl deep_sleep()
{
    PowerControl p;
    p.sleep.ultra_low_power = true;
    return p;
}

SharedAppState::SharedAppState(Scheduler &sched)
    : buzzer_enabled(sched, CEIL_BUZZER_ENABLED, false),
      now(sched, CEIL_TIME, midnight()),
      last_measurement(sched, CEIL_MEASUREMENT, no_measurement()),
      power(sched, CEIL_POWER, deep_sleep()),
      display_mode(DISPLAY_TIME)
{
}

} // namespace watch
