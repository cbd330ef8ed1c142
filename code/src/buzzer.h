/*
 * buzzer.h
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged piezo buzzer driver
 *
 * States:
 *   Buzzer<buzzer_state::Stopped>  counter disabled, output idle
 *   Buzzer<buzzer_state::Running>  counter enabled, tone on the output
 *
 * Tone:
 *   auto_reload = clock / (freq * (prescaler + 1)) - 1
 *   compare     = duty_percent * auto_reload / 100
 *
 * Notes:
 *  - Both values are computed once at build time and may be written
 *    in either state
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>

#include "handle.h"
#include "peripherals.h"

namespace watch {

constexpr uint32_t buzzer_auto_reload_wide(uint32_t clock_hz, uint32_t freq_hz,
                                           uint32_t prescaler)
{
    return clock_hz / (freq_hz * (prescaler + 1)) - 1;
}

constexpr uint16_t buzzer_auto_reload(uint32_t clock_hz, uint32_t freq_hz,
                                      uint32_t prescaler)
{
    return (uint16_t)buzzer_auto_reload_wide(clock_hz, freq_hz, prescaler);
}

constexpr uint16_t buzzer_compare(uint32_t duty_percent, uint16_t auto_reload)
{
    return (uint16_t)(duty_percent * auto_reload / 100);
}

namespace buzzer_state {
struct Stopped {};
struct Running {};
} // namespace buzzer_state

/* Tone settings, legal in every state */
class BuzzerBase : public PeripheralHandle {
public:
    void set_auto_reload(uint16_t value);
    void set_compare(uint16_t value);

protected:
    BuzzerBase() {}
    explicit BuzzerBase(bool live) : PeripheralHandle(live) {}
    BuzzerBase(BuzzerBase &&) = default;
    BuzzerBase &operator=(BuzzerBase &&) = default;
};

template <typename State>
class Buzzer;

template <>
class Buzzer<buzzer_state::Running>;

template <>
class Buzzer<buzzer_state::Stopped> : public BuzzerBase {
public:
    Buzzer() {}
    Buzzer(Buzzer &&) = default;
    Buzzer &operator=(Buzzer &&) = default;

    static Buzzer configure(Raw<BuzzerTag> raw);

    Buzzer<buzzer_state::Running> start() &&;

private:
    friend class Buzzer<buzzer_state::Running>;
    explicit Buzzer(bool live) : BuzzerBase(live) {}
};

template <>
class Buzzer<buzzer_state::Running> : public BuzzerBase {
public:
    Buzzer() {}
    Buzzer(Buzzer &&) = default;
    Buzzer &operator=(Buzzer &&) = default;

    Buzzer<buzzer_state::Stopped> stop() &&;

private:
    friend class Buzzer<buzzer_state::Stopped>;
    explicit Buzzer(bool live) : BuzzerBase(live) {}
};

} // namespace watch
