/*
 * adc.h
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged ADC driver
 *
 * States:
 *   Adc<adc_state::Disabled>  block powered down, self-calibration allowed
 *   Adc<adc_state::Enabled>   references and converter powered, measure()
 *
 * Transitions consume the handle (call on consume(handle)) and return
 * only after the hardware reports the new state.
 *
 * Notes:
 *  - Status spin loops have no timeout; a stuck flag halts the caller
 *  - calibrate() must complete before the next enable or measure
 *  - measure() re-applies the stored factor every time; the converter
 *    forgets it across power-down
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>

#include "calibration_store.h"
#include "handle.h"
#include "measurement.h"
#include "peripherals.h"

namespace watch {

namespace adc_state {
struct Disabled {};
struct Enabled {};
} // namespace adc_state

template <typename State>
class Adc;

template <>
class Adc<adc_state::Enabled>;

template <>
class Adc<adc_state::Disabled> : public PeripheralHandle {
public:
    Adc() {}
    Adc(Adc &&) = default;
    Adc &operator=(Adc &&) = default;

    static Adc configure(Raw<AdcTag> raw);

    /* Run self-calibration and persist the resulting factor */
    void calibrate(CalibrationStore &store);

    Adc<adc_state::Enabled> enable() &&;

private:
    friend class Adc<adc_state::Enabled>;
    explicit Adc(bool live) : PeripheralHandle(live) {}
};

template <>
class Adc<adc_state::Enabled> : public PeripheralHandle {
public:
    Adc() {}
    Adc(Adc &&) = default;
    Adc &operator=(Adc &&) = default;

    AdcSample measure(const CalibrationStore &store);

    Adc<adc_state::Disabled> disable() &&;

private:
    friend class Adc<adc_state::Disabled>;
    explicit Adc(bool live) : PeripheralHandle(live) {}
};

} // namespace watch
