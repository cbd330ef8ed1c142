/*
 * measurement.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Raw ADC samples to engineering units
 *
 * Temperature (two factory points (T1, R1), (T2, R2)):
 *   gradient = (T2 - T1) / (R2 - R1)         integer, truncating
 *   temp     = gradient * (raw - R1) + T1
 *
 * Supply voltage:
 *   mv = (VREFINT_CAL_VREF_MV * VREFINT_CAL) / vrefint_raw    floor
 *
 * Notes:
 *  - Pure functions, no hardware access
 *  - Signed arithmetic, raw readings below R1 give temperatures below T1
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "adc_hw.h"

namespace watch {

/* One conversion sequence: reference channel, then temperature channel */
struct AdcSample {
    uint16_t vrefint;
    uint16_t tsense;
};

struct Measurement {
    bool     valid;
    int16_t  temperature_c;
    uint16_t supply_mv;
};

adc_factory_cal factory_calibration();

/* False when the calibration points do not define a gradient (R2 <= R1) */
bool temperature_c(uint16_t raw, const adc_factory_cal &cal, int16_t *out);

/* False for a zero reading */
bool supply_mv(uint16_t vrefint_raw, const adc_factory_cal &cal, uint32_t *out);

/* Both conversions; valid only when both succeed */
Measurement convert(const AdcSample &sample, const adc_factory_cal &cal);

} // namespace watch
