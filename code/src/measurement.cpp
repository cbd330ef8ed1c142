/*
 * measurement.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Raw ADC samples to engineering units
 *
 * Updated: 2026-10-12
 */

#include "measurement.h"

#include "config.h"

namespace watch {

adc_factory_cal factory_calibration()
{
    adc_factory_cal cal;
    adc_hw_factory_cal(&cal);
    return cal;
}

bool temperature_c(uint16_t raw, const adc_factory_cal &cal, int16_t *out)
{
    if (cal.ts_cal2 <= cal.ts_cal1)
        return false;

    int32_t gradient = (int32_t)(TS_CAL2_TEMP_C - TS_CAL1_TEMP_C) /
                       ((int32_t)cal.ts_cal2 - (int32_t)cal.ts_cal1);

    int32_t t = gradient * ((int32_t)raw - (int32_t)cal.ts_cal1) + TS_CAL1_TEMP_C;

    if (t > 32767)
        t = 32767;
    else if (t < -32768)
        t = -32768;

    *out = (int16_t)t;
    return true;
}

bool supply_mv(uint16_t vrefint_raw, const adc_factory_cal &cal, uint32_t *out)
{
    if (vrefint_raw == 0)
        return false;

    *out = ((uint32_t)VREFINT_CAL_VREF_MV * cal.vrefint_cal) / vrefint_raw;
    return true;
}

Measurement convert(const AdcSample &sample, const adc_factory_cal &cal)
{
    Measurement m;
    int16_t  t  = 0;
    uint32_t mv = 0;

    m.valid = temperature_c(sample.tsense, cal, &t) &&
              supply_mv(sample.vrefint, cal, &mv);

    m.temperature_c = t;
    m.supply_mv     = (mv > 0xFFFFu) ? 0xFFFFu : (uint16_t)mv;
    return m;
}

} // namespace watch
