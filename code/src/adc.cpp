/*
 * adc.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged ADC driver
 *
 * Updated: 2026-10-13
 */

#include "adc.h"

#include "adc_hw.h"
#include "irq_guard.h"
#include "system_hw.h"

namespace watch {

typedef Adc<adc_state::Disabled> AdcDisabled;
typedef Adc<adc_state::Enabled>  AdcEnabled;

static uint16_t read_next_channel(void)
{
    while (!adc_hw_conversion_complete()) {
    }
    return adc_hw_read_data();
}

/* ---------------- Disabled ---------------- */

AdcDisabled AdcDisabled::configure(Raw<AdcTag> raw)
{
    raw.surrender("adc");

    system_hw_clock_enable(PCLK_ADC);
    adc_hw_init();

    return AdcDisabled(true);
}

void AdcDisabled::calibrate(CalibrationStore &store)
{
    require_live("adc");

    adc_hw_start_calibration();
    while (!adc_hw_calibration_complete()) {
    }
    adc_hw_clear_calibration_complete();

    store.store(adc_hw_read_calibration());

    while (adc_hw_calibrating()) {
    }
}

AdcEnabled AdcDisabled::enable() &&
{
    require_live("adc");

    adc_hw_power_up();
    while (!adc_hw_ready()) {
    }
    adc_hw_clear_ready();

    hollow();
    return AdcEnabled(true);
}

/* ---------------- Enabled ---------------- */

AdcSample AdcEnabled::measure(const CalibrationStore &store)
{
    require_live("adc");

    adc_hw_write_calibration(store.load());

    AdcSample sample;
    {
        /* No other conversion start may land between the two channels */
        IrqGuard guard;

        adc_hw_start_sequence();
        sample.vrefint = read_next_channel();
        sample.tsense  = read_next_channel();
    }

    while (adc_hw_sequence_active()) {
    }

    return sample;
}

AdcDisabled AdcEnabled::disable() &&
{
    require_live("adc");

    adc_hw_power_down();

    hollow();
    return AdcDisabled(true);
}

} // namespace watch
