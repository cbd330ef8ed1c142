/*
 * peripherals.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Raw peripheral ownership tokens
 *
 * Updated: 2026-10-12
 */

#include "peripherals.h"

#include "system_hw.h"

namespace watch {

Peripherals Peripherals::take()
{
    if (!system_hw_claim_peripherals())
        system_fault("peripherals claimed twice");

    Peripherals p;
    p.adc    = Raw<AdcTag>(true);
    p.rtc    = Raw<RtcTag>(true);
    p.backup = Raw<BackupTag>(true);
    p.buzzer = Raw<BuzzerTag>(true);
    return p;
}

} // namespace watch
