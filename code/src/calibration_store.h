/*
 * calibration_store.h
 *
 * Project: Wristwatch Firmware
 * Purpose: ADC calibration factor persistence
 *
 * Notes:
 *  - Backed by the backup register, not by the ADC
 *  - The ADC loses its own calibration register on every power-down;
 *    this copy is the one applied before each measurement
 *  - Single slot, no version header
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>

#include "handle.h"
#include "peripherals.h"

namespace watch {

class CalibrationStore : public PeripheralHandle {
public:
    CalibrationStore() {}
    CalibrationStore(CalibrationStore &&) = default;
    CalibrationStore &operator=(CalibrationStore &&) = default;

    static CalibrationStore configure(Raw<BackupTag> raw);

    void    store(uint8_t factor);
    uint8_t load() const;

private:
    explicit CalibrationStore(bool live) : PeripheralHandle(live) {}
};

} // namespace watch
