/*
 * calibration_store.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: ADC calibration factor persistence
 *
 * Updated: 2026-10-12
 */

#include "calibration_store.h"

#include "backup_hw.h"

namespace watch {

CalibrationStore CalibrationStore::configure(Raw<BackupTag> raw)
{
    raw.surrender("backup");
    return CalibrationStore(true);
}

void CalibrationStore::store(uint8_t factor)
{
    require_live("backup");
    backup_hw_write(factor);
}

uint8_t CalibrationStore::load() const
{
    require_live("backup");
    return backup_hw_read();
}

} // namespace watch
