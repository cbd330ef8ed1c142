/*
 * handle.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Exclusive peripheral ownership
 *
 * Updated: 2026-10-12
 */

#include "handle.h"

#include "log.h"
#include "system_hw.h"

namespace watch {

void PeripheralHandle::require_live(const char *what) const
{
    if (!live_) {
        log_error("handle", "%s: handle does not own its peripheral", what);
        system_fault("hollow peripheral handle");
    }
}

} // namespace watch
