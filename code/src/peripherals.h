/*
 * peripherals.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Raw peripheral ownership tokens
 *
 * Notes:
 *  - Peripherals::take() succeeds once per reset; a second claim faults
 *  - A raw token carries no operations; a driver's configure()
 *    consumes it and returns the driver's initial state
 *
 * Updated: 2026-10-12
 */

#pragma once

#include "handle.h"

namespace watch {

struct AdcTag {};
struct RtcTag {};
struct BackupTag {};
struct BuzzerTag {};

struct Peripherals;

template <typename Tag>
class Raw : public PeripheralHandle {
public:
    Raw() {}
    Raw(Raw &&) = default;
    Raw &operator=(Raw &&) = default;

    /* Ownership passes to the caller (a driver); faults when hollow */
    void surrender(const char *what)
    {
        require_live(what);
        hollow();
    }

private:
    friend struct Peripherals;
    explicit Raw(bool live) : PeripheralHandle(live) {}
};

struct Peripherals {
    Raw<AdcTag>    adc;
    Raw<RtcTag>    rtc;
    Raw<BackupTag> backup;
    Raw<BuzzerTag> buzzer;

    static Peripherals take();
};

} // namespace watch
