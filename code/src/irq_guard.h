/*
 * irq_guard.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Scoped interrupt-masked critical section
 *
 * Notes:
 *  - Restores the previous mask state, so guards nest
 *  - Keep the guarded region short; it delays every interrupt
 *
 * Updated: 2026-10-12
 */

#pragma once

#include "irq_hw.h"

namespace watch {

class IrqGuard {
public:
    IrqGuard() : saved_(irq_hw_save()) {}
    ~IrqGuard() { irq_hw_restore(saved_); }

    IrqGuard(const IrqGuard &) = delete;
    IrqGuard &operator=(const IrqGuard &) = delete;

private:
    irq_state_t saved_;
};

} // namespace watch
