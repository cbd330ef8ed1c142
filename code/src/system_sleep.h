#pragma once
#include <stdint.h>
#include <stdbool.h>

struct sleep_config {
    bool ultra_low_power;   /* trade wake latency for lower sleep current */
};

 void system_sleep_init(void);

/*
 * system_sleep_enter()
 *
 * Purpose:
 *  - Commit the core to the deepest sleep mode until an interrupt
 *
 * Contract:
 *  - Call with interrupts masked
 *  - Unmasks atomically with the sleep instruction, so an interrupt
 *    arriving after the caller's last check still wakes the core
 *  - Pending interrupts are serviced before this returns
 *  - Returns with interrupts masked
 *
 * Platform behavior:
 *  - HOST: advances simulated time by one timebase tick
 *  - FIRMWARE: power-save sleep, Timer2 keeps running from the crystal
 *
 * Notes:
 *  - No scheduler logic here
 *  - No logging
 */
void system_sleep_enter(const struct sleep_config *cfg);
