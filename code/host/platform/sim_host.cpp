/*
 * sim_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host simulation clock and reset
 *
 * Notes:
 *  - One tick = one Timer2 overflow on the watch board (1/16 s)
 *  - Per tick: timebase line, then the RTC (second boundary, wakeup)
 *
 * Updated: 2026-10-15
 */

#include "sim.h"

#include "config.h"
#include "host_platform.h"

void sim_reset(void)
{
    irq_host_reset();
    uptime_host_reset();
    adc_host_reset();
    rtc_host_reset();
    backup_host_reset();
    buzzer_host_reset();
    buttons_host_reset();
    lcd_host_reset();
    system_host_reset();
    sleep_host_reset();
    console_host_reset();
}

void sim_power_cycle_except_backup(void)
{
    adc_host_power_loss();
    buzzer_host_power_loss();
}

void sim_advance_ticks(uint32_t ticks)
{
    while (ticks--) {
        uptime_host_tick();
        sim_irq_raise(IRQ_TIMEBASE);
        rtc_host_tick();
    }
}

void sim_advance_seconds(uint32_t seconds)
{
    sim_advance_ticks(seconds * WATCH_TICKS_PER_SECOND);
}
