/*
 * watch_app.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Application container, boot sequence and idle loop
 *
 * Notes:
 *  - One instance per firmware image; owns the scheduler, the shared
 *    state and every task context
 *  - boot() runs once per reset
 *  - idle_once() is one sleep/wake round of the idle context
 *
 * Updated: 2026-10-15
 */

#pragma once

#include "scheduler.h"
#include "shared.h"
#include "tasks.h"

namespace watch {

class WatchApp {
public:
    WatchApp();

    WatchApp(const WatchApp &) = delete;
    WatchApp &operator=(const WatchApp &) = delete;

    void boot();
    void idle_once();
    void run() __attribute__((noreturn));

    Scheduler      &scheduler() { return sched_; }
    SharedAppState &state() { return state_; }

    uint16_t calibration_cycles() const { return calibrate_.cycles; }

private:
    static void on_timebase(void *ctx);
    static void on_rtc_wakeup(void *ctx);
    static void on_alarm_button(void *ctx);
    static void on_mode_button(void *ctx);
    static void on_irq_exit(void *ctx);

    Scheduler      sched_;
    SharedAppState state_;

    WakeupTask    wakeup_;
    ButtonTask    alarm_;
    ButtonTask    mode_;
    BeepTask      beep_;
    RefreshTask   refresh_;
    CalibrateTask calibrate_;

    TaskDef tasks_[TASK_COUNT];
};

} // namespace watch
