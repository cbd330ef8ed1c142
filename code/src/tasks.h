/*
 * tasks.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Application tasks
 *
 * Task graph:
 *   wakeup     RTC 1 Hz interrupt    PRIO_WAKEUP     publish time, chime, refresh
 *   alarm_btn  alarm button edge     PRIO_ALARM_BTN  toggle hourly chime
 *   mode_btn   mode button edge      PRIO_MODE_BTN   toggle display mode
 *   beep       software              PRIO_BEEP       tone for BEEP_DURATION_MS
 *   refresh    software              PRIO_REFRESH    render current view
 *   calibrate  software, periodic    PRIO_CALIBRATE  ADC calibration + reading
 *
 * Notes:
 *  - Each task owns its context; peripheral handles live there and
 *    nowhere else
 *  - Software tasks that suspend keep their resume step in the context
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdint.h>

#include "adc.h"
#include "buttons_hw.h"
#include "buzzer.h"
#include "calibration_store.h"
#include "display.h"
#include "rtc.h"
#include "scheduler.h"
#include "shared.h"

namespace watch {

enum : TaskId {
    TASK_WAKEUP = 0,
    TASK_ALARM_BTN,
    TASK_MODE_BTN,
    TASK_BEEP,
    TASK_REFRESH,
    TASK_CALIBRATE,
    TASK_COUNT
};

struct TaskEnv {
    Scheduler      *sched;
    SharedAppState *state;
};

struct WakeupTask {
    TaskEnv             env;
    Rtc<rtc_state::Run> rtc;
};

struct ButtonTask {
    TaskEnv  env;
    button_t button;
};

struct BeepTask {
    enum Step : uint8_t {
        BEEP_START = 0,
        BEEP_STOP
    };

    TaskEnv                       env;
    Step                          step;
    Buzzer<buzzer_state::Stopped> stopped;
    Buzzer<buzzer_state::Running> running;
};

struct RefreshTask {
    TaskEnv env;
    Display display;
};

struct CalibrateTask {
    TaskEnv                  env;
    Adc<adc_state::Disabled> adc;
    CalibrationStore         store;
    adc_factory_cal          cal;
    uint16_t                 cycles;
};

void task_wakeup(void *ctx);
void task_alarm_btn(void *ctx);
void task_mode_btn(void *ctx);
void task_beep(void *ctx);
void task_refresh(void *ctx);
void task_calibrate(void *ctx);

} // namespace watch
