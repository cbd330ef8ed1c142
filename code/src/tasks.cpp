/*
 * tasks.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Application tasks
 *
 * Updated: 2026-10-14
 */

#include "tasks.h"

#include "config.h"
#include "log.h"
#include "system_hw.h"

namespace watch {

/* ---------------- wakeup ---------------- */

void task_wakeup(void *ctx)
{
    WakeupTask &self = *static_cast<WakeupTask *>(ctx);
    SharedAppState &state = *self.env.state;

    if (!self.rtc.take_wakeup_flag())
        system_fault("wakeup interrupt without wakeup flag");

    Time t = self.rtc.time();
    state.now.lock([&t](Time &now) { now = t; });

    bool chime = false;
    state.buzzer_enabled.lock([&chime](bool &enabled) { chime = enabled; });

    if (chime && time_is_top_of_hour(t)) {
        log_info("wakeup", "%u%u:00 chime", (unsigned)t.hour_tens,
                 (unsigned)t.hour_units);
        /* A beep still sounding keeps running; this request is dropped */
        if (!self.env.sched->spawn(TASK_BEEP))
            log_error("wakeup", "beep discarded: already active");
    }

    if (!self.env.sched->spawn(TASK_REFRESH))
        log_info("wakeup", "refresh already pending");
}

/* ---------------- buttons ---------------- */

void task_alarm_btn(void *ctx)
{
    ButtonTask &self = *static_cast<ButtonTask *>(ctx);

    buttons_hw_clear_pending(self.button);

    bool on = false;
    self.env.state->buzzer_enabled.lock([&on](bool &enabled) {
        enabled = !enabled;
        on = enabled;
    });

    log_info("alarm", "hourly chime %s", on ? "on" : "off");
}

void task_mode_btn(void *ctx)
{
    ButtonTask &self = *static_cast<ButtonTask *>(ctx);
    SharedAppState &state = *self.env.state;

    buttons_hw_clear_pending(self.button);

    state.display_mode = (state.display_mode == DISPLAY_TIME) ? DISPLAY_SENSORS
                                                               : DISPLAY_TIME;

    if (!self.env.sched->spawn(TASK_REFRESH))
        log_info("mode", "refresh already pending");
}

/* ---------------- beep ---------------- */

void task_beep(void *ctx)
{
    BeepTask &self = *static_cast<BeepTask *>(ctx);

    switch (self.step) {

    case BeepTask::BEEP_START:
        self.running = consume(self.stopped).start();
        self.step = BeepTask::BEEP_STOP;
        self.env.sched->delay(BEEP_DURATION_MS);
        break;

    case BeepTask::BEEP_STOP:
        self.stopped = consume(self.running).stop();
        self.step = BeepTask::BEEP_START;
        break;
    }
}

/* ---------------- refresh ---------------- */

void task_refresh(void *ctx)
{
    RefreshTask &self = *static_cast<RefreshTask *>(ctx);
    SharedAppState &state = *self.env.state;

    if (state.display_mode == DISPLAY_SENSORS) {
        Measurement m;
        state.last_measurement.lock([&m](Measurement &last) { m = last; });
        self.display.show_sensors(m);
    } else {
        Time t;
        state.now.lock([&t](Time &now) { t = now; });
        self.display.show_time(t);
    }

    self.display.flush();
}

/* ---------------- calibrate ---------------- */

/*
 * One cycle per run: self-calibrate the powered-down converter, take a
 * reading with the fresh factor, power down again, publish, sleep until
 * the next interval.
 */
void task_calibrate(void *ctx)
{
    CalibrateTask &self = *static_cast<CalibrateTask *>(ctx);

    self.adc.calibrate(self.store);

    Adc<adc_state::Enabled> adc = consume(self.adc).enable();
    AdcSample sample = adc.measure(self.store);
    self.adc = consume(adc).disable();

    Measurement m = convert(sample, self.cal);
    self.cycles++;

    if (m.valid) {
        log_info("calib", "factor 0x%x temp %d C supply %u mV",
                 (unsigned)self.store.load(), (int)m.temperature_c,
                 (unsigned)m.supply_mv);
    } else {
        log_error("calib", "unusable reading vref %u ts %u",
                  (unsigned)sample.vrefint, (unsigned)sample.tsense);
    }

    self.env.state->last_measurement.lock([&m](Measurement &last) { last = m; });

    self.env.sched->delay(CALIBRATION_INTERVAL_MS);
}

} // namespace watch
