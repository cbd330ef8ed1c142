/*
 * watch_app.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Application container, boot sequence and idle loop
 *
 * Boot order:
 *  - clocks and power gating, console, timebase
 *  - claim peripherals, configure drivers, move handles to their tasks
 *  - set the clock from the build time if it holds no valid time
 *  - bind interrupt lines, start the 1 Hz wakeup, unmask
 *  - first calibration cycle, then idle
 *
 * Updated: 2026-10-15
 */

#include "watch_app.h"

#include "buttons_hw.h"
#include "config.h"
#include "console/console_io.h"
#include "irq_guard.h"
#include "irq_hw.h"
#include "lcd_hw.h"
#include "log.h"
#include "peripherals.h"
#include "system_hw.h"
#include "system_sleep.h"
#include "uptime.h"

namespace watch {

static const uint32_t BUZZER_ARR_WIDE =
    buzzer_auto_reload_wide(WATCH_CLK_FREQ_HZ, BUZZER_FREQ_HZ, BUZZER_TIMER_PRESCALER);

static_assert(WATCH_CLK_FREQ_HZ / (BUZZER_FREQ_HZ * (BUZZER_TIMER_PRESCALER + 1)) >= 2,
              "buzzer frequency above the timer's resolution");
static_assert(BUZZER_ARR_WIDE <= 0xFFFFu, "buzzer auto-reload exceeds 16 bits");
static_assert(BUZZER_DUTY_PERCENT <= 100u, "buzzer duty above 100%");

static const uint16_t BUZZER_ARR =
    buzzer_auto_reload(WATCH_CLK_FREQ_HZ, BUZZER_FREQ_HZ, BUZZER_TIMER_PRESCALER);
static const uint16_t BUZZER_CCR = buzzer_compare(BUZZER_DUTY_PERCENT, BUZZER_ARR);

static_assert(PRIO_WAKEUP >= PRIO_ALARM_BTN && PRIO_WAKEUP >= PRIO_MODE_BTN,
              "wakeup must be the highest priority task");
static_assert(CEIL_MEASUREMENT >= PRIO_CALIBRATE && CEIL_MEASUREMENT >= PRIO_REFRESH,
              "measurement ceiling below one of its users");
static_assert(CEIL_BUZZER_ENABLED >= PRIO_ALARM_BTN, "buzzer flag ceiling too low");

static Rtc<rtc_state::Run> set_clock_from_build(Rtc<rtc_state::Run> rtc)
{
    Time t;
    if (!time_parse(__TIME__, &t)) {
        log_error("rtc", "build time %s not usable", __TIME__);
        return rtc;
    }

    Rtc<rtc_state::Init> init = consume(rtc).init();
    if (!init.set_time(t))
        log_error("rtc", "time rejected");
    else
        log_info("rtc", "clock set to %s", __TIME__);

    return consume(init).run();
}

WatchApp::WatchApp()
    : sched_(), state_(sched_)
{
    TaskEnv env = { &sched_, &state_ };

    wakeup_.env = env;

    alarm_.env    = env;
    alarm_.button = BUTTON_ALARM;
    mode_.env     = env;
    mode_.button  = BUTTON_MODE;

    beep_.env  = env;
    beep_.step = BeepTask::BEEP_START;

    refresh_.env = env;

    calibrate_.env    = env;
    calibrate_.cycles = 0;
    calibrate_.cal.vrefint_cal = 0;
    calibrate_.cal.ts_cal1     = 0;
    calibrate_.cal.ts_cal2     = 0;

    const TaskDef defs[TASK_COUNT] = {
        { "wakeup",    PRIO_WAKEUP,    TaskKind::Interrupt, task_wakeup,    &wakeup_    },
        { "alarm_btn", PRIO_ALARM_BTN, TaskKind::Interrupt, task_alarm_btn, &alarm_     },
        { "mode_btn",  PRIO_MODE_BTN,  TaskKind::Interrupt, task_mode_btn,  &mode_      },
        { "beep",      PRIO_BEEP,      TaskKind::Software,  task_beep,      &beep_      },
        { "refresh",   PRIO_REFRESH,   TaskKind::Software,  task_refresh,   &refresh_   },
        { "calibrate", PRIO_CALIBRATE, TaskKind::Software,  task_calibrate, &calibrate_ },
    };

    for (uint8_t i = 0; i < TASK_COUNT; i++)
        tasks_[i] = defs[i];
}

void WatchApp::boot()
{
    system_hw_configure();
    console_io_init();
    uptime_init();

    log_info("boot", "wristwatch %s %s, %s reset", __DATE__, __TIME__,
             system_hw_power_on_reset() ? "power-on" : "warm");

    Peripherals p = Peripherals::take();

    /* RTC */
    Rtc<rtc_state::Run> rtc = Rtc<rtc_state::Run>::configure(consume(p.rtc));
    if (rtc.time_lost())
        rtc = set_clock_from_build(consume(rtc));
    wakeup_.rtc = consume(rtc);

    /* Buzzer, tone fixed at build time */
    Buzzer<buzzer_state::Stopped> buzzer =
        Buzzer<buzzer_state::Stopped>::configure(consume(p.buzzer));
    buzzer.set_auto_reload(BUZZER_ARR);
    buzzer.set_compare(BUZZER_CCR);
    beep_.stopped = consume(buzzer);

    /* ADC and its calibration backup */
    calibrate_.adc   = Adc<adc_state::Disabled>::configure(consume(p.adc));
    calibrate_.store = CalibrationStore::configure(consume(p.backup));
    calibrate_.cal   = factory_calibration();

    lcd_hw_init();
    refresh_.display.flush();

    sched_.configure(tasks_, TASK_COUNT);

    irq_hw_attach(IRQ_TIMEBASE,   on_timebase,     this);
    irq_hw_attach(IRQ_RTC_WAKEUP, on_rtc_wakeup,   this);
    irq_hw_attach(IRQ_ALARM_BTN,  on_alarm_button, this);
    irq_hw_attach(IRQ_MODE_BTN,   on_mode_button,  this);
    irq_hw_attach_exit(on_irq_exit, this);

    buttons_hw_init();
    buttons_hw_enable_interrupts();
    system_sleep_init();

    wakeup_.rtc.start_wakeup();

    irq_hw_enable();

    if (!sched_.spawn(TASK_CALIBRATE))
        log_error("boot", "calibrate already active");

    log_info("boot", "buzzer arr %u ccr %u, idle", (unsigned)BUZZER_ARR,
             (unsigned)BUZZER_CCR);
}

void WatchApp::idle_once()
{
    state_.power.lock([this](PowerControl &power) {
        IrqGuard guard;

        /* Work that arrived before the mask runs when the ceiling drops */
        if (!sched_.work_pending())
            system_sleep_enter(&power.sleep);
    });
}

void WatchApp::run()
{
    for (;;)
        idle_once();
}

/* ---------------- interrupt bindings ---------------- */

void WatchApp::on_timebase(void *ctx)
{
    WatchApp *app = static_cast<WatchApp *>(ctx);
    app->sched_.timer_service(uptime_millis());
}

void WatchApp::on_rtc_wakeup(void *ctx)
{
    static_cast<WatchApp *>(ctx)->sched_.post(TASK_WAKEUP);
}

void WatchApp::on_alarm_button(void *ctx)
{
    static_cast<WatchApp *>(ctx)->sched_.post(TASK_ALARM_BTN);
}

void WatchApp::on_mode_button(void *ctx)
{
    static_cast<WatchApp *>(ctx)->sched_.post(TASK_MODE_BTN);
}

void WatchApp::on_irq_exit(void *ctx)
{
    static_cast<WatchApp *>(ctx)->sched_.dispatch();
}

} // namespace watch
