/*
 * main_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host entry point
 *
 * Notes:
 *  - Boots the firmware over the simulated board and runs a short
 *    scripted window of simulated time
 *  - Script: enable the hourly chime, cross the top of the hour,
 *    flip to the sensor view, press the alarm button mid-beep
 *  - Host provides visibility, not hardware emulation
 *
 * Updated: 2026-10-16
 */

#include "platform/sim.h"
#include "console/mini_printf.h"
#include "watch_app.h"

#include <stdint.h>

/* Run the idle loop until the given number of simulated seconds passed */
static void run_for(watch::WatchApp &app, uint32_t seconds)
{
    uint32_t until = sim_ticks() + seconds * 16u;
    while (sim_ticks() < until)
        app.idle_once();
}

int main(void)
{
    static watch::WatchApp app;

    sim_reset();
    sim_console_echo(true);

    /* 00:59:55 */
    sim_rtc_set_register(0x00005955ul);

    app.boot();

    run_for(app, 1);
    sim_button_press(BUTTON_ALARM);

    run_for(app, 4);
    sim_button_press(BUTTON_ALARM);
    sim_button_press(BUTTON_ALARM);

    run_for(app, 2);
    sim_button_press(BUTTON_MODE);

    run_for(app, 2);
    sim_button_press(BUTTON_MODE);

    run_for(app, 1);

    mini_printf("host run done: %u sleeps, %u beeps, %u calibrations\n",
                (unsigned)sim_sleeps(), (unsigned)sim_buzzer_starts(),
                (unsigned)app.calibration_cycles());
    return 0;
}
