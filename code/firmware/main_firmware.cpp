/*
 * main_firmware.cpp
 *
 * Wristwatch Firmware
 *
 * WAKE TRUTH:
 *   Timer2 overflow (32.768 kHz crystal, 16 Hz)
 *   PCINT2 (alarm PD2, mode PD3)
 *   SLEEP_MODE_PWR_SAVE
 *
 * Everything else happens in tasks.
 *
 * Updated: 2026-10-16
 */

#include "watch_app.h"

static watch::WatchApp g_app;

int main(void)
{
    g_app.boot();
    g_app.run();
}
