/*
 * system_sleep_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Low-power sleep implementation for AVR firmware
 *
 * Wake sources:
 *   Timer2 overflow (16 Hz, crystal)
 *   PCINT2 (buttons)
 *
 * Design:
 *  - No policy
 *  - No scheduling
 *  - No logging
 *
 * Updated: 2026-10-16
 */

#include "system_sleep.h"
#include <avr/io.h>
#include <avr/sleep.h>
#include <avr/interrupt.h>

 void system_sleep_init(void)
 {
     set_sleep_mode(SLEEP_MODE_PWR_SAVE);
 }


/*
 * Enter PWR_SAVE until interrupt occurs.
 * Entered with interrupts masked (see system_sleep.h).
 */
 void system_sleep_enter(const struct sleep_config *cfg)
 {
     /*
      * Timer2 runs asynchronously: after a wake it needs one TOSC
      * cycle before it can wake us again. A dummy OCR2B write and
      * waiting for it to synchronise covers that.
      */
     OCR2B = 0;
     while (ASSR & (1u << OCR2BUB)) {
     }

     set_sleep_mode(SLEEP_MODE_PWR_SAVE);
     sleep_enable();

     if (cfg->ultra_low_power)
         sleep_bod_disable();

     sei();
     sleep_cpu();

     /* Execution resumes here, after the wake ISR */

     cli();
     sleep_disable();
 }
