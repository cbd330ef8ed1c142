/*
 * irq_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Interrupt mask and interrupt line binding
 *
 * Notes:
 *  - One global interrupt enable, as on the target core
 *  - Hardware masks interrupts on entry to a handler and unmasks on exit
 *  - After every line handler the exit hook runs (still masked); the
 *    scheduler dispatches from there
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

typedef uint8_t irq_state_t;

typedef enum {
    IRQ_TIMEBASE = 0,       /* 16 Hz monotonic tick */
    IRQ_RTC_WAKEUP,         /* 1 Hz RTC wakeup */
    IRQ_ALARM_BTN,          /* alarm button rising edge */
    IRQ_MODE_BTN,           /* mode button rising edge */
    IRQ_LINE_COUNT
} irq_line_t;

typedef void (*irq_handler_t)(void *ctx);

/* Mask interrupts and return the previous mask state */
irq_state_t irq_hw_save(void);
void        irq_hw_restore(irq_state_t state);

void irq_hw_enable(void);
void irq_hw_disable(void);
bool irq_hw_enabled(void);

void irq_hw_attach(irq_line_t line, irq_handler_t fn, void *ctx);
void irq_hw_attach_exit(irq_handler_t fn, void *ctx);
