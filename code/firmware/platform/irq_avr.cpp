/*
 * irq_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Global interrupt mask and line binding (AVR)
 *
 * Notes:
 *  - The mask is the I bit in SREG
 *  - AVR clears I on vector entry; the scheduler sets it again while a
 *    task runs, which is what lets a newer interrupt preempt
 *
 * Updated: 2026-10-16
 */

#include "irq_hw.h"
#include "irq_avr.h"

#include <avr/interrupt.h>
#include <avr/io.h>
#include <stddef.h>

static irq_handler_t g_handlers[IRQ_LINE_COUNT];
static void         *g_ctx[IRQ_LINE_COUNT];
static irq_handler_t g_exit;
static void         *g_exit_ctx;

irq_state_t irq_hw_save(void)
{
    irq_state_t sreg = SREG;
    cli();
    return sreg;
}

void irq_hw_restore(irq_state_t state)
{
    SREG = state;
}

void irq_hw_enable(void)
{
    sei();
}

void irq_hw_disable(void)
{
    cli();
}

bool irq_hw_enabled(void)
{
    return (SREG & (1u << SREG_I)) != 0;
}

void irq_hw_attach(irq_line_t line, irq_handler_t fn, void *ctx)
{
    irq_state_t sreg = irq_hw_save();
    g_handlers[line] = fn;
    g_ctx[line]      = ctx;
    irq_hw_restore(sreg);
}

void irq_hw_attach_exit(irq_handler_t fn, void *ctx)
{
    irq_state_t sreg = irq_hw_save();
    g_exit     = fn;
    g_exit_ctx = ctx;
    irq_hw_restore(sreg);
}

void irq_avr_handle(irq_line_t line)
{
    if (g_handlers[line])
        g_handlers[line](g_ctx[line]);
}

void irq_avr_exit(void)
{
    if (g_exit)
        g_exit(g_exit_ctx);
}
