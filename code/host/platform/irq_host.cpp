/*
 * irq_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host interrupt controller model
 *
 * Notes:
 *  - Single global mask, masked on handler entry, unmasked on exit
 *  - Unmasking inside a handler (the scheduler does) lets pending
 *    lines nest, like the AVR I-bit
 *
 * Updated: 2026-10-15
 */

#include "irq_hw.h"
#include "sim.h"
#include "host_platform.h"

#include <stddef.h>

static bool          g_enabled;
static bool          g_pending[IRQ_LINE_COUNT];
static irq_handler_t g_handlers[IRQ_LINE_COUNT];
static void         *g_ctx[IRQ_LINE_COUNT];
static irq_handler_t g_exit;
static void         *g_exit_ctx;

static int next_pending(void)
{
    for (int i = 0; i < IRQ_LINE_COUNT; i++) {
        if (g_pending[i])
            return i;
    }
    return -1;
}

static void deliver_pending(void)
{
    while (g_enabled) {
        int line = next_pending();
        if (line < 0)
            return;

        g_pending[line] = false;
        g_enabled = false;          /* entry masks */

        if (g_handlers[line])
            g_handlers[line](g_ctx[line]);
        if (g_exit)
            g_exit(g_exit_ctx);

        g_enabled = true;           /* return from interrupt */
    }
}

void irq_host_reset(void)
{
    g_enabled = false;
    for (int i = 0; i < IRQ_LINE_COUNT; i++) {
        g_pending[i]  = false;
        g_handlers[i] = NULL;
        g_ctx[i]      = NULL;
    }
    g_exit     = NULL;
    g_exit_ctx = NULL;
}

irq_state_t irq_hw_save(void)
{
    irq_state_t s = g_enabled ? 1 : 0;
    g_enabled = false;
    return s;
}

void irq_hw_restore(irq_state_t state)
{
    g_enabled = (state != 0);
    deliver_pending();
}

void irq_hw_enable(void)
{
    g_enabled = true;
    deliver_pending();
}

void irq_hw_disable(void)
{
    g_enabled = false;
}

bool irq_hw_enabled(void)
{
    return g_enabled;
}

void irq_hw_attach(irq_line_t line, irq_handler_t fn, void *ctx)
{
    g_handlers[line] = fn;
    g_ctx[line]      = ctx;
}

void irq_hw_attach_exit(irq_handler_t fn, void *ctx)
{
    g_exit     = fn;
    g_exit_ctx = ctx;
}

void sim_irq_raise(irq_line_t line)
{
    g_pending[line] = true;
    deliver_pending();
}

bool sim_irq_pending(irq_line_t line)
{
    return g_pending[line];
}
