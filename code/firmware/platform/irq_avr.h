/*
 * irq_avr.h
 *
 * Project: Wristwatch Firmware
 * Purpose: ISR side of the interrupt line binding
 *
 * Notes:
 *  - Vectors call irq_avr_handle() for each line they serve, then
 *    irq_avr_exit() exactly once before returning
 *
 * Updated: 2026-10-16
 */

#pragma once

#include "irq_hw.h"

void irq_avr_handle(irq_line_t line);
void irq_avr_exit(void);
