/*
 * buttons_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Push-button inputs
 *
 * Notes:
 *  - Rising edge sets the pending flag and raises the button's line
 *  - No software debounce; the handler clears the pending flag
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

typedef enum {
    BUTTON_ALARM = 0,
    BUTTON_MODE,
    BUTTON_COUNT
} button_t;

void buttons_hw_init(void);
void buttons_hw_enable_interrupts(void);
bool buttons_hw_pending(button_t button);
void buttons_hw_clear_pending(button_t button);
