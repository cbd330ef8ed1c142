/*
 * display.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Segment display frame buffer
 *
 * Notes:
 *  - Six seven-segment digits, 0 is leftmost
 *  - Frame is three 32-bit COM words, bit n = MCU segment line n
 *  - Glass wiring tables live in display.cpp
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>

#include "lcd_hw.h"
#include "measurement.h"
#include "rtc.h"

namespace watch {

enum DisplayMode : uint8_t {
    DISPLAY_TIME    = 0,
    DISPLAY_SENSORS = 1
};

static const uint8_t DISPLAY_DIGITS = 6;
static const uint8_t GLYPH_BLANK    = 0xFF;

struct Frame {
    uint32_t com[LCD_COM_COUNT];
};

class Display {
public:
    Display();

    void clear();

    /* value 0..9 or GLYPH_BLANK; out-of-range positions are ignored */
    void set_digit(uint8_t pos, uint8_t value);

    /* HH MM SS */
    void show_time(const Time &t);

    /* Temperature in digits 0-1, supply millivolts in digits 2-5 */
    void show_sensors(const Measurement &m);

    const Frame &frame() const { return frame_; }

    /* Push the frame to the display controller */
    void flush() const;

private:
    uint8_t digits_[DISPLAY_DIGITS];
    Frame   frame_;

    void render();
};

} // namespace watch
