/*
 * display.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Segment display frame buffer
 *
 * Notes:
 *  - Tables follow the watch glass wiring
 *  - Unused LCD pins map to 0xFF
 *
 * Updated: 2026-10-13
 */

#include "display.h"

namespace watch {

/* Segment bits in glyph bytes */
#define SEG_A 0x01u
#define SEG_B 0x02u
#define SEG_C 0x04u
#define SEG_D 0x08u
#define SEG_E 0x10u
#define SEG_F 0x20u
#define SEG_G 0x40u

static const uint8_t GLYPHS[10] = {
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F,          /* 0 */
    SEG_B | SEG_C,                                          /* 1 */
    SEG_A | SEG_B | SEG_D | SEG_E | SEG_G,                  /* 2 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_G,                  /* 3 */
    SEG_B | SEG_C | SEG_F | SEG_G,                          /* 4 */
    SEG_A | SEG_C | SEG_D | SEG_F | SEG_G,                  /* 5 */
    SEG_A | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,          /* 6 */
    SEG_A | SEG_B | SEG_C,                                  /* 7 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,  /* 8 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_F | SEG_G,          /* 9 */
};

/* LCD segment pin -> MCU segment line */
static const uint8_t LCD_TO_MCU[24] = {
    16, 9, 8, 7, 17, 2, 15, 14,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 13, 0xFF, 0xFF,
    0xFF, 12, 11, 10, 6, 5, 4, 3,
};

struct SegmentPin {
    uint8_t com;
    uint8_t lcd;
};

/* [digit][segment A..G] */
static const SegmentPin DIGIT_PINS[DISPLAY_DIGITS][7] = {
    { {1, 5},  {0, 4},  {2, 4},  {1, 5},  {2, 5},  {0, 5},  {1, 4}  },
    { {0, 3},  {0, 2},  {1, 2},  {2, 2},  {2, 3},  {1, 6},  {1, 3}  },
    { {2, 1},  {0, 0},  {2, 0},  {2, 1},  {1, 1},  {0, 1},  {1, 0}  },
    { {0, 22}, {0, 13}, {2, 22}, {2, 23}, {1, 23}, {0, 23}, {1, 22} },
    { {0, 21}, {0, 20}, {2, 19}, {2, 20}, {2, 21}, {1, 21}, {1, 20} },
    { {0, 19}, {0, 18}, {1, 17}, {2, 17}, {2, 18}, {1, 19}, {1, 18} },
};

Display::Display()
{
    clear();
}

void Display::clear()
{
    for (uint8_t i = 0; i < DISPLAY_DIGITS; i++)
        digits_[i] = GLYPH_BLANK;
    render();
}

void Display::set_digit(uint8_t pos, uint8_t value)
{
    if (pos >= DISPLAY_DIGITS)
        return;

    digits_[pos] = (value <= 9) ? value : GLYPH_BLANK;
    render();
}

void Display::render()
{
    for (uint8_t c = 0; c < LCD_COM_COUNT; c++)
        frame_.com[c] = 0;

    for (uint8_t d = 0; d < DISPLAY_DIGITS; d++) {
        if (digits_[d] == GLYPH_BLANK)
            continue;

        uint8_t glyph = GLYPHS[digits_[d]];
        for (uint8_t s = 0; s < 7; s++) {
            if (!(glyph & (1u << s)))
                continue;

            const SegmentPin &pin = DIGIT_PINS[d][s];
            uint8_t line = LCD_TO_MCU[pin.lcd];
            if (line == 0xFF)
                continue;

            frame_.com[pin.com] |= (uint32_t)1u << line;
        }
    }
}

void Display::show_time(const Time &t)
{
    digits_[0] = t.hour_tens;
    digits_[1] = t.hour_units;
    digits_[2] = t.minute_tens;
    digits_[3] = t.minute_units;
    digits_[4] = t.second_tens;
    digits_[5] = t.second_units;

    for (uint8_t i = 0; i < DISPLAY_DIGITS; i++) {
        if (digits_[i] > 9)
            digits_[i] = GLYPH_BLANK;
    }
    render();
}

void Display::show_sensors(const Measurement &m)
{
    for (uint8_t i = 0; i < DISPLAY_DIGITS; i++)
        digits_[i] = GLYPH_BLANK;

    if (m.valid) {
        /* Two digits of temperature; below zero or above 99 shows blank */
        if (m.temperature_c >= 0 && m.temperature_c <= 99) {
            if (m.temperature_c >= 10)
                digits_[0] = (uint8_t)(m.temperature_c / 10);
            digits_[1] = (uint8_t)(m.temperature_c % 10);
        }

        uint16_t mv = m.supply_mv > 9999u ? 9999u : m.supply_mv;
        digits_[2] = (uint8_t)(mv / 1000);
        digits_[3] = (uint8_t)((mv / 100) % 10);
        digits_[4] = (uint8_t)((mv / 10) % 10);
        digits_[5] = (uint8_t)(mv % 10);
    }
    render();
}

void Display::flush() const
{
    lcd_hw_write(frame_.com);
}

} // namespace watch
