#include <stdint.h>
#include <unity.h>

#include "display.h"
#include "sim.h"

using namespace watch;

namespace {

Measurement make_measurement(bool valid, int16_t temp, uint16_t mv)
{
    Measurement m;
    m.valid         = valid;
    m.temperature_c = temp;
    m.supply_mv     = mv;
    return m;
}

/* Expected frame from explicit digits, GLYPH_BLANK for off */
Frame frame_of(uint8_t d0, uint8_t d1, uint8_t d2, uint8_t d3, uint8_t d4, uint8_t d5)
{
    Display d;
    d.set_digit(0, d0);
    d.set_digit(1, d1);
    d.set_digit(2, d2);
    d.set_digit(3, d3);
    d.set_digit(4, d4);
    d.set_digit(5, d5);
    return d.frame();
}

void assert_frame(const Frame &want, const Frame &got)
{
    TEST_ASSERT_EQUAL_HEX32(want.com[0], got.com[0]);
    TEST_ASSERT_EQUAL_HEX32(want.com[1], got.com[1]);
    TEST_ASSERT_EQUAL_HEX32(want.com[2], got.com[2]);
}

const uint8_t B = GLYPH_BLANK;

} // namespace

void setUp(void)
{
    sim_reset();
}

void tearDown(void)
{
}

void test_new_display_is_blank(void)
{
    Display d;

    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[0]);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[1]);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[2]);
}

void test_one_in_leftmost_digit(void)
{
    Display d;
    d.set_digit(0, 1);

    TEST_ASSERT_EQUAL_HEX32(1ul << 17, d.frame().com[0]);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[1]);
    TEST_ASSERT_EQUAL_HEX32(1ul << 17, d.frame().com[2]);
}

void test_eight_in_fourth_digit(void)
{
    Display d;
    d.set_digit(3, 8);

    TEST_ASSERT_EQUAL_HEX32((1ul << 3) | (1ul << 4) | (1ul << 13), d.frame().com[0]);
    TEST_ASSERT_EQUAL_HEX32((1ul << 3) | (1ul << 4), d.frame().com[1]);
    TEST_ASSERT_EQUAL_HEX32((1ul << 3) | (1ul << 4), d.frame().com[2]);
}

void test_set_digit_ignores_bad_input(void)
{
    Display d;
    d.set_digit(6, 8);
    d.set_digit(200, 1);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[0]);

    d.set_digit(3, 8);
    d.set_digit(3, 10);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[0]);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[1]);
    TEST_ASSERT_EQUAL_HEX32(0, d.frame().com[2]);
}

void test_clear(void)
{
    Display d;
    d.set_digit(3, 8);
    d.set_digit(0, 1);
    d.clear();

    assert_frame(frame_of(B, B, B, B, B, B), d.frame());
}

void test_show_time(void)
{
    Time t;
    t.hour_tens    = 2;
    t.hour_units   = 3;
    t.minute_tens  = 5;
    t.minute_units = 9;
    t.second_tens  = 0;
    t.second_units = 7;

    Display d;
    d.show_time(t);

    assert_frame(frame_of(2, 3, 5, 9, 0, 7), d.frame());
}

void test_show_sensors(void)
{
    Display d;

    d.show_sensors(make_measurement(true, 50, 3000));
    assert_frame(frame_of(5, 0, 3, 0, 0, 0), d.frame());

    d.show_sensors(make_measurement(true, 7, 2992));
    assert_frame(frame_of(B, 7, 2, 9, 9, 2), d.frame());
}

void test_show_sensors_out_of_range(void)
{
    Display d;

    d.show_sensors(make_measurement(true, -5, 3125));
    assert_frame(frame_of(B, B, 3, 1, 2, 5), d.frame());

    d.show_sensors(make_measurement(true, 100, 12000));
    assert_frame(frame_of(B, B, 9, 9, 9, 9), d.frame());

    d.show_sensors(make_measurement(false, 50, 3000));
    assert_frame(frame_of(B, B, B, B, B, B), d.frame());
}

void test_flush_sends_frame(void)
{
    Display d;
    d.set_digit(3, 8);
    d.flush();

    uint32_t lcd[3];
    sim_lcd_frame(lcd);
    TEST_ASSERT_EQUAL_HEX32(d.frame().com[0], lcd[0]);
    TEST_ASSERT_EQUAL_HEX32(d.frame().com[1], lcd[1]);
    TEST_ASSERT_EQUAL_HEX32(d.frame().com[2], lcd[2]);
    TEST_ASSERT_EQUAL_UINT16(1, sim_lcd_writes());
}

int main(int, char **)
{
    UNITY_BEGIN();
    RUN_TEST(test_new_display_is_blank);
    RUN_TEST(test_one_in_leftmost_digit);
    RUN_TEST(test_eight_in_fourth_digit);
    RUN_TEST(test_set_digit_ignores_bad_input);
    RUN_TEST(test_clear);
    RUN_TEST(test_show_time);
    RUN_TEST(test_show_sensors);
    RUN_TEST(test_show_sensors_out_of_range);
    RUN_TEST(test_flush_sends_frame);
    return UNITY_END();
}
