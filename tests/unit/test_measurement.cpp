#include <stdint.h>
#include <unity.h>

#include "measurement.h"
#include "sim.h"

using namespace watch;

namespace {

adc_factory_cal make_cal(uint16_t vrefint_cal, uint16_t ts_cal1, uint16_t ts_cal2)
{
    adc_factory_cal cal;
    cal.vrefint_cal = vrefint_cal;
    cal.ts_cal1     = ts_cal1;
    cal.ts_cal2     = ts_cal2;
    return cal;
}

int16_t temp_of(uint16_t raw, const adc_factory_cal &cal)
{
    int16_t t = 0;
    TEST_ASSERT_TRUE(temperature_c(raw, cal, &t));
    return t;
}

uint32_t mv_of(uint16_t raw, const adc_factory_cal &cal)
{
    uint32_t mv = 0;
    TEST_ASSERT_TRUE(supply_mv(raw, cal, &mv));
    return mv;
}

} // namespace

void setUp(void)
{
    sim_reset();
}

void tearDown(void)
{
}

void test_factory_calibration_comes_from_the_part(void)
{
    sim_adc_set_factory_cal(1660, 1020, 1370);

    adc_factory_cal cal = factory_calibration();
    TEST_ASSERT_EQUAL_UINT16(1660, cal.vrefint_cal);
    TEST_ASSERT_EQUAL_UINT16(1020, cal.ts_cal1);
    TEST_ASSERT_EQUAL_UINT16(1370, cal.ts_cal2);
}

void test_temperature_at_calibration_points(void)
{
    adc_factory_cal cal = make_cal(375, 319, 419);

    TEST_ASSERT_EQUAL_INT16(30, temp_of(319, cal));
    TEST_ASSERT_EQUAL_INT16(130, temp_of(419, cal));
    TEST_ASSERT_EQUAL_INT16(50, temp_of(339, cal));
}

void test_temperature_below_first_point_is_negative(void)
{
    adc_factory_cal cal = make_cal(375, 319, 419);

    TEST_ASSERT_EQUAL_INT16(-10, temp_of(279, cal));
    TEST_ASSERT_EQUAL_INT16(-289, temp_of(0, cal));
}

/* Integer gradient: 100 / 40 truncates to 2 */
void test_temperature_gradient_truncates(void)
{
    adc_factory_cal cal = make_cal(375, 300, 340);

    TEST_ASSERT_EQUAL_INT16(30, temp_of(300, cal));
    TEST_ASSERT_EQUAL_INT16(110, temp_of(340, cal));
    TEST_ASSERT_EQUAL_INT16(-70, temp_of(250, cal));
}

void test_temperature_monotonic(void)
{
    adc_factory_cal cal = make_cal(375, 300, 340);
    int16_t prev = temp_of(200, cal);

    for (uint16_t raw = 201; raw <= 500; raw++) {
        int16_t t = temp_of(raw, cal);
        TEST_ASSERT_TRUE(t >= prev);
        prev = t;
    }
}

void test_temperature_rejects_degenerate_calibration(void)
{
    int16_t t = 77;

    TEST_ASSERT_FALSE(temperature_c(339, make_cal(375, 419, 419), &t));
    TEST_ASSERT_FALSE(temperature_c(339, make_cal(375, 419, 319), &t));
    TEST_ASSERT_EQUAL_INT16(77, t);
}

void test_supply_voltage(void)
{
    adc_factory_cal cal = make_cal(375, 319, 419);

    TEST_ASSERT_EQUAL_UINT32(3000, mv_of(375, cal));
    TEST_ASSERT_EQUAL_UINT32(2992, mv_of(376, cal));
    TEST_ASSERT_EQUAL_UINT32(3008, mv_of(374, cal));
    TEST_ASSERT_EQUAL_UINT32(3125, mv_of(360, cal));
    TEST_ASSERT_EQUAL_UINT32(3116, mv_of(361, cal));
}

void test_supply_voltage_rejects_zero_reading(void)
{
    uint32_t mv = 5;

    TEST_ASSERT_FALSE(supply_mv(0, make_cal(375, 319, 419), &mv));
    TEST_ASSERT_EQUAL_UINT32(5, mv);
}

void test_convert_both_channels(void)
{
    AdcSample s;
    s.vrefint = 375;
    s.tsense  = 339;

    Measurement m = convert(s, make_cal(375, 319, 419));
    TEST_ASSERT_TRUE(m.valid);
    TEST_ASSERT_EQUAL_INT16(50, m.temperature_c);
    TEST_ASSERT_EQUAL_UINT16(3000, m.supply_mv);
}

void test_convert_saturates_supply(void)
{
    AdcSample s;
    s.vrefint = 1;
    s.tsense  = 339;

    Measurement m = convert(s, make_cal(4095, 319, 419));
    TEST_ASSERT_TRUE(m.valid);
    TEST_ASSERT_EQUAL_UINT16(0xFFFF, m.supply_mv);
}

void test_convert_invalid_when_either_fails(void)
{
    AdcSample s;
    s.vrefint = 0;
    s.tsense  = 339;
    TEST_ASSERT_FALSE(convert(s, make_cal(375, 319, 419)).valid);

    s.vrefint = 375;
    TEST_ASSERT_FALSE(convert(s, make_cal(375, 419, 319)).valid);
}

int main(int, char **)
{
    UNITY_BEGIN();
    RUN_TEST(test_factory_calibration_comes_from_the_part);
    RUN_TEST(test_temperature_at_calibration_points);
    RUN_TEST(test_temperature_below_first_point_is_negative);
    RUN_TEST(test_temperature_gradient_truncates);
    RUN_TEST(test_temperature_monotonic);
    RUN_TEST(test_temperature_rejects_degenerate_calibration);
    RUN_TEST(test_supply_voltage);
    RUN_TEST(test_supply_voltage_rejects_zero_reading);
    RUN_TEST(test_convert_both_channels);
    RUN_TEST(test_convert_saturates_supply);
    RUN_TEST(test_convert_invalid_when_either_fails);
    return UNITY_END();
}
