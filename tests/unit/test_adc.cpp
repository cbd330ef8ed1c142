#include <stdint.h>
#include <type_traits>
#include <utility>
#include <unity.h>

#include "adc.h"
#include "calibration_store.h"
#include "irq_hw.h"
#include "peripherals.h"
#include "sim.h"

using namespace watch;

typedef Adc<adc_state::Disabled> AdcOff;
typedef Adc<adc_state::Enabled>  AdcOn;

namespace {

/* Operation availability per state, detected without calling anything */

template <typename T, typename = void>
struct can_enable : std::false_type {};
template <typename T>
struct can_enable<T, decltype((void)std::declval<T>().enable())> : std::true_type {};

template <typename T, typename = void>
struct can_disable : std::false_type {};
template <typename T>
struct can_disable<T, decltype((void)std::declval<T>().disable())> : std::true_type {};

template <typename T, typename = void>
struct can_measure : std::false_type {};
template <typename T>
struct can_measure<T, decltype((void)std::declval<T &>().measure(
                          std::declval<const CalibrationStore &>()))> : std::true_type {};

template <typename T, typename = void>
struct can_calibrate : std::false_type {};
template <typename T>
struct can_calibrate<T, decltype((void)std::declval<T &>().calibrate(
                            std::declval<CalibrationStore &>()))> : std::true_type {};

/* Transitions only on an rvalue: the old handle must be given up */
static_assert(can_enable<AdcOff>::value, "Disabled -> Enabled");
static_assert(!can_enable<AdcOff &>::value, "enable needs consume()");
static_assert(!can_enable<AdcOn>::value, "already enabled");

static_assert(can_disable<AdcOn>::value, "Enabled -> Disabled");
static_assert(!can_disable<AdcOn &>::value, "disable needs consume()");
static_assert(!can_disable<AdcOff>::value, "already disabled");

static_assert(can_measure<AdcOn>::value, "measure while enabled");
static_assert(!can_measure<AdcOff>::value, "no measure while disabled");

static_assert(can_calibrate<AdcOff>::value, "calibrate while disabled");
static_assert(!can_calibrate<AdcOn>::value, "no calibrate while enabled");

static_assert(!std::is_copy_constructible<AdcOff>::value, "handles are unique");
static_assert(!std::is_copy_constructible<AdcOn>::value, "handles are unique");
static_assert(!std::is_copy_assignable<AdcOn>::value, "handles are unique");
static_assert(!std::is_constructible<AdcOn, bool>::value, "no forged handles");
static_assert(!std::is_constructible<AdcOff, bool>::value, "no forged handles");

Peripherals g_p;

} // namespace

void setUp(void)
{
    sim_reset();
    irq_hw_enable();
    g_p = Peripherals::take();
}

void tearDown(void)
{
}

void test_enable_spins_until_ready(void)
{
    sim_adc_set_latency(5);
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    uint32_t before = sim_adc_status_polls();
    AdcOn on = consume(adc).enable();

    TEST_ASSERT_TRUE(sim_adc_powered());
    TEST_ASSERT_EQUAL_UINT32(6, sim_adc_status_polls() - before);
    TEST_ASSERT_TRUE(on.live());
    TEST_ASSERT_FALSE(adc.live());
}

void test_configure_consumes_raw_token(void)
{
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    TEST_ASSERT_TRUE(adc.live());
    TEST_ASSERT_FALSE(g_p.adc.live());
    TEST_ASSERT_TRUE(sim_clock_enabled(PCLK_ADC));
    TEST_ASSERT_FALSE(sim_adc_powered());
}

void test_calibrate_persists_factor(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    sim_adc_set_calibration_result(0x5A);
    adc.calibrate(store);

    TEST_ASSERT_EQUAL_HEX8(0x5A, store.load());
    TEST_ASSERT_EQUAL_UINT16(1, sim_adc_calibrations());
    TEST_ASSERT_EQUAL_UINT16(0, sim_adc_misuse());
}

void test_calibrate_is_idempotent(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    sim_adc_set_calibration_result(0x21);
    adc.calibrate(store);
    adc.calibrate(store);

    TEST_ASSERT_EQUAL_HEX8(0x21, store.load());
    TEST_ASSERT_EQUAL_UINT16(2, sim_adc_calibrations());
    TEST_ASSERT_EQUAL_UINT16(0, sim_adc_misuse());
}

void test_measure_applies_stored_factor_and_reads_reference_first(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    sim_adc_set_calibration_result(0x5A);
    adc.calibrate(store);

    AdcOn on = consume(adc).enable();
    TEST_ASSERT_EQUAL_HEX8(0x00, sim_adc_applied_calibration());

    sim_adc_set_samples(400, 350);
    AdcSample s = on.measure(store);

    TEST_ASSERT_EQUAL_HEX8(0x5A, sim_adc_applied_calibration());
    TEST_ASSERT_EQUAL_UINT16(400, s.vrefint);
    TEST_ASSERT_EQUAL_UINT16(350, s.tsense);
    TEST_ASSERT_EQUAL_UINT16(1, sim_adc_sequences());
    TEST_ASSERT_EQUAL_UINT16(0, sim_adc_misuse());
}

void test_measure_reads_pair_with_interrupts_masked(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));
    AdcOn on = consume(adc).enable();

    on.measure(store);

    TEST_ASSERT_TRUE(sim_adc_last_sequence_masked());
    TEST_ASSERT_TRUE(irq_hw_enabled());
}

void test_disable_loses_register_but_not_backup(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    sim_adc_set_calibration_result(0x3C);
    adc.calibrate(store);

    AdcOn on = consume(adc).enable();
    on.measure(store);
    adc = consume(on).disable();

    TEST_ASSERT_FALSE(sim_adc_powered());
    TEST_ASSERT_EQUAL_HEX8(0x00, sim_adc_applied_calibration());
    TEST_ASSERT_EQUAL_HEX8(0x3C, store.load());

    on = consume(adc).enable();
    on.measure(store);
    TEST_ASSERT_EQUAL_HEX8(0x3C, sim_adc_applied_calibration());
}

void test_factor_survives_power_loss_and_is_reapplied(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    sim_adc_set_calibration_result(0x77);
    adc.calibrate(store);

    sim_power_cycle_except_backup();

    AdcOn on = consume(adc).enable();
    TEST_ASSERT_EQUAL_HEX8(0x00, sim_adc_applied_calibration());

    on.measure(store);
    TEST_ASSERT_EQUAL_HEX8(0x77, sim_adc_applied_calibration());
}

/* Every edge of the state graph, several times round */
void test_state_graph_traversal(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    AdcOff adc = AdcOff::configure(consume(g_p.adc));

    for (int i = 0; i < 3; i++) {
        adc.calibrate(store);
        AdcOn on = consume(adc).enable();
        TEST_ASSERT_TRUE(sim_adc_powered());
        on.measure(store);
        on.measure(store);
        adc = consume(on).disable();
        TEST_ASSERT_FALSE(sim_adc_powered());
        TEST_ASSERT_FALSE(on.live());
        TEST_ASSERT_TRUE(adc.live());
    }

    TEST_ASSERT_EQUAL_UINT16(3, sim_adc_calibrations());
    TEST_ASSERT_EQUAL_UINT16(6, sim_adc_sequences());
    TEST_ASSERT_EQUAL_UINT16(0, sim_adc_misuse());
}

int main(int, char **)
{
    UNITY_BEGIN();
    RUN_TEST(test_enable_spins_until_ready);
    RUN_TEST(test_configure_consumes_raw_token);
    RUN_TEST(test_calibrate_persists_factor);
    RUN_TEST(test_calibrate_is_idempotent);
    RUN_TEST(test_measure_applies_stored_factor_and_reads_reference_first);
    RUN_TEST(test_measure_reads_pair_with_interrupts_masked);
    RUN_TEST(test_disable_loses_register_but_not_backup);
    RUN_TEST(test_factor_survives_power_loss_and_is_reapplied);
    RUN_TEST(test_state_graph_traversal);
    return UNITY_END();
}
