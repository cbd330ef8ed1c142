#include <stdint.h>
#include <unity.h>

#include "calibration_store.h"
#include "irq_hw.h"
#include "peripherals.h"
#include "sim.h"

using namespace watch;

static Peripherals g_p;

void setUp(void)
{
    sim_reset();
    irq_hw_enable();
    g_p = Peripherals::take();
}

void tearDown(void)
{
}

void test_configure_consumes_backup_token(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));

    TEST_ASSERT_TRUE(store.live());
    TEST_ASSERT_FALSE(g_p.backup.live());
}

void test_every_factor_reads_back(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));

    for (unsigned v = 0; v <= 0xFF; v++) {
        store.store((uint8_t)v);
        TEST_ASSERT_EQUAL_HEX8(v, store.load());
    }
}

void test_last_write_wins(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));

    store.store(0x11);
    store.store(0x6E);
    TEST_ASSERT_EQUAL_HEX8(0x6E, store.load());
}

void test_survives_power_cycle(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));

    store.store(0x4B);
    sim_power_cycle_except_backup();
    TEST_ASSERT_EQUAL_HEX8(0x4B, store.load());
}

void test_moved_store_keeps_the_slot(void)
{
    CalibrationStore store = CalibrationStore::configure(consume(g_p.backup));
    store.store(0x2C);

    CalibrationStore other = consume(store);
    TEST_ASSERT_FALSE(store.live());
    TEST_ASSERT_EQUAL_HEX8(0x2C, other.load());
}

int main(int, char **)
{
    UNITY_BEGIN();
    RUN_TEST(test_configure_consumes_backup_token);
    RUN_TEST(test_every_factor_reads_back);
    RUN_TEST(test_last_write_wins);
    RUN_TEST(test_survives_power_cycle);
    RUN_TEST(test_moved_store_keeps_the_slot);
    return UNITY_END();
}
