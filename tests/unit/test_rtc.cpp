#include <stddef.h>
#include <stdint.h>
#include <type_traits>
#include <utility>
#include <unity.h>

#include "irq_hw.h"
#include "peripherals.h"
#include "rtc.h"
#include "sim.h"

using namespace watch;

typedef Rtc<rtc_state::Run>  RtcRun;
typedef Rtc<rtc_state::Init> RtcInit;

namespace {

template <typename T, typename = void>
struct can_init : std::false_type {};
template <typename T>
struct can_init<T, decltype((void)std::declval<T>().init())> : std::true_type {};

template <typename T, typename = void>
struct can_run : std::false_type {};
template <typename T>
struct can_run<T, decltype((void)std::declval<T>().run())> : std::true_type {};

template <typename T, typename = void>
struct can_set_time : std::false_type {};
template <typename T>
struct can_set_time<T, decltype((void)std::declval<T &>().set_time(
                           std::declval<const Time &>()))> : std::true_type {};

static_assert(can_init<RtcRun>::value, "Run -> Init");
static_assert(!can_init<RtcRun &>::value, "init needs consume()");
static_assert(!can_init<RtcInit>::value, "already in init");
static_assert(can_run<RtcInit>::value, "Init -> Run");
static_assert(!can_run<RtcInit &>::value, "run needs consume()");
static_assert(!can_run<RtcRun>::value, "already running");
static_assert(can_set_time<RtcInit>::value, "time is written in init mode");
static_assert(!can_set_time<RtcRun>::value, "running clock is read-only");
static_assert(!std::is_copy_constructible<RtcRun>::value, "handles are unique");
static_assert(!std::is_constructible<RtcInit, bool>::value, "no forged handles");

Peripherals g_p;

Time make_time(uint8_t h, uint8_t m, uint8_t s)
{
    Time t;
    t.hour_tens    = (uint8_t)(h / 10);
    t.hour_units   = (uint8_t)(h % 10);
    t.minute_tens  = (uint8_t)(m / 10);
    t.minute_units = (uint8_t)(m % 10);
    t.second_tens  = (uint8_t)(s / 10);
    t.second_units = (uint8_t)(s % 10);
    return t;
}

void assert_time(uint8_t h, uint8_t m, uint8_t s, const Time &t)
{
    Time want = make_time(h, m, s);
    TEST_ASSERT_EQUAL_UINT8(want.hour_tens, t.hour_tens);
    TEST_ASSERT_EQUAL_UINT8(want.hour_units, t.hour_units);
    TEST_ASSERT_EQUAL_UINT8(want.minute_tens, t.minute_tens);
    TEST_ASSERT_EQUAL_UINT8(want.minute_units, t.minute_units);
    TEST_ASSERT_EQUAL_UINT8(want.second_tens, t.second_tens);
    TEST_ASSERT_EQUAL_UINT8(want.second_units, t.second_units);
}

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

void test_register_layout(void)
{
    TEST_ASSERT_EQUAL_HEX32(0x00235958ul, time_to_register(make_time(23, 59, 58)));
    assert_time(7, 5, 31, time_from_register(0x00070531ul));
}

void test_time_validity(void)
{
    TEST_ASSERT_TRUE(time_is_valid(make_time(0, 0, 0)));
    TEST_ASSERT_TRUE(time_is_valid(make_time(23, 59, 59)));
    TEST_ASSERT_FALSE(time_is_valid(make_time(24, 0, 0)));

    Time t = make_time(12, 0, 0);
    t.minute_tens = 6;
    TEST_ASSERT_FALSE(time_is_valid(t));

    t = make_time(12, 0, 0);
    t.second_units = 10;
    TEST_ASSERT_FALSE(time_is_valid(t));
}

void test_top_of_hour(void)
{
    TEST_ASSERT_TRUE(time_is_top_of_hour(make_time(0, 0, 0)));
    TEST_ASSERT_TRUE(time_is_top_of_hour(make_time(13, 0, 0)));
    TEST_ASSERT_FALSE(time_is_top_of_hour(make_time(13, 0, 1)));
    TEST_ASSERT_FALSE(time_is_top_of_hour(make_time(13, 10, 0)));
}

void test_parse(void)
{
    Time t = make_time(1, 1, 1);

    TEST_ASSERT_TRUE(time_parse("09:41:07", &t));
    assert_time(9, 41, 7, t);

    TEST_ASSERT_FALSE(time_parse("24:00:00", &t));
    TEST_ASSERT_FALSE(time_parse("9:41:07", &t));
    TEST_ASSERT_FALSE(time_parse("09-41-07", &t));
    TEST_ASSERT_FALSE(time_parse("09:41:07x", &t));
    TEST_ASSERT_FALSE(time_parse(NULL, &t));
    assert_time(9, 41, 7, t);
}

void test_read_running_clock(void)
{
    sim_rtc_set_register(0x00101530ul);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    assert_time(10, 15, 30, rtc.time());

    sim_advance_seconds(1);
    assert_time(10, 15, 31, rtc.time());
}

/* Tick between the first and second read: the third read wins */
void test_read_repeats_when_seconds_differ(void)
{
    sim_rtc_set_register(0x00005959ul);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    sim_rtc_reset_reads();
    sim_rtc_tick_after_read(1);

    assert_time(1, 0, 0, rtc.time());
    TEST_ASSERT_EQUAL_UINT16(3, sim_rtc_reads());
}

void test_read_two_matching_reads_suffice(void)
{
    sim_rtc_set_register(0x00005959ul);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    sim_rtc_reset_reads();
    sim_rtc_tick_after_read(2);

    assert_time(0, 59, 59, rtc.time());
    TEST_ASSERT_EQUAL_UINT16(2, sim_rtc_reads());
}

void test_set_time_through_init_mode(void)
{
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    RtcInit init = consume(rtc).init();
    TEST_ASSERT_FALSE(rtc.live());
    TEST_ASSERT_TRUE(init.live());

    TEST_ASSERT_TRUE(init.set_time(make_time(8, 30, 0)));

    /* held while in init mode */
    sim_advance_seconds(3);

    rtc = consume(init).run();
    TEST_ASSERT_FALSE(init.live());
    assert_time(8, 30, 0, rtc.time());

    sim_advance_seconds(1);
    assert_time(8, 30, 1, rtc.time());
}

void test_invalid_time_is_rejected(void)
{
    sim_rtc_set_register(0x00111111ul);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));
    RtcInit init = consume(rtc).init();

    TEST_ASSERT_FALSE(init.set_time(make_time(25, 0, 0)));

    rtc = consume(init).run();
    assert_time(11, 11, 11, rtc.time());
}

void test_init_waits_for_synchronisation(void)
{
    sim_rtc_set_sync_latency(6);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    RtcInit init = consume(rtc).init();
    TEST_ASSERT_TRUE(init.set_time(make_time(6, 0, 0)));
    rtc = consume(init).run();

    TEST_ASSERT_EQUAL_HEX32(0x00060000ul, sim_rtc_register());
}

void test_wakeup_flag(void)
{
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));

    sim_advance_seconds(1);
    rtc.start_wakeup();
    TEST_ASSERT_TRUE(sim_rtc_wakeup_enabled());
    TEST_ASSERT_FALSE(rtc.take_wakeup_flag());

    sim_advance_seconds(1);
    TEST_ASSERT_TRUE(rtc.take_wakeup_flag());
    TEST_ASSERT_FALSE(rtc.take_wakeup_flag());
}

void test_time_lost_cleared_by_set(void)
{
    sim_rtc_set_time_lost(true);
    RtcRun rtc = RtcRun::configure(consume(g_p.rtc));
    TEST_ASSERT_TRUE(rtc.time_lost());

    RtcInit init = consume(rtc).init();
    TEST_ASSERT_TRUE(init.set_time(make_time(0, 0, 0)));
    rtc = consume(init).run();

    TEST_ASSERT_FALSE(rtc.time_lost());
}

int main(int, char **)
{
    UNITY_BEGIN();
    RUN_TEST(test_register_layout);
    RUN_TEST(test_time_validity);
    RUN_TEST(test_top_of_hour);
    RUN_TEST(test_parse);
    RUN_TEST(test_read_running_clock);
    RUN_TEST(test_read_repeats_when_seconds_differ);
    RUN_TEST(test_read_two_matching_reads_suffice);
    RUN_TEST(test_set_time_through_init_mode);
    RUN_TEST(test_invalid_time_is_rejected);
    RUN_TEST(test_init_waits_for_synchronisation);
    RUN_TEST(test_wakeup_flag);
    RUN_TEST(test_time_lost_cleared_by_set);
    return UNITY_END();
}
