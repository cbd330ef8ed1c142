/*
 * buzzer.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: State-tagged piezo buzzer driver
 *
 * Updated: 2026-10-13
 */

#include "buzzer.h"

#include "buzzer_hw.h"
#include "system_hw.h"

namespace watch {

typedef Buzzer<buzzer_state::Stopped> BuzzerStopped;
typedef Buzzer<buzzer_state::Running> BuzzerRunning;

void BuzzerBase::set_auto_reload(uint16_t value)
{
    require_live("buzzer");
    buzzer_hw_set_auto_reload(value);
}

void BuzzerBase::set_compare(uint16_t value)
{
    require_live("buzzer");
    buzzer_hw_set_compare(value);
}

BuzzerStopped BuzzerStopped::configure(Raw<BuzzerTag> raw)
{
    raw.surrender("buzzer");

    system_hw_clock_enable(PCLK_BUZZER_TIMER);
    buzzer_hw_init();

    return BuzzerStopped(true);
}

BuzzerRunning BuzzerStopped::start() &&
{
    require_live("buzzer");

    buzzer_hw_counter_enable(true);

    hollow();
    return BuzzerRunning(true);
}

BuzzerStopped BuzzerRunning::stop() &&
{
    require_live("buzzer");

    buzzer_hw_counter_enable(false);

    hollow();
    return BuzzerStopped(true);
}

} // namespace watch
