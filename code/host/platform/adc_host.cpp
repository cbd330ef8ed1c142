/*
 * adc_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host ADC model
 *
 * Notes:
 *  - Status flags report completion after a configurable number of polls
 *  - The calibration register is lost on power-down, like the real part
 *  - Sequencing mistakes are counted, not fatal, so tests can see them
 *
 * Updated: 2026-10-15
 */

#include "adc_hw.h"
#include "irq_hw.h"
#include "sim.h"
#include "host_platform.h"

static bool     g_configured;
static bool     g_powered;
static uint8_t  g_applied;
static uint8_t  g_cal_result;
static bool     g_calibrating;
static bool     g_cal_complete;
static uint8_t  g_seq_index;        /* channels read in the current sequence */
static bool     g_seq_running;
static bool     g_seq_masked;
static uint16_t g_samples[2];
static struct adc_factory_cal g_factory;

static uint8_t  g_latency;
static uint8_t  g_countdown;
static uint32_t g_polls;

static uint16_t g_calibrations;
static uint16_t g_sequences;
static uint16_t g_misuse;

/* One status poll; true once the countdown has run out */
static bool poll_done(void)
{
    g_polls++;
    if (g_countdown > 0) {
        g_countdown--;
        return false;
    }
    return true;
}

void adc_host_reset(void)
{
    g_configured   = false;
    g_powered      = false;
    g_applied      = 0;
    g_cal_result   = 0x40;
    g_calibrating  = false;
    g_cal_complete = false;
    g_seq_index    = 0;
    g_seq_running  = false;
    g_seq_masked   = false;
    g_samples[0]   = 375;
    g_samples[1]   = 339;
    g_factory.vrefint_cal = 375;
    g_factory.ts_cal1     = 319;
    g_factory.ts_cal2     = 419;
    g_latency      = 2;
    g_countdown    = 0;
    g_polls        = 0;
    g_calibrations = 0;
    g_sequences    = 0;
    g_misuse       = 0;
}

void adc_host_power_loss(void)
{
    g_powered     = false;
    g_applied     = 0;
    g_seq_running = false;
}

void adc_hw_init(void)
{
    g_configured = true;
}

void adc_hw_power_up(void)
{
    if (!g_configured || g_calibrating)
        g_misuse++;

    g_powered   = true;
    g_countdown = g_latency;
}

bool adc_hw_ready(void)
{
    return g_powered && poll_done();
}

void adc_hw_clear_ready(void)
{
}

void adc_hw_power_down(void)
{
    g_powered     = false;
    g_applied     = 0;
    g_seq_running = false;
}

void adc_hw_start_calibration(void)
{
    if (g_powered)
        g_misuse++;

    g_calibrating  = true;
    g_cal_complete = false;
    g_countdown    = g_latency;
    g_calibrations++;
}

bool adc_hw_calibration_complete(void)
{
    if (!g_calibrating)
        return g_cal_complete;

    if (!poll_done())
        return false;

    g_calibrating  = false;
    g_cal_complete = true;
    return true;
}

void adc_hw_clear_calibration_complete(void)
{
    g_cal_complete = false;
}

bool adc_hw_calibrating(void)
{
    return g_calibrating;
}

uint8_t adc_hw_read_calibration(void)
{
    return g_cal_result;
}

void adc_hw_write_calibration(uint8_t factor)
{
    if (!g_powered)
        g_misuse++;
    g_applied = factor;
}

void adc_hw_start_sequence(void)
{
    if (!g_powered)
        g_misuse++;

    g_seq_index   = 0;
    g_seq_running = true;
    g_seq_masked  = !irq_hw_enabled();
    g_countdown   = g_latency;
    g_sequences++;
}

bool adc_hw_conversion_complete(void)
{
    return g_seq_running && g_seq_index < 2 && poll_done();
}

uint16_t adc_hw_read_data(void)
{
    if (g_seq_index >= 2) {
        g_misuse++;
        return 0;
    }

    uint16_t v = g_samples[g_seq_index++];

    /* next channel, or the end-of-sequence flag */
    g_countdown = g_latency;
    return v;
}

bool adc_hw_sequence_active(void)
{
    if (!g_seq_running)
        return false;
    if (g_seq_index < 2 || !poll_done())
        return true;

    g_seq_running = false;
    return false;
}

void adc_hw_factory_cal(struct adc_factory_cal *out)
{
    *out = g_factory;
}

/* ---------------- knobs ---------------- */

void sim_adc_set_samples(uint16_t vrefint, uint16_t tsense)
{
    g_samples[0] = vrefint;
    g_samples[1] = tsense;
}

void sim_adc_set_calibration_result(uint8_t factor)
{
    g_cal_result = factor;
}

void sim_adc_set_factory_cal(uint16_t vrefint_cal, uint16_t ts_cal1, uint16_t ts_cal2)
{
    g_factory.vrefint_cal = vrefint_cal;
    g_factory.ts_cal1     = ts_cal1;
    g_factory.ts_cal2     = ts_cal2;
}

void sim_adc_set_latency(uint8_t polls)
{
    g_latency = polls;
}

uint32_t sim_adc_status_polls(void)
{
    return g_polls;
}

bool sim_adc_powered(void)
{
    return g_powered;
}

uint8_t sim_adc_applied_calibration(void)
{
    return g_applied;
}

uint16_t sim_adc_calibrations(void)
{
    return g_calibrations;
}

uint16_t sim_adc_sequences(void)
{
    return g_sequences;
}

bool sim_adc_last_sequence_masked(void)
{
    return g_seq_masked;
}

uint16_t sim_adc_misuse(void)
{
    return g_misuse;
}
