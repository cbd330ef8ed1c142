/*
 * adc_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: ADC hardware layer (ATmega328P)
 *
 * Mapping:
 *  - power up / down        ADEN, prescaler clk/8 (125 kHz at 1 MHz)
 *  - ready flag             ADEN read back; the part has no latched flag
 *  - self-calibration       offset conversion of the 0 V channel, run
 *                           with the converter powered only for the
 *                           duration of that conversion
 *  - calibration register   offset held here, subtracted from every
 *                           result, lost on power-down
 *  - sequence               bandgap against AVcc, then the temperature
 *                           sensor against the internal 1.1 V reference
 *
 * Notes:
 *  - The first conversion after a reference switch is less accurate;
 *    the calibration points were taken the same way
 *
 * Updated: 2026-10-16
 */

#include "adc_hw.h"

#include <avr/io.h>

/* Board calibration, measured at production test */
#define BOARD_VREFINT_CAL   375u    /* bandgap vs AVcc at 3.000 V */
#define BOARD_TS_CAL1       319u    /* sensor at 30 C */
#define BOARD_TS_CAL2       419u    /* sensor at 130 C */

#define ADC_PRESCALE        ((1u << ADPS1) | (1u << ADPS0))

#define MUX_BANDGAP         0x0Eu
#define MUX_GND             0x0Fu
#define MUX_TEMP            0x08u

#define REF_AVCC            (1u << REFS0)
#define REF_INTERNAL_1V1    ((1u << REFS1) | (1u << REFS0))

static uint8_t  g_offset;
static uint16_t g_cal_raw;
static bool     g_cal_complete;
static uint8_t  g_seq_index;

static bool conversion_running(void)
{
    return (ADCSRA & (1u << ADSC)) != 0;
}

void adc_hw_init(void)
{
    ADCSRA = 0;
    ADCSRB = 0;
    ADMUX  = REF_AVCC | MUX_BANDGAP;
    DIDR0  = 0x3F;
    g_offset       = 0;
    g_cal_complete = false;
    g_seq_index    = 2;
}

void adc_hw_power_up(void)
{
    ADCSRA = (uint8_t)((1u << ADEN) | ADC_PRESCALE);
}

bool adc_hw_ready(void)
{
    return (ADCSRA & (1u << ADEN)) != 0;
}

void adc_hw_clear_ready(void)
{
}

void adc_hw_power_down(void)
{
    ADCSRA = 0;
    g_offset    = 0;
    g_seq_index = 2;
}

void adc_hw_start_calibration(void)
{
    g_cal_complete = false;
    ADMUX  = REF_AVCC | MUX_GND;
    ADCSRA = (uint8_t)((1u << ADEN) | (1u << ADSC) | ADC_PRESCALE);
}

bool adc_hw_calibration_complete(void)
{
    if (g_cal_complete)
        return true;
    if (conversion_running())
        return false;

    g_cal_raw      = ADC;
    g_cal_complete = true;
    return true;
}

void adc_hw_clear_calibration_complete(void)
{
    g_cal_complete = false;
    ADCSRA = 0;
}

bool adc_hw_calibrating(void)
{
    return conversion_running();
}

uint8_t adc_hw_read_calibration(void)
{
    return (g_cal_raw > 0xFFu) ? 0xFFu : (uint8_t)g_cal_raw;
}

void adc_hw_write_calibration(uint8_t factor)
{
    g_offset = factor;
}

void adc_hw_start_sequence(void)
{
    g_seq_index = 0;
    ADMUX   = REF_AVCC | MUX_BANDGAP;
    ADCSRA |= (uint8_t)(1u << ADSC);
}

bool adc_hw_conversion_complete(void)
{
    return g_seq_index < 2 && !conversion_running();
}

uint16_t adc_hw_read_data(void)
{
    uint16_t raw = ADC;
    raw = (raw > g_offset) ? (uint16_t)(raw - g_offset) : 0;

    if (g_seq_index == 0) {
        ADMUX   = REF_INTERNAL_1V1 | MUX_TEMP;
        ADCSRA |= (uint8_t)(1u << ADSC);
    }
    g_seq_index++;

    return raw;
}

bool adc_hw_sequence_active(void)
{
    return g_seq_index < 2 || conversion_running();
}

void adc_hw_factory_cal(struct adc_factory_cal *out)
{
    out->vrefint_cal = BOARD_VREFINT_CAL;
    out->ts_cal1     = BOARD_TS_CAL1;
    out->ts_cal2     = BOARD_TS_CAL2;
}
