/*
 * adc_hw.h
 *
 * Project: Wristwatch Firmware
 * Purpose: ADC hardware interface
 *
 * Notes:
 *  - Register-level operations only; sequencing belongs to the driver
 *  - Every status query is a single read, no waiting here
 *  - The calibration register does not survive adc_hw_power_down()
 *  - A sequence converts the reference-voltage channel, then the
 *    temperature channel
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

struct adc_factory_cal {
    uint16_t vrefint_cal;   /* reference channel reading at VREFINT_CAL_VREF_MV */
    uint16_t ts_cal1;       /* temperature reading at TS_CAL1_TEMP_C */
    uint16_t ts_cal2;       /* temperature reading at TS_CAL2_TEMP_C */
};

/* One-shot clock and channel setup; block stays powered down */
void adc_hw_init(void);

/* Power */
void adc_hw_power_up(void);
bool adc_hw_ready(void);
void adc_hw_clear_ready(void);
void adc_hw_power_down(void);

/* Self-calibration (block powered down) */
void    adc_hw_start_calibration(void);
bool    adc_hw_calibration_complete(void);
void    adc_hw_clear_calibration_complete(void);
bool    adc_hw_calibrating(void);
uint8_t adc_hw_read_calibration(void);
void    adc_hw_write_calibration(uint8_t factor);

/* Conversion sequence */
void     adc_hw_start_sequence(void);
bool     adc_hw_conversion_complete(void);
uint16_t adc_hw_read_data(void);        /* clears end-of-conversion */
bool     adc_hw_sequence_active(void);

void adc_hw_factory_cal(struct adc_factory_cal *out);
