/*
 * lcd_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: HT1621-compatible segment controller (AVR, bit-banged)
 *
 * Protocol:
 *   command  100 C8..C0                 (MSB first)
 *   write    101 A5..A0 D0 D1 D2 D3 ... (successive addresses)
 *
 * Notes:
 *  - Address n is MCU segment line n, data bit c is COM c
 *  - WR strobes data on the rising edge; no read-back
 *
 * Updated: 2026-10-16
 */

#include "lcd_hw.h"
#include "gpio_avr.h"

#include <avr/io.h>
#include <util/delay.h>

#define CMD_SYS_EN      0x01u
#define CMD_LCD_ON      0x03u
#define CMD_RC_256K     0x18u
#define CMD_BIAS_3COM   0x24u   /* 1/2 bias, 3 commons */

static void wr_bit(uint8_t bit)
{
    PORTC &= (uint8_t)~(1u << LCD_WR_BIT);

    if (bit)
        PORTC |= (uint8_t)(1u << LCD_DATA_BIT);
    else
        PORTC &= (uint8_t)~(1u << LCD_DATA_BIT);

    _delay_us(4);
    PORTC |= (uint8_t)(1u << LCD_WR_BIT);
    _delay_us(4);
}

static void wr_bits_msb(uint16_t value, uint8_t count)
{
    while (count--)
        wr_bit((uint8_t)((value >> count) & 1u));
}

static void lcd_select(void)
{
    PORTC &= (uint8_t)~(1u << LCD_CS_BIT);
}

static void lcd_deselect(void)
{
    PORTC |= (uint8_t)(1u << LCD_CS_BIT);
}

static void command(uint8_t cmd)
{
    lcd_select();
    wr_bits_msb(0x4u, 3);
    wr_bits_msb((uint16_t)cmd << 1, 9);
    lcd_deselect();
}

void lcd_hw_init(void)
{
    gpio_lcd_output_init();

    command(CMD_SYS_EN);
    command(CMD_RC_256K);
    command(CMD_BIAS_3COM);
    command(CMD_LCD_ON);
}

void lcd_hw_write(const uint32_t com[LCD_COM_COUNT])
{
    lcd_select();
    wr_bits_msb(0x5u, 3);
    wr_bits_msb(0, 6);

    for (uint8_t line = 0; line < 32; line++) {
        for (uint8_t c = 0; c < 4; c++) {
            uint8_t on = (c < LCD_COM_COUNT) ? (uint8_t)((com[c] >> line) & 1u) : 0;
            wr_bit(on);
        }
    }

    lcd_deselect();
}
