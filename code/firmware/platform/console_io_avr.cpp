/*
 * console_io_avr.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Console output backend (AVR UART)
 *
 * Notes:
 *  - Blocking transmit; log lines are short
 *
 * Updated: 2026-10-16
 */

#include "console/console_io.h"
#include "uart.h"

void console_putc(char c)
{
    uart_putc(c);
}

void console_puts(const char *s)
{
    while (*s)
        uart_putc(*s++);
}

void console_io_init(void)
{
    uart_init();
}
