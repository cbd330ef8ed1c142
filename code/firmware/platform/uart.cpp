/*
 * uart.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: UART driver (USART0)
 *
 * Configuration:
 *   F_CPU = 1 MHz (8 MHz RC / 8)
 *   Baud  = 9600
 *   Mode  = Double speed (8x), 9615 baud actual
 *   Frame = 8N1, transmit only
 */

#include "uart.h"
#include <avr/io.h>

#define BAUD_RATE 9600UL
#define UBRR_VALUE ((F_CPU / (8UL * BAUD_RATE)) - 1)

void uart_init(void)
{
    /* Double speed (U2X0 = 1) */
    UCSR0A = (1 << U2X0);

    /* Set baud rate */
    UBRR0H = (uint8_t)(UBRR_VALUE >> 8);
    UBRR0L = (uint8_t)(UBRR_VALUE & 0xFF);

    /* Transmitter only */
    UCSR0B = (1 << TXEN0);

    /* 8 data bits, no parity, 1 stop bit */
    UCSR0C = (1 << UCSZ01) | (1 << UCSZ00);
}

void uart_putc(char c)
{
    if (c == '\n') {
        while (!(UCSR0A & (1 << UDRE0)))
            ;
        UDR0 = '\r';
    }

    while (!(UCSR0A & (1 << UDRE0)))
        ;

    UDR0 = c;
}
