/*
 * uart.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Source file
 *
 * Notes:
 *  - Transmit only
 *
 * Updated: 2026-10-16
 */

#pragma once
void uart_init(void);
void uart_putc(char c);
