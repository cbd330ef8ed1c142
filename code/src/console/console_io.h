/*
 * console_io.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Diagnostic console byte sink
 *
 * Notes:
 *  - Output only; the watch has no command console
 *  - AVR: USART0, host: stdout
 *
 * Updated: 2026-10-11
 */

#pragma once

void console_io_init(void);
void console_putc(char c);
void console_puts(const char *s);
