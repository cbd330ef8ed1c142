/*
 * mini_printf.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Minimal formatted output
 *
 * Notes:
 *  - Output goes to the console byte sink
 *  - Deterministic behavior
 *
 * Updated: 2026-10-11
 */


 /*
  * mini_printf()
  *
  * Lightweight, deterministic printf replacement for AVR targets.
  *
  * Design goals:
  *  - Small code size
  *  - No heap use
  *  - No floating point
  *  - No 64-bit formatting
  *  - No locale
  *
  * Supported format specifiers:
  *
  *   %s      const char *
  *   %c      char
  *   %u      unsigned int (16-bit on AVR)
  *   %d      int (16-bit on AVR)
  *   %lu     uint32_t
  *   %ld     int32_t
  *   %x      low byte as two hex digits
  *   %%      literal %
  *
  * Optional features:
  *
  *   Width:  %5u   %02d
  *           - Numeric width supported
  *           - Zero padding supported with leading '0'
  *
  * NOT supported:
  *
  *   - %f or any floating point
  *   - precision (.2)
  *   - left alignment (-)
  *
  * Behavior notes:
  *
  *   - %lu / %ld consume uint32_t / int32_t exactly; pass fixed-width
  *     values, not unsigned long, so host and AVR agree
  *
  *   - If an unsupported specifier is encountered,
  *     a '?' character is printed.
  */

#pragma once

#include <stdarg.h>

void mini_printf(const char *fmt, ...);
void mini_vprintf(const char *fmt, va_list ap);
