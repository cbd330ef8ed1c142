/*
 * mini_printf.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Source file
 *
 * Notes:
 *  - Formatting only; bytes go to console_putc()
 *  - No heap, no floating point
 *
 * Updated: 2026-10-11
 */

#include <stdarg.h>
#include <stdbool.h>
#include <stdint.h>

#include "console_io.h"
#include "mini_printf.h"

/* print unsigned 32-bit with optional zero padding */
static void put_ulong_pad(uint32_t v, unsigned int width, char pad)
{
    char buf[10];
    unsigned int i = 0;

    if (v == 0) {
        buf[i++] = '0';
    } else {
        while (v > 0) {
            buf[i++] = (char)('0' + (v % 10));
            v /= 10;
        }
    }

    while (i < width && i < sizeof(buf))
        buf[i++] = pad;

    while (i--)
        console_putc(buf[i]);
}

static void put_long_pad(int32_t v, unsigned int width, char pad)
{
    if (v < 0) {
        console_putc('-');
        put_ulong_pad((uint32_t)(-(v + 1)) + 1u, width ? width - 1 : 0, pad);
    } else {
        put_ulong_pad((uint32_t)v, width, pad);
    }
}

static void put_hex8(uint8_t v)
{
    const char *hex = "0123456789ABCDEF";
    console_putc(hex[(v >> 4) & 0x0F]);
    console_putc(hex[v & 0x0F]);
}

void mini_vprintf(const char *fmt, va_list ap)
{
    while (*fmt) {

        if (*fmt != '%') {
            console_putc(*fmt++);
            continue;
        }

        fmt++; /* skip '%' */

        /* parse zero pad */
        char pad = ' ';
        if (*fmt == '0') {
            pad = '0';
            fmt++;
        }

        /* parse width */
        unsigned int width = 0;
        while (*fmt >= '0' && *fmt <= '9') {
            width = width * 10 + (unsigned int)(*fmt - '0');
            fmt++;
        }

        /* parse optional long modifier */
        bool long_flag = false;
        if (*fmt == 'l') {
            long_flag = true;
            fmt++;
        }

        switch (*fmt) {

        case 's': {
            const char *s = va_arg(ap, const char *);
            console_puts(s ? s : "(null)");
            break;
        }

        case 'c':
            console_putc((char)va_arg(ap, int));
            break;

        case 'u':
            if (long_flag)
                put_ulong_pad(va_arg(ap, uint32_t), width, pad);
            else
                put_ulong_pad(va_arg(ap, unsigned int), width, pad);
            break;

        case 'd':
            if (long_flag)
                put_long_pad(va_arg(ap, int32_t), width, pad);
            else
                put_long_pad(va_arg(ap, int), width, pad);
            break;

        case 'x':
        case 'X':
            put_hex8((uint8_t)va_arg(ap, unsigned int));
            break;

        case '%':
            console_putc('%');
            break;

        case '\0':
            return;

        default:
            console_putc('?');
            break;
        }

        fmt++;
    }
}

void mini_printf(const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    mini_vprintf(fmt, ap);
    va_end(ap);
}
