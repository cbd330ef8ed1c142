/*
 * log.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Diagnostic log stream
 *
 * Updated: 2026-10-11
 */

#include "log.h"

#include <stdarg.h>
#include <stdint.h>

#include "console/console_io.h"
#include "console/mini_printf.h"
#include "uptime.h"

static void log_line(char level, const char *tag, const char *fmt, va_list ap)
{
    mini_printf("%lu %c [%s] ", (uint32_t)uptime_millis(), level, tag);
    mini_vprintf(fmt, ap);
    console_putc('\n');
}

void log_info(const char *tag, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    log_line('I', tag, fmt, ap);
    va_end(ap);
}

void log_error(const char *tag, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    log_line('E', tag, fmt, ap);
    va_end(ap);
}
