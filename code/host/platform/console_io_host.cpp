/*
 * console_io_host.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Host console output
 *
 * Responsibilities:
 *  - Write console output to stdout when echo is on
 *  - Keep the recent output in memory for assertions
 *
 * Notes:
 *  - Capture keeps the newest half when the buffer fills
 *
 * Updated: 2026-10-15
 */

#include "console/console_io.h"
#include "sim.h"
#include "host_platform.h"

#include <string.h>
#include <unistd.h>

#define CAPTURE_SIZE 8192u

static char     g_capture[CAPTURE_SIZE + 1];
static unsigned g_len;
static bool     g_echo;

void console_host_reset(void)
{
    g_len = 0;
    g_capture[0] = '\0';
}

void console_io_init(void)
{
}

void console_putc(char c)
{
    if (g_echo) {
        if (write(STDOUT_FILENO, &c, 1) != 1)
            g_echo = false;
    }

    if (g_len >= CAPTURE_SIZE) {
        unsigned keep = CAPTURE_SIZE / 2;
        memmove(g_capture, g_capture + (g_len - keep), keep);
        g_len = keep;
    }

    g_capture[g_len++] = c;
    g_capture[g_len] = '\0';
}

void console_puts(const char *s)
{
    while (*s)
        console_putc(*s++);
}

void sim_console_echo(bool on)
{
    g_echo = on;
}

void sim_console_clear(void)
{
    console_host_reset();
}

bool sim_console_contains(const char *needle)
{
    return strstr(g_capture, needle) != NULL;
}
