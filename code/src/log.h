/*
 * log.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Diagnostic log stream
 *
 * Line format:
 *   <uptime ms> I [tag] message
 *   <uptime ms> E [tag] message
 *
 * Notes:
 *  - Observability only, never a functional interface
 *  - Format specifiers are those of mini_printf()
 *  - Safe from task and interrupt context; lines from nested
 *    contexts may interleave
 *
 * Updated: 2026-10-11
 */

#pragma once

void log_info(const char *tag, const char *fmt, ...);
void log_error(const char *tag, const char *fmt, ...);
