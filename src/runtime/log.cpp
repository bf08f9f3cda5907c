// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Runtime logging implementation.
 *
 * Implements the low-level write routine used by logging macros to emit
 * messages to `stderr`, filtered by a process-wide runtime threshold.
 */

#include <atomic>
#include <ccsniff/runtime/log.h>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <strings.h>

static std::atomic<int> g_log_level{LOG_LEVEL_INFO};

void
ccs_log_set_level(int level) {
    if (level < LOG_LEVEL_ERROR) {
        level = LOG_LEVEL_ERROR;
    }
    if (level > LOG_LEVEL_DEBUG) {
        level = LOG_LEVEL_DEBUG;
    }
    g_log_level.store(level, std::memory_order_relaxed);
}

int
ccs_log_get_level(void) {
    return g_log_level.load(std::memory_order_relaxed);
}

int
ccs_log_parse_level(const char* s) {
    if (s == nullptr || s[0] == '\0') {
        return -1;
    }
    if (s[1] == '\0' && s[0] >= '0' && s[0] <= '3') {
        return s[0] - '0';
    }
    if (strcasecmp(s, "error") == 0) {
        return LOG_LEVEL_ERROR;
    }
    if (strcasecmp(s, "warn") == 0 || strcasecmp(s, "warning") == 0) {
        return LOG_LEVEL_WARN;
    }
    if (strcasecmp(s, "info") == 0) {
        return LOG_LEVEL_INFO;
    }
    if (strcasecmp(s, "debug") == 0) {
        return LOG_LEVEL_DEBUG;
    }
    return -1;
}

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * Formats into a bounded buffer first so a single message is emitted with
 * one `fputs`, which keeps lines from the receiver thread and the caller's
 * thread from interleaving mid-line.
 *
 * @param level  Log severity level.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void
ccs_log_write(ccs_log_level_t level, const char* format, ...) {
    if (format == nullptr) {
        return;
    }
    if ((int)level > g_log_level.load(std::memory_order_relaxed)) {
        return;
    }

    va_list args;
    va_start(args, format);
    char buf[4096];
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

    fputs(buf, stderr);
}
