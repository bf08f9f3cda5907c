// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#ifndef CCSNIFF_LOG_H
#define CCSNIFF_LOG_H

/**
 * @file
 * @brief Runtime logging interface used across ccsniff components.
 *
 * Declares log severity levels, the core logging write routine, and convenience
 * macros. Messages are written to `stderr` when their level passes both the
 * compile-time gate and the runtime threshold.
 */

/**
 * @brief Log severity levels for runtime logging.
 */
typedef enum { LOG_LEVEL_ERROR = 0, LOG_LEVEL_WARN = 1, LOG_LEVEL_INFO = 2, LOG_LEVEL_DEBUG = 3 } ccs_log_level_t;

/* Compile-time log level control (default to DEBUG so the runtime threshold decides) */
#ifndef CCSNIFF_LOG_LEVEL
#define CCSNIFF_LOG_LEVEL LOG_LEVEL_DEBUG
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * Messages with a level above the runtime threshold are dropped.
 *
 * @param level  Log severity level.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void ccs_log_write(ccs_log_level_t level, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/**
 * @brief Set the runtime log threshold. Out-of-range values are clamped.
 */
void ccs_log_set_level(int level);

/**
 * @brief Current runtime log threshold (defaults to LOG_LEVEL_INFO).
 */
int ccs_log_get_level(void);

/**
 * @brief Parse a level name ("error", "warn", "info", "debug") or digit 0..3.
 * @return Level value, or -1 when the string is not recognized.
 */
int ccs_log_parse_level(const char* s);

#ifdef __cplusplus
}
#endif

/* Error messages - always shown */
#define LOG_ERROR(...)                                                                                                 \
    do {                                                                                                               \
        ccs_log_write(LOG_LEVEL_ERROR, __VA_ARGS__);                                                                   \
    } while (0)

#define LOG_WARN(...)                                                                                                  \
    do {                                                                                                               \
        ccs_log_write(LOG_LEVEL_WARN, __VA_ARGS__);                                                                    \
    } while (0)

#define LOG_INFO(...)                                                                                                  \
    do {                                                                                                               \
        ccs_log_write(LOG_LEVEL_INFO, __VA_ARGS__);                                                                    \
    } while (0)

/* Debug messages - compile-time gated */
#if CCSNIFF_LOG_LEVEL >= LOG_LEVEL_DEBUG
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        ccs_log_write(LOG_LEVEL_DEBUG, __VA_ARGS__);                                                                   \
    } while (0)
#else
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        /* Debug logging disabled */                                                                                   \
    } while (0)
#endif

/* For warnings with WARNING: prefix */
#define LOG_WARNING(...) LOG_WARN("WARNING: " __VA_ARGS__)

/* For notices with NOTICE: prefix */
#define LOG_NOTICE(...)  LOG_INFO("NOTICE: " __VA_ARGS__)

#endif /* CCSNIFF_LOG_H */
