// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#pragma once

/**
 * @file
 * @brief Monotonic and wall-clock timing helpers for ccsniff.
 */

#include <ccsniff/platform/platform.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Not affected by system time changes. Suitable for measuring elapsed time.
 *
 * @return Nanoseconds since an arbitrary epoch.
 */
uint64_t ccs_time_monotonic_ns(void);

/**
 * @brief Get monotonic timestamp in milliseconds.
 *
 * @return Milliseconds since an arbitrary epoch.
 */
uint64_t ccs_time_monotonic_ms(void);

/**
 * @brief Get realtime (wall clock) timestamp in nanoseconds.
 *
 * @return Nanoseconds since Unix epoch (1970-01-01 00:00:00 UTC).
 */
uint64_t ccs_time_realtime_ns(void);

/**
 * @brief Sleep for specified number of milliseconds.
 *
 * @param ms    Milliseconds to sleep.
 */
void ccs_sleep_ms(unsigned int ms);

#ifdef __cplusplus
}
#endif
