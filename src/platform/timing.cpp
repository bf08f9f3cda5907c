// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief POSIX clock implementation of the ccsniff timing helpers.
 */

#include <ccsniff/platform/timing.h>

#include <errno.h>
#include <time.h>

uint64_t
ccs_time_monotonic_ns(void) {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000000000ULL + (uint64_t)ts.tv_nsec;
}

uint64_t
ccs_time_monotonic_ms(void) {
    return ccs_time_monotonic_ns() / 1000000ULL;
}

uint64_t
ccs_time_realtime_ns(void) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return (uint64_t)ts.tv_sec * 1000000000ULL + (uint64_t)ts.tv_nsec;
}

void
ccs_sleep_ms(unsigned int ms) {
    struct timespec req;
    req.tv_sec = ms / 1000U;
    req.tv_nsec = (long)(ms % 1000U) * 1000000L;
    /* Resume after signal interruption until the full interval elapsed */
    while (nanosleep(&req, &req) != 0 && errno == EINTR) {
    }
}
