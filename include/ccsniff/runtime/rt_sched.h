// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Realtime scheduling and CPU affinity for worker threads.
 */

#ifndef CCSNIFF_RT_SCHED_H
#define CCSNIFF_RT_SCHED_H

#ifdef __cplusplus
extern "C" {
#endif

/* Scheduling request for one worker thread. */
typedef struct {
    int enabled;  /* 0 leaves the thread untouched */
    int priority; /* SCHED_FIFO priority; 0 selects the system minimum */
    int cpu;      /* CPU to pin to, -1 for no pinning */
} ccs_rt_sched_params;

/**
 * @brief Fill `out` with the receiver thread settings from the runtime config.
 *
 * Falls back to "disabled" when the config has not been initialized.
 */
void ccs_rt_sched_params_rx(ccs_rt_sched_params* out);

/**
 * @brief Apply `params` to the calling thread.
 *
 * Failures are logged and reported but leave the thread running at its
 * current policy.
 *
 * @param role Label used in log messages (e.g. "RX").
 * @param params Requested settings; NULL or disabled is a no-op.
 * @return 0 when every requested step succeeded (or nothing was requested), -1 otherwise.
 */
int ccs_rt_sched_apply(const char* role, const ccs_rt_sched_params* params);

#ifdef __cplusplus
}
#endif

#endif /* CCSNIFF_RT_SCHED_H */
