// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Realtime scheduling and CPU affinity for worker threads.
 *
 * Settings come from the runtime config (`CCSNIFF_RT_SCHED`,
 * `CCSNIFF_RT_PRIO_RX`, `CCSNIFF_CPU_RX`); the device captures them when it is
 * created and its receiver thread applies them on entry.
 */

#include <ccsniff/platform/threading.h>
#include <ccsniff/runtime/config.h>
#include <ccsniff/runtime/log.h>
#include <ccsniff/runtime/rt_sched.h>

#include <errno.h>
#include <string.h>

void
ccs_rt_sched_params_rx(ccs_rt_sched_params* out) {
    if (!out) {
        return;
    }
    out->enabled = 0;
    out->priority = 0;
    out->cpu = -1;

    const ccsRuntimeConfig* c = ccs_get_config();
    if (!c) {
        return;
    }
    out->enabled = c->rt_sched_enabled;
    if (c->rt_prio_rx_is_set) {
        out->priority = c->rt_prio_rx;
    }
    if (c->cpu_rx_is_set) {
        out->cpu = c->cpu_rx;
    }
}

int
ccs_rt_sched_apply(const char* role, const ccs_rt_sched_params* params) {
    if (!params || !params->enabled) {
        return 0;
    }
    const char* label = role ? role : "worker";
    int rc = 0;

    if (ccs_thread_set_realtime_priority(params->priority) != 0) {
        int err = errno;
        LOG_WARNING("%s thread: SCHED_FIFO priority %d refused (needs CAP_SYS_NICE): %s\n", label,
                    params->priority, strerror(err));
        rc = -1;
    } else {
        LOG_INFO("%s thread: SCHED_FIFO priority %d.\n", label, params->priority);
    }

    if (params->cpu >= 0) {
        if (ccs_thread_set_affinity(params->cpu) != 0) {
            int err = errno;
            LOG_WARNING("%s thread: pinning to CPU %d failed: %s\n", label, params->cpu, strerror(err));
            rc = -1;
        } else {
            LOG_INFO("%s thread: pinned to CPU %d.\n", label, params->cpu);
        }
    }
    return rc;
}
