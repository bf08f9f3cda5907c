// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/*
 * Receiver thread scheduling settings: derived from the runtime config (not
 * re-read from the environment) and applied best-effort.
 */

#include <ccsniff/runtime/rt_sched.h>

#include <ccsniff/runtime/config.h>
#include <ccsniff/runtime/log.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "test_support.h"

static int
expect(int cond, int rc, const char* msg) {
    if (!cond) {
        fprintf(stderr, "FAIL(%d): %s\n", rc, msg);
        return rc;
    }
    return 0;
}

static void
unset_rt_env(void) {
    unsetenv("CCSNIFF_RT_SCHED");
    unsetenv("CCSNIFF_RT_PRIO_RX");
    unsetenv("CCSNIFF_CPU_RX");
}

static int
test_disabled_without_config(void) {
    unset_rt_env();
    setenv("CCSNIFF_RT_SCHED", "1", 1);
    ccs_rt_sched_params p;
    ccs_rt_sched_params_rx(&p);
    int rc = 0;
    rc |= expect(ccs_get_config() == NULL, 1, "config not yet initialized");
    rc |= expect(p.enabled == 0 && p.priority == 0 && p.cpu == -1, 2, "disabled before config init");
    unset_rt_env();
    return rc;
}

static int
test_params_follow_config(void) {
    unset_rt_env();
    setenv("CCSNIFF_RT_SCHED", "1", 1);
    setenv("CCSNIFF_RT_PRIO_RX", "7", 1);
    setenv("CCSNIFF_CPU_RX", "3", 1);
    ccs_config_init();
    unset_rt_env();

    ccs_rt_sched_params p;
    ccs_rt_sched_params_rx(&p);
    int rc = 0;
    rc |= expect(p.enabled == 1, 10, "enabled from config after env was cleared");
    rc |= expect(p.priority == 7, 11, "priority from config");
    rc |= expect(p.cpu == 3, 12, "cpu from config");

    /* Setting the environment after init has no effect until the next init */
    ccs_config_init();
    setenv("CCSNIFF_RT_SCHED", "1", 1);
    ccs_rt_sched_params_rx(&p);
    rc |= expect(p.enabled == 0 && p.priority == 0 && p.cpu == -1, 13, "disabled config ignores late env");
    unset_rt_env();
    return rc;
}

static int
test_apply_noop(void) {
    ccs_rt_sched_params off;
    off.enabled = 0;
    off.priority = 50;
    off.cpu = 0;

    ccs_test_capture_stderr cap;
    if (ccs_test_capture_stderr_begin(&cap, "ccsniff_rt_off") != 0) {
        fprintf(stderr, "FAIL(20): stderr capture unavailable\n");
        return 20;
    }
    int r1 = ccs_rt_sched_apply("RX", NULL);
    int r2 = ccs_rt_sched_apply("RX", &off);
    ccs_test_capture_stderr_end(&cap);

    int rc = 0;
    rc |= expect(r1 == 0 && r2 == 0, 21, "no-op apply succeeds");
    char text[512];
    if (ccs_test_read_file(cap.path, text, sizeof(text)) >= 0) {
        rc |= expect(text[0] == '\0', 22, "no-op apply logs nothing");
    }
    unlink(cap.path);
    return rc;
}

static int
test_apply_reports_outcome(void) {
    ccs_rt_sched_params on;
    on.enabled = 1;
    on.priority = 5;
    on.cpu = -1;

    ccs_log_set_level(LOG_LEVEL_INFO);
    ccs_test_capture_stderr cap;
    if (ccs_test_capture_stderr_begin(&cap, "ccsniff_rt_on") != 0) {
        fprintf(stderr, "FAIL(30): stderr capture unavailable\n");
        return 30;
    }
    int r = ccs_rt_sched_apply("RX", &on);
    ccs_test_capture_stderr_end(&cap);

    int rc = 0;
    char text[512];
    if (ccs_test_read_file(cap.path, text, sizeof(text)) < 0) {
        fprintf(stderr, "FAIL(31): could not read capture\n");
        rc = 31;
    } else if (r == 0) {
        /* Privileged run */
        rc |= expect(strstr(text, "RX thread: SCHED_FIFO priority 5.") != NULL, 32, "success logged");
    } else {
        rc |= expect(r == -1, 33, "failure code");
        rc |= expect(strstr(text, "WARNING: RX thread: SCHED_FIFO priority 5 refused") != NULL, 34,
                     "refusal logged");
    }
    unlink(cap.path);
    return rc;
}

int
main(void) {
    int rc = 0;
    rc |= test_disabled_without_config();
    rc |= test_params_follow_config();
    rc |= test_apply_noop();
    rc |= test_apply_reports_outcome();
    if (rc == 0) {
        fprintf(stderr, "runtime rt_sched tests: OK\n");
    }
    return rc;
}
