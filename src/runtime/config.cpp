// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Runtime configuration parser for environment-derived settings.
 *
 * Parses environment variables into a typed `ccsRuntimeConfig` and exposes
 * an immutable accessor. Intended to be called early during application init.
 */

#include <ccsniff/runtime/config.h>
#include <ccsniff/runtime/log.h>
#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

static ccsRuntimeConfig g_config;
static int g_config_inited = 0;

/**
 * @brief Check whether an environment string is set and non-empty.
 *
 * @param v Environment value string pointer (may be NULL).
 * @return 1 if set and non-empty; otherwise 0.
 */
static int
env_is_set(const char* v) {
    return v && v[0] != '\0';
}

/**
 * @brief Strictly parse a decimal integer; trailing garbage is rejected.
 *
 * @param v Environment value string.
 * @param out [out] Parsed value.
 * @return 1 on success, 0 when `v` is not a complete integer in int range.
 */
static int
env_parse_int(const char* v, int* out) {
    if (!env_is_set(v)) {
        return 0;
    }
    char* end = NULL;
    errno = 0;
    long n = strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n < INT_MIN || n > INT_MAX) {
        return 0;
    }
    *out = (int)n;
    return 1;
}

/**
 * @brief Parse a positive millisecond value, warning on rejection.
 */
static void
env_positive_ms(const char* name, int* is_set, int* value) {
    const char* v = getenv(name);
    if (!env_is_set(v)) {
        return;
    }
    int n = 0;
    if (env_parse_int(v, &n) && n > 0) {
        *is_set = 1;
        *value = n;
    } else {
        LOG_WARNING("%s='%s' is not a positive integer; using default.\n", name, v);
    }
}

void
ccs_config_init(void) {
    ccsRuntimeConfig c;
    memset(&c, 0, sizeof(c));

    c.channel = CCS_CONFIG_DEFAULT_CHANNEL;
    c.power_timeout_ms = CCS_CONFIG_DEFAULT_POWER_TIMEOUT_MS;
    c.power_poll_ms = CCS_CONFIG_DEFAULT_POWER_POLL_MS;
    c.ctrl_timeout_ms = CCS_CONFIG_DEFAULT_CTRL_TIMEOUT_MS;
    c.log_level = LOG_LEVEL_INFO;

    /* CHANNEL */
    const char* ch = getenv("CCSNIFF_CHANNEL");
    if (env_is_set(ch)) {
        int n = 0;
        if (env_parse_int(ch, &n) && n >= 11 && n <= 26) {
            c.channel_is_set = 1;
            c.channel = n;
        } else {
            LOG_WARNING("CCSNIFF_CHANNEL='%s' is outside 11..26; using default.\n", ch);
        }
    }

    env_positive_ms("CCSNIFF_POWER_TIMEOUT_MS", &c.power_timeout_ms_is_set, &c.power_timeout_ms);
    env_positive_ms("CCSNIFF_POWER_POLL_MS", &c.power_poll_ms_is_set, &c.power_poll_ms);
    env_positive_ms("CCSNIFF_CTRL_TIMEOUT_MS", &c.ctrl_timeout_ms_is_set, &c.ctrl_timeout_ms);

    /* LOG_LEVEL */
    const char* ll = getenv("CCSNIFF_LOG_LEVEL");
    if (env_is_set(ll)) {
        int lvl = ccs_log_parse_level(ll);
        if (lvl >= 0) {
            c.log_level_is_set = 1;
            c.log_level = lvl;
        } else {
            LOG_WARNING("CCSNIFF_LOG_LEVEL='%s' not recognized; using info.\n", ll);
        }
    }

    /* RT_SCHED */
    const char* rt = getenv("CCSNIFF_RT_SCHED");
    c.rt_sched_enabled = (rt && rt[0] == '1') ? 1 : 0;

    const char* prio = getenv("CCSNIFF_RT_PRIO_RX");
    if (env_is_set(prio)) {
        int n = 0;
        if (env_parse_int(prio, &n) && n >= 1 && n <= 99) {
            c.rt_prio_rx_is_set = 1;
            c.rt_prio_rx = n;
        } else {
            LOG_WARNING("CCSNIFF_RT_PRIO_RX='%s' is outside 1..99; using the system minimum.\n", prio);
        }
    }

    const char* cpu = getenv("CCSNIFF_CPU_RX");
    if (env_is_set(cpu)) {
        int n = 0;
        if (env_parse_int(cpu, &n) && n >= 0) {
            c.cpu_rx_is_set = 1;
            c.cpu_rx = n;
        } else {
            LOG_WARNING("CCSNIFF_CPU_RX='%s' is not a CPU index; not pinning.\n", cpu);
        }
    }

    g_config = c;
    g_config_inited = 1;
}

/**
 * @brief Get immutable pointer to the current runtime configuration, or NULL if
 * initialization has not been performed.
 *
 * @return Pointer to config or NULL.
 */
const ccsRuntimeConfig*
ccs_get_config(void) {
    return g_config_inited ? &g_config : NULL;
}

int
ccs_config_channel(void) {
    const ccsRuntimeConfig* c = ccs_get_config();
    return (c && c->channel_is_set) ? c->channel : CCS_CONFIG_DEFAULT_CHANNEL;
}

int
ccs_config_power_timeout_ms(void) {
    const ccsRuntimeConfig* c = ccs_get_config();
    return (c && c->power_timeout_ms_is_set) ? c->power_timeout_ms : CCS_CONFIG_DEFAULT_POWER_TIMEOUT_MS;
}

int
ccs_config_power_poll_ms(void) {
    const ccsRuntimeConfig* c = ccs_get_config();
    return (c && c->power_poll_ms_is_set) ? c->power_poll_ms : CCS_CONFIG_DEFAULT_POWER_POLL_MS;
}

int
ccs_config_ctrl_timeout_ms(void) {
    const ccsRuntimeConfig* c = ccs_get_config();
    return (c && c->ctrl_timeout_ms_is_set) ? c->ctrl_timeout_ms : CCS_CONFIG_DEFAULT_CTRL_TIMEOUT_MS;
}
