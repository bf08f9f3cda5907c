// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Runtime configuration API and environment documentation.
 *
 * Exposes typed configuration parsed from environment variables and accessors
 * to initialize and retrieve the immutable configuration.
 */

#ifndef CCSNIFF_RUNTIME_CONFIG_H
#define CCSNIFF_RUNTIME_CONFIG_H

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Runtime configuration (environment variables)
 *
 * Precedence: API/CLI arguments > environment > built-in defaults. This module
 * parses environment variables once (ccs_config_init) and exposes a typed config.
 *
 * Capture
 * - CCSNIFF_CHANNEL
 *     Default IEEE 802.15.4 channel used by the CLI when -c is not given.
 *     Values: 11..26. Out-of-range or non-numeric values are ignored. Default: 11.
 *
 * Device control
 * - CCSNIFF_POWER_TIMEOUT_MS
 *     Upper bound on the power-on status poll during open. Values: >0 ms. Default: 5000.
 * - CCSNIFF_POWER_POLL_MS
 *     Interval between power-status queries. Values: >0 ms. Default: 100.
 * - CCSNIFF_CTRL_TIMEOUT_MS
 *     Timeout applied to each control transfer. Values: >0 ms. Default: 1000.
 *
 * Logging
 * - CCSNIFF_LOG_LEVEL
 *     Runtime log threshold: "error", "warn", "info", "debug" or 0..3. Default: info.
 *
 * Realtime scheduling and CPU affinity (receiver thread)
 * - CCSNIFF_RT_SCHED
 *     Enable best-effort realtime scheduling (SCHED_FIFO). Requires CAP_SYS_NICE or root.
 *     Values: "1" to enable, unset/other to disable. Default: disabled.
 * - CCSNIFF_RT_PRIO_RX
 *     Optional receiver thread priority (1..99, clamped to system limits). Used only if RT_SCHED=1.
 * - CCSNIFF_CPU_RX
 *     Optional CPU core pinning for the receiver thread. Integer CPU id (>=0). Used only if RT_SCHED=1.
 */

#define CCS_CONFIG_DEFAULT_CHANNEL          11
#define CCS_CONFIG_DEFAULT_POWER_TIMEOUT_MS 5000
#define CCS_CONFIG_DEFAULT_POWER_POLL_MS    100
#define CCS_CONFIG_DEFAULT_CTRL_TIMEOUT_MS  1000

typedef struct ccsRuntimeConfig {
    int channel_is_set;
    int channel; /* 11..26 */

    int power_timeout_ms_is_set;
    int power_timeout_ms;

    int power_poll_ms_is_set;
    int power_poll_ms;

    int ctrl_timeout_ms_is_set;
    int ctrl_timeout_ms;

    int log_level_is_set;
    int log_level; /* ccs_log_level_t */

    int rt_sched_enabled;

    int rt_prio_rx_is_set;
    int rt_prio_rx; /* 1..99 */

    int cpu_rx_is_set;
    int cpu_rx; /* >= 0 */
} ccsRuntimeConfig;

/**
 * @brief Parse environment variables and initialize the runtime configuration.
 *
 * Values that fail validation are left unset (defaults apply) and reported
 * through LOG_WARNING.
 *
 * @note Safe to call multiple times; the most recent call wins.
 */
void ccs_config_init(void);

/**
 * @brief Get immutable pointer to the current runtime configuration.
 *
 * @return Pointer to config, or NULL if ccs_config_init() has not run.
 */
const ccsRuntimeConfig* ccs_get_config(void);

/*
 * Effective values: the configured value when set, else the built-in default.
 * Usable before ccs_config_init().
 */
int ccs_config_channel(void);
int ccs_config_power_timeout_ms(void);
int ccs_config_power_poll_ms(void);
int ccs_config_ctrl_timeout_ms(void);

#ifdef __cplusplus
}
#endif

#endif /* CCSNIFF_RUNTIME_CONFIG_H */
