// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Global shutdown signaling flag for ccsniff tools.
 *
 * Set by the CLI's signal handler (Ctrl+C) and polled by its capture loop.
 */

#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

extern volatile uint8_t exitflag;

#ifdef __cplusplus
}
#endif
