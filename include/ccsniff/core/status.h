// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief Status codes returned by ccsniff operations.
 *
 * Every fallible call returns CCS_OK (0) or one of the negative codes below.
 */

#pragma once

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    CCS_OK = 0,
    CCS_ERR_DEVICE_NOT_FOUND = -1,  /* no matching USB device present */
    CCS_ERR_PERMISSION_DENIED = -2, /* OS refused access (udev rule) */
    CCS_ERR_POWER_ON_TIMEOUT = -3,  /* radio never reported powered */
    CCS_ERR_INVALID_CHANNEL = -4,   /* channel outside 11..26 */
    CCS_ERR_ALREADY_STREAMING = -5,
    CCS_ERR_NOT_STREAMING = -6,
    CCS_ERR_TIMEOUT = -7,           /* transfer timed out */
    CCS_ERR_NO_DEVICE = -8,         /* device disconnected */
    CCS_ERR_IO = -9,
    CCS_ERR_NOT_OPEN = -10,         /* handle already released */
    CCS_ERR_INVALID_ARG = -11,
    CCS_ERR_NO_MEMORY = -12,
    CCS_ERR_THREAD = -13,
} ccs_status;

/**
 * @brief Human-readable description of a status code.
 *
 * @param status Value returned by a ccsniff call.
 * @return Static string; never NULL.
 */
const char* ccs_status_str(int status);

#ifdef __cplusplus
}
#endif
