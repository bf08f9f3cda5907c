// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#include <ccsniff/core/status.h>

const char*
ccs_status_str(int status) {
    switch (status) {
        case CCS_OK: return "success";
        case CCS_ERR_DEVICE_NOT_FOUND: return "device not found";
        case CCS_ERR_PERMISSION_DENIED:
            return "permission denied, you need to add an udev rule for this device";
        case CCS_ERR_POWER_ON_TIMEOUT: return "radio did not report powered within the timeout";
        case CCS_ERR_INVALID_CHANNEL: return "channel must be between 11 and 26";
        case CCS_ERR_ALREADY_STREAMING: return "already streaming";
        case CCS_ERR_NOT_STREAMING: return "not streaming";
        case CCS_ERR_TIMEOUT: return "transfer timed out";
        case CCS_ERR_NO_DEVICE: return "device disconnected";
        case CCS_ERR_IO: return "USB I/O error";
        case CCS_ERR_NOT_OPEN: return "device handle released";
        case CCS_ERR_INVALID_ARG: return "invalid argument";
        case CCS_ERR_NO_MEMORY: return "out of memory";
        case CCS_ERR_THREAD: return "failed to start receiver thread";
        default: return "unknown error";
    }
}
