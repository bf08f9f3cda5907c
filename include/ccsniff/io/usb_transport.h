// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief USB transport hook table used by the CC2531 device controller.
 *
 * The controller never talks to libusb directly; it goes through this table so
 * the transfer primitives can be replaced (e.g. by a scripted transport in
 * tests). `ccs_usb_libusb_ops()` returns the production libusb-1.0 backend.
 *
 * All hooks return CCS_OK or a negative `ccs_status`.
 */
#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* bmRequestType values for vendor requests to the device */
#define CCS_USB_DIR_OUT 0x40
#define CCS_USB_DIR_IN  0xC0

typedef struct {
    /* Opaque per-backend context passed back to open() */
    void* ctx;

    /* Locate and open the first device matching vid/pid. Writes the backend handle to *handle. */
    int (*open)(void* ctx, uint16_t vid, uint16_t pid, void** handle);

    /* Release the handle. Must tolerate a handle whose interface claim failed. */
    void (*close)(void* handle);

    /* Apply the default configuration and claim interface 0. */
    int (*set_configuration)(void* handle);

    /*
     * Vendor control transfer. On success returns CCS_OK and, when `transferred`
     * is non-NULL, writes the number of bytes moved in the data stage.
     */
    int (*control_transfer)(void* handle, uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
                            uint8_t* data, uint16_t length, unsigned int timeout_ms, int* transferred);

    /* Blocking bulk IN read. CCS_ERR_TIMEOUT when nothing arrived within timeout_ms. */
    int (*bulk_read)(void* handle, uint8_t endpoint, uint8_t* buf, int length, int* transferred,
                     unsigned int timeout_ms);

    /* Optional: ASCII string descriptor. May be NULL. */
    int (*get_string)(void* handle, uint8_t index, char* out, size_t out_size);
} ccs_usb_ops;

/**
 * @brief libusb-1.0 backed transport.
 *
 * The first open() initializes a libusb context which lives for the rest of
 * the process.
 *
 * @return Pointer to a static hook table.
 */
const ccs_usb_ops* ccs_usb_libusb_ops(void);

#ifdef __cplusplus
}
#endif
