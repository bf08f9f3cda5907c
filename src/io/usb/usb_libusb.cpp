// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief libusb-1.0 implementation of the ccsniff USB transport hooks.
 *
 * Device lookup by vendor/product id, default configuration with kernel
 * driver detach, synchronous vendor control transfers and bulk IN reads.
 */

#include <ccsniff/core/status.h>
#include <ccsniff/io/usb_transport.h>
#include <ccsniff/runtime/log.h>

#include <libusb.h>
#include <stdlib.h>
#include <string.h>

namespace {

struct libusb_handle_state {
    libusb_device_handle* dev;
    int claimed;
};

/**
 * @brief Map a libusb error code onto a ccsniff status.
 */
static int
map_libusb_error(int rc) {
    switch (rc) {
        case LIBUSB_SUCCESS: return CCS_OK;
        case LIBUSB_ERROR_ACCESS: return CCS_ERR_PERMISSION_DENIED;
        case LIBUSB_ERROR_NOT_FOUND: return CCS_ERR_DEVICE_NOT_FOUND;
        case LIBUSB_ERROR_NO_DEVICE: return CCS_ERR_NO_DEVICE;
        case LIBUSB_ERROR_TIMEOUT: return CCS_ERR_TIMEOUT;
        case LIBUSB_ERROR_NO_MEM: return CCS_ERR_NO_MEMORY;
        case LIBUSB_ERROR_INVALID_PARAM: return CCS_ERR_INVALID_ARG;
        default: return CCS_ERR_IO;
    }
}

/* Process-wide libusb context, created on first use. */
static libusb_context*
shared_context(void) {
    static libusb_context* ctx = []() -> libusb_context* {
        libusb_context* c = NULL;
        int rc = libusb_init(&c);
        if (rc != LIBUSB_SUCCESS) {
            LOG_ERROR("libusb_init failed: %s\n", libusb_strerror((libusb_error)rc));
            return NULL;
        }
        return c;
    }();
    return ctx;
}

static int
usb_open(void* ctx, uint16_t vid, uint16_t pid, void** handle) {
    (void)ctx;
    if (!handle) {
        return CCS_ERR_INVALID_ARG;
    }
    *handle = NULL;

    libusb_context* lctx = shared_context();
    if (!lctx) {
        return CCS_ERR_IO;
    }

    libusb_device** list = NULL;
    ssize_t count = libusb_get_device_list(lctx, &list);
    if (count < 0) {
        LOG_ERROR("libusb_get_device_list failed: %s\n", libusb_strerror((libusb_error)count));
        return map_libusb_error((int)count);
    }

    int status = CCS_ERR_DEVICE_NOT_FOUND;
    for (ssize_t i = 0; i < count; i++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) != LIBUSB_SUCCESS) {
            continue;
        }
        if (desc.idVendor != vid || desc.idProduct != pid) {
            continue;
        }

        libusb_device_handle* dev = NULL;
        int rc = libusb_open(list[i], &dev);
        if (rc != LIBUSB_SUCCESS) {
            LOG_DEBUG("libusb_open %04x:%04x failed: %s\n", vid, pid, libusb_strerror((libusb_error)rc));
            status = map_libusb_error(rc);
            if (status == CCS_ERR_NO_DEVICE) {
                status = CCS_ERR_DEVICE_NOT_FOUND;
            }
            break;
        }

        libusb_handle_state* st = static_cast<libusb_handle_state*>(calloc(1, sizeof(libusb_handle_state)));
        if (!st) {
            libusb_close(dev);
            status = CCS_ERR_NO_MEMORY;
            break;
        }
        st->dev = dev;
        st->claimed = 0;
        *handle = st;
        status = CCS_OK;
        break;
    }

    libusb_free_device_list(list, 1);
    return status;
}

static void
usb_close(void* handle) {
    libusb_handle_state* st = static_cast<libusb_handle_state*>(handle);
    if (!st) {
        return;
    }
    if (st->claimed) {
        int rc = libusb_release_interface(st->dev, 0);
        if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_NO_DEVICE) {
            LOG_WARNING("libusb_release_interface failed: %s\n", libusb_strerror((libusb_error)rc));
        }
    }
    libusb_close(st->dev);
    free(st);
}

static int
usb_set_configuration(void* handle) {
    libusb_handle_state* st = static_cast<libusb_handle_state*>(handle);
    if (!st) {
        return CCS_ERR_INVALID_ARG;
    }

    /* Not supported on every platform; failure only matters if a kernel driver is bound. */
    (void)libusb_set_auto_detach_kernel_driver(st->dev, 1);
    if (libusb_kernel_driver_active(st->dev, 0) == 1) {
        int rc = libusb_detach_kernel_driver(st->dev, 0);
        if (rc != LIBUSB_SUCCESS) {
            LOG_ERROR("libusb_detach_kernel_driver failed: %s\n", libusb_strerror((libusb_error)rc));
            return map_libusb_error(rc);
        }
    }

    /* Default configuration is the first configuration descriptor */
    int wanted = 1;
    libusb_config_descriptor* cfg = NULL;
    if (libusb_get_config_descriptor(libusb_get_device(st->dev), 0, &cfg) == LIBUSB_SUCCESS && cfg) {
        wanted = cfg->bConfigurationValue;
        libusb_free_config_descriptor(cfg);
    }

    int active = -1;
    int rc = libusb_get_configuration(st->dev, &active);
    if (rc != LIBUSB_SUCCESS || active != wanted) {
        rc = libusb_set_configuration(st->dev, wanted);
        if (rc != LIBUSB_SUCCESS) {
            LOG_ERROR("libusb_set_configuration(%d) failed: %s\n", wanted, libusb_strerror((libusb_error)rc));
            return map_libusb_error(rc);
        }
    }

    rc = libusb_claim_interface(st->dev, 0);
    if (rc != LIBUSB_SUCCESS) {
        LOG_ERROR("libusb_claim_interface failed: %s\n", libusb_strerror((libusb_error)rc));
        return map_libusb_error(rc);
    }
    st->claimed = 1;
    return CCS_OK;
}

static int
usb_control_transfer(void* handle, uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
                     uint8_t* data, uint16_t length, unsigned int timeout_ms, int* transferred) {
    libusb_handle_state* st = static_cast<libusb_handle_state*>(handle);
    if (!st) {
        return CCS_ERR_INVALID_ARG;
    }
    int rc = libusb_control_transfer(st->dev, request_type, request, value, index, data, length, timeout_ms);
    if (rc < 0) {
        LOG_DEBUG("control transfer 0x%02X/0x%02X failed: %s\n", request_type, request,
                  libusb_strerror((libusb_error)rc));
        return map_libusb_error(rc);
    }
    if (transferred) {
        *transferred = rc;
    }
    return CCS_OK;
}

static int
usb_bulk_read(void* handle, uint8_t endpoint, uint8_t* buf, int length, int* transferred, unsigned int timeout_ms) {
    libusb_handle_state* st = static_cast<libusb_handle_state*>(handle);
    if (!st || !buf || !transferred) {
        return CCS_ERR_INVALID_ARG;
    }
    *transferred = 0;
    int rc = libusb_bulk_transfer(st->dev, endpoint, buf, length, transferred, timeout_ms);
    if (rc == LIBUSB_ERROR_TIMEOUT && *transferred > 0) {
        /* Partial data before the timeout goes to the caller; frame lengths are validated there */
        return CCS_OK;
    }
    return map_libusb_error(rc);
}

static int
usb_get_string(void* handle, uint8_t index, char* out, size_t out_size) {
    libusb_handle_state* st = static_cast<libusb_handle_state*>(handle);
    if (!st || !out || out_size == 0) {
        return CCS_ERR_INVALID_ARG;
    }
    int rc = libusb_get_string_descriptor_ascii(st->dev, index, reinterpret_cast<unsigned char*>(out), (int)out_size);
    if (rc < 0) {
        out[0] = '\0';
        return map_libusb_error(rc);
    }
    out[(size_t)rc < out_size ? (size_t)rc : out_size - 1] = '\0';
    return CCS_OK;
}

const ccs_usb_ops k_libusb_ops = {
    NULL, usb_open, usb_close, usb_set_configuration, usb_control_transfer, usb_bulk_read, usb_get_string,
};

} // namespace

const ccs_usb_ops*
ccs_usb_libusb_ops(void) {
    return &k_libusb_ops;
}
