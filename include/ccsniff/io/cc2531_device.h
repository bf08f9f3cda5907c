// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief TI CC2531 802.15.4 sniffer dongle: device control public API.
 *
 * Declares the opaque `cc2531_device` handle and the functions that power the
 * radio, tune it, and stream decoded frames to a caller-supplied sink from a
 * background receiver thread.
 *
 * Threading: every function here must be called from the same (owning)
 * thread. The sink runs on the receiver thread; a slow sink delays the next
 * bulk read and therefore also delays ccs_cc2531_stop(). The sink must not
 * call back into this API and must not let exceptions escape.
 */

#pragma once

#include <ccsniff/io/usb_transport.h>
#include <ccsniff/protocol/cc2531_frame.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CCS_CC2531_VID             0x0451
#define CCS_CC2531_PID             0x16AE

#define CCS_CC2531_MIN_CHANNEL     11
#define CCS_CC2531_MAX_CHANNEL     26
#define CCS_CC2531_DEFAULT_CHANNEL 11

/* Bulk data endpoint */
#define CCS_CC2531_DATA_EP         0x83
#define CCS_CC2531_DATA_MAX_LEN    4096
#define CCS_CC2531_DATA_TIMEOUT_MS 2500

/* Vendor requests */
#define CCS_CC2531_REQ_GET_IDENT   0xC0
#define CCS_CC2531_REQ_SET_POWER   0xC5 /* wIndex: 4 = on, 0 = off */
#define CCS_CC2531_REQ_GET_POWER   0xC6 /* byte 0 == 4 when powered */
#define CCS_CC2531_REQ_SET_START   0xD0
#define CCS_CC2531_REQ_SET_STOP    0xD1
#define CCS_CC2531_REQ_SET_CHAN    0xD2 /* wIndex 0: [channel], then wIndex 1: [0x00] */

#define CCS_CC2531_POWER_ON        4
#define CCS_CC2531_POWER_OFF       0
#define CCS_CC2531_IDENT_MAX       256

/* Opaque handle for a CC2531 dongle */
struct cc2531_device;

/**
 * @brief Packet sink invoked once per accepted frame, on the receiver thread.
 *
 * `pkt` is only valid for the duration of the call.
 */
typedef void (*ccs_packet_sink)(const ccs_packet* pkt, void* user);

/**
 * @brief Receiver loop counters. Snapshot values; updated by the receiver thread.
 */
typedef struct {
    uint64_t reads;         /* bulk reads that returned data */
    uint64_t read_timeouts; /* bulk reads that timed out (liveness ticks) */
    uint64_t read_errors;   /* bulk reads that failed otherwise */
    uint64_t skipped;       /* buffers with a non-zero status byte */
    uint64_t malformed;     /* frames rejected by the decoder */
    uint64_t delivered;     /* packets handed to the sink */
    uint64_t rx_runs;       /* receiver loops launched, one per start */
} ccs_cc2531_stats;

/**
 * @brief Open, power up and tune the dongle.
 *
 * Locates 0451:16ae, applies the default configuration, reads the firmware
 * identity, powers the radio on and waits (bounded by the configured
 * power-on timeout) until it reports powered, then programs `channel`.
 * On any failure after the device was opened, the radio is powered off and
 * the handle released before returning.
 *
 * @param ops Transport hooks, or NULL for libusb.
 * @param channel Initial channel, 11..26.
 * @param sink Packet sink (required).
 * @param user Opaque pointer passed to `sink`.
 * @param status_out [out] Optional; CCS_OK or the failure reason.
 * @return Device handle, or NULL on failure.
 */
struct cc2531_device* ccs_cc2531_create(const ccs_usb_ops* ops, int channel, ccs_packet_sink sink, void* user,
                                        int* status_out);

/**
 * @brief Stop streaming if needed, power the radio off, release the handle and free.
 *
 * @param dev Device handle (may be NULL).
 */
void ccs_cc2531_destroy(struct cc2531_device* dev);

/**
 * @brief Stop streaming if needed, power the radio off and release the USB handle.
 *
 * Idempotent: a released device is left alone. Failures are logged, not
 * propagated through later calls.
 *
 * @return CCS_OK, or the status of the failed power-off request.
 */
int ccs_cc2531_close(struct cc2531_device* dev);

/**
 * @brief Send the start command and launch the receiver thread.
 *
 * @return CCS_OK, CCS_ERR_ALREADY_STREAMING, CCS_ERR_NOT_OPEN, or a transport/thread error.
 */
int ccs_cc2531_start(struct cc2531_device* dev);

/**
 * @brief Signal the receiver thread, join it, then send the stop command.
 *
 * Blocks for at most one bulk read timeout (2500 ms) plus sink time.
 *
 * @return CCS_OK, CCS_ERR_NOT_STREAMING, or the transport error of the stop command.
 */
int ccs_cc2531_stop(struct cc2531_device* dev);

/**
 * @brief Retune to `channel`, pausing streaming around the change if active.
 *
 * If the radio rejects the channel commands the previous channel is kept and
 * streaming is resumed when it was active; the transport error is returned.
 *
 * @return CCS_OK, CCS_ERR_INVALID_CHANNEL (nothing changed), CCS_ERR_NOT_OPEN, or a transport error.
 */
int ccs_cc2531_set_channel(struct cc2531_device* dev, int channel);

/**
 * @brief Current channel (11..26), or negative on a NULL handle.
 */
int ccs_cc2531_get_channel(const struct cc2531_device* dev);

/**
 * @brief 1 while the receiver loop is active, else 0.
 */
int ccs_cc2531_is_running(const struct cc2531_device* dev);

/**
 * @brief 1 while the USB handle is held, else 0.
 */
int ccs_cc2531_is_open(const struct cc2531_device* dev);

/**
 * @brief Copy the firmware identity blob read during open.
 *
 * @return Number of bytes in the identity (may exceed `cap`), or negative on bad arguments.
 */
int ccs_cc2531_get_ident(const struct cc2531_device* dev, uint8_t* out, size_t cap);

/**
 * @brief Product name from the USB string descriptor, or "CC2531" if unavailable.
 */
const char* ccs_cc2531_name(const struct cc2531_device* dev);

/**
 * @brief Render "<name> <Channel: N>", or "Not connected" once released.
 *
 * @return snprintf-style length, or -1 on bad arguments.
 */
int ccs_cc2531_describe(const struct cc2531_device* dev, char* out, size_t out_size);

/**
 * @brief Snapshot of the receiver loop counters.
 */
void ccs_cc2531_get_stats(const struct cc2531_device* dev, ccs_cc2531_stats* out);

#ifdef __cplusplus
}
#endif
