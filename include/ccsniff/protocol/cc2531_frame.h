// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief CC2531 sniffer frame decoding.
 *
 * Turns one buffer read from the dongle's bulk endpoint into a `ccs_packet`.
 *
 * Wire layout (offsets into the buffer):
 *
 *     [0]       status, 0 = frame follows
 *     [1]       declared length, equals total length - 3
 *     [2]       reserved
 *     [3..6]    radio header (opaque)
 *     [7]       payload length + 2
 *     [8..n-3]  payload
 *     [n-2]     fcs1: signed RSSI, offset by 73 dB
 *     [n-1]     fcs2: bit 7 CRC ok, bits 0..6 correlation
 */

#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CCS_FRAME_HEADER_LEN   4
#define CCS_FRAME_MAX_PAYLOAD  248 /* declared length is one byte and covers bytes 3..n-1 */
#define CCS_FRAME_MIN_LEN      10
#define CCS_FRAME_RSSI_OFFSET  73
#define CCS_FRAME_STATUS_DATA  0x00

/**
 * @brief One decoded over-the-air frame. Produced by ccs_frame_decode only.
 */
typedef struct {
    uint64_t timestamp_ns; /* wall clock at decode time (ns since Unix epoch) */
    int channel;           /* channel the controller was tuned to, 11..26 */
    uint8_t header[CCS_FRAME_HEADER_LEN];
    uint8_t payload[CCS_FRAME_MAX_PAYLOAD];
    size_t payload_len;
    int rssi; /* dBm */
    bool crc_ok;
    uint8_t correlation; /* 0..127 */
} ccs_packet;

/**
 * @brief Reinterpret a byte as two's-complement signed.
 */
static inline int
ccs_signed8(uint8_t x) {
    return ((int)x + 128) % 256 - 128;
}

/**
 * @brief Whether a raw bulk buffer carries a frame (status byte 0).
 *
 * Buffers with any other status are skipped without decoding.
 */
bool ccs_frame_is_data(const uint8_t* buf, size_t len);

/**
 * @brief Decode one raw buffer.
 *
 * Malformed buffers are rejected rather than reported as errors: too short,
 * declared length != len - 3, or payload length field - 2 != actual payload
 * length. The status byte is not inspected.
 *
 * @param buf Raw buffer as returned by the bulk read.
 * @param len Number of valid bytes in `buf`.
 * @param channel Channel to stamp on the packet.
 * @param out [out] Filled only when the frame is accepted.
 * @return true when a packet was produced, false when rejected.
 */
bool ccs_frame_decode(const uint8_t* buf, size_t len, int channel, ccs_packet* out);

/**
 * @brief Render a packet as a multi-line, human-readable block.
 *
 * @param pkt Packet to render.
 * @param out Destination buffer.
 * @param out_size Size of `out` in bytes; output is truncated to fit.
 * @return Number of characters that a large enough buffer would hold, or -1 on bad arguments.
 */
int ccs_packet_format(const ccs_packet* pkt, char* out, size_t out_size);

#ifdef __cplusplus
}
#endif
