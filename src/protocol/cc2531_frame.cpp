// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief CC2531 sniffer frame decoder and packet rendering.
 */

#include <ccsniff/platform/timing.h>
#include <ccsniff/protocol/cc2531_frame.h>

#include <stdio.h>
#include <string.h>
#include <time.h>

bool
ccs_frame_is_data(const uint8_t* buf, size_t len) {
    return buf != NULL && len > 0 && buf[0] == CCS_FRAME_STATUS_DATA;
}

bool
ccs_frame_decode(const uint8_t* buf, size_t len, int channel, ccs_packet* out) {
    if (!buf || !out || len < CCS_FRAME_MIN_LEN) {
        return false;
    }

    size_t declared_len = buf[1];
    if (len - 3 != declared_len) {
        return false;
    }

    /* payload spans [8, len - 2) */
    size_t payload_len = len - 10;
    int payload_len_field = (int)buf[7] - 2;
    if (payload_len_field < 0 || (size_t)payload_len_field != payload_len) {
        return false;
    }

    uint8_t fcs1 = buf[len - 2];
    uint8_t fcs2 = buf[len - 1];

    out->timestamp_ns = ccs_time_realtime_ns();
    out->channel = channel;
    memcpy(out->header, buf + 3, CCS_FRAME_HEADER_LEN);
    memcpy(out->payload, buf + 8, payload_len);
    out->payload_len = payload_len;
    out->rssi = ccs_signed8(fcs1) - CCS_FRAME_RSSI_OFFSET;
    out->crc_ok = (fcs2 & 0x80) != 0;
    out->correlation = (uint8_t)(fcs2 & 0x7F);
    return true;
}

static size_t
hexlify(const uint8_t* in, size_t n, char* out, size_t out_size) {
    static const char digits[] = "0123456789abcdef";
    size_t w = 0;
    for (size_t i = 0; i < n && w + 2 < out_size; i++) {
        out[w++] = digits[in[i] >> 4];
        out[w++] = digits[in[i] & 0x0F];
    }
    if (out_size > 0) {
        out[w] = '\0';
    }
    return w;
}

int
ccs_packet_format(const ccs_packet* pkt, char* out, size_t out_size) {
    if (!pkt || !out || out_size == 0) {
        return -1;
    }

    time_t secs = (time_t)(pkt->timestamp_ns / 1000000000ULL);
    struct tm tm_utc;
    char clock[16];
    if (gmtime_r(&secs, &tm_utc) == NULL || strftime(clock, sizeof(clock), "%H:%M:%S", &tm_utc) == 0) {
        snprintf(clock, sizeof(clock), "--:--:--");
    }

    char header_hex[CCS_FRAME_HEADER_LEN * 2 + 1];
    char payload_hex[CCS_FRAME_MAX_PAYLOAD * 2 + 1];
    hexlify(pkt->header, CCS_FRAME_HEADER_LEN, header_hex, sizeof(header_hex));
    size_t plen = pkt->payload_len > CCS_FRAME_MAX_PAYLOAD ? CCS_FRAME_MAX_PAYLOAD : pkt->payload_len;
    hexlify(pkt->payload, plen, payload_hex, sizeof(payload_hex));

    return snprintf(out, out_size,
                    "Channel:     %d\n"
                    "Timestamp:   %s\n"
                    "Header:      %s\n"
                    "RSSI:        %d\n"
                    "CRC OK:      %s\n"
                    "Correlation: %u\n"
                    "Payload:     %s",
                    pkt->channel, clock, header_hex, pkt->rssi, pkt->crc_ok ? "True" : "False",
                    (unsigned)pkt->correlation, payload_hex);
}
