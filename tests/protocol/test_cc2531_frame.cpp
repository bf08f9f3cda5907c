// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/*
 * Unit tests for the CC2531 frame decoder.
 *
 * Covers length validation, RSSI/CRC/correlation derivation, decode
 * repeatability and packet rendering.
 */

#include <stdint.h>
#include <stdio.h>
#include <string.h>

#include <ccsniff/platform/timing.h>
#include <ccsniff/protocol/cc2531_frame.h>

#include "fake_usb.h"

static int
test_signed8(void) {
    static const struct {
        uint8_t in;
        int out;
    } cases[] = {{0x00, 0}, {0x01, 1}, {0x7F, 127}, {0x80, -128}, {0xD6, -42}, {0xFF, -1}};
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); i++) {
        int got = ccs_signed8(cases[i].in);
        if (got != cases[i].out) {
            fprintf(stderr, "signed8(0x%02X): expected %d, got %d\n", cases[i].in, cases[i].out, got);
            return 1;
        }
    }
    return 0;
}

static int
test_decode_valid_frame(void) {
    const uint8_t payload[] = {0x41, 0x88, 0x12, 0x34, 0x12};
    uint8_t buf[64];
    int n = fake_build_frame(buf, payload, (int)sizeof(payload), 0xD6, 0x85);

    uint64_t before = ccs_time_realtime_ns();
    ccs_packet pkt;
    memset(&pkt, 0, sizeof(pkt));
    if (!ccs_frame_decode(buf, (size_t)n, 17, &pkt)) {
        fprintf(stderr, "decode valid: frame rejected\n");
        return 1;
    }
    uint64_t after = ccs_time_realtime_ns();

    if (pkt.channel != 17) {
        fprintf(stderr, "decode valid: channel %d\n", pkt.channel);
        return 1;
    }
    const uint8_t header[4] = {0xAA, 0xBB, 0xCC, 0xDD};
    if (memcmp(pkt.header, header, sizeof(header)) != 0) {
        fprintf(stderr, "decode valid: header mismatch\n");
        return 1;
    }
    if (pkt.payload_len != sizeof(payload) || memcmp(pkt.payload, payload, sizeof(payload)) != 0) {
        fprintf(stderr, "decode valid: payload mismatch (len %zu)\n", pkt.payload_len);
        return 1;
    }
    /* fcs1 0xD6 -> -42 - 73 */
    if (pkt.rssi != -115) {
        fprintf(stderr, "decode valid: rssi expected -115, got %d\n", pkt.rssi);
        return 1;
    }
    /* fcs2 0x85 = 1000 0101 */
    if (!pkt.crc_ok || pkt.correlation != 5) {
        fprintf(stderr, "decode valid: crc_ok=%d corr=%u\n", (int)pkt.crc_ok, (unsigned)pkt.correlation);
        return 1;
    }
    if (pkt.timestamp_ns < before || pkt.timestamp_ns > after) {
        fprintf(stderr, "decode valid: timestamp outside decode window\n");
        return 1;
    }
    return 0;
}

static int
test_status_bytes(void) {
    const uint8_t payload[] = {0x01, 0x02, 0x03};
    uint8_t buf[32];
    ccs_packet pkt;

    int n = fake_build_frame(buf, payload, 3, 0x00, 0x00);
    if (!ccs_frame_decode(buf, (size_t)n, 15, &pkt) || pkt.rssi != -73 || pkt.crc_ok || pkt.correlation != 0) {
        fprintf(stderr, "status bytes 00/00: rssi=%d crc=%d corr=%u\n", pkt.rssi, (int)pkt.crc_ok,
                (unsigned)pkt.correlation);
        return 1;
    }

    n = fake_build_frame(buf, payload, 3, 0x7F, 0x7F);
    if (!ccs_frame_decode(buf, (size_t)n, 15, &pkt) || pkt.rssi != 54 || pkt.crc_ok || pkt.correlation != 127) {
        fprintf(stderr, "status bytes 7F/7F: rssi=%d crc=%d corr=%u\n", pkt.rssi, (int)pkt.crc_ok,
                (unsigned)pkt.correlation);
        return 1;
    }

    n = fake_build_frame(buf, payload, 3, 0x80, 0xFF);
    if (!ccs_frame_decode(buf, (size_t)n, 15, &pkt) || pkt.rssi != -201 || !pkt.crc_ok || pkt.correlation != 127) {
        fprintf(stderr, "status bytes 80/FF: rssi=%d crc=%d corr=%u\n", pkt.rssi, (int)pkt.crc_ok,
                (unsigned)pkt.correlation);
        return 1;
    }
    return 0;
}

static int
test_declared_length_mismatch(void) {
    const uint8_t payload[] = {0x01, 0x02, 0x03};
    uint8_t buf[32];
    int n = fake_build_frame(buf, payload, 3, 0x10, 0x80);
    ccs_packet pkt;

    const int deltas[] = {-3, -1, 1, 2};
    for (size_t i = 0; i < sizeof(deltas) / sizeof(deltas[0]); i++) {
        uint8_t copy[32];
        memcpy(copy, buf, (size_t)n);
        copy[1] = (uint8_t)(copy[1] + deltas[i]);
        if (ccs_frame_decode(copy, (size_t)n, 11, &pkt)) {
            fprintf(stderr, "declared length %+d: accepted\n", deltas[i]);
            return 1;
        }
    }

    /* Trailing garbage after a valid frame changes the total length */
    buf[n] = 0xEE;
    if (ccs_frame_decode(buf, (size_t)n + 1, 11, &pkt)) {
        fprintf(stderr, "declared length: frame with extra byte accepted\n");
        return 1;
    }
    return 0;
}

static int
test_payload_length_mismatch(void) {
    const uint8_t payload[] = {0x01, 0x02, 0x03, 0x04};
    uint8_t buf[32];
    int n = fake_build_frame(buf, payload, 4, 0x10, 0x80);
    ccs_packet pkt;

    const uint8_t fields[] = {0x00, 0x01, 0x02, 0x05, 0x07, 0xFF};
    for (size_t i = 0; i < sizeof(fields) / sizeof(fields[0]); i++) {
        uint8_t copy[32];
        memcpy(copy, buf, (size_t)n);
        copy[7] = fields[i];
        if (ccs_frame_decode(copy, (size_t)n, 11, &pkt)) {
            fprintf(stderr, "payload length field 0x%02X: accepted\n", fields[i]);
            return 1;
        }
    }
    return 0;
}

static int
test_short_buffers(void) {
    uint8_t buf[16];
    memset(buf, 0, sizeof(buf));
    ccs_packet pkt;
    for (size_t len = 0; len < CCS_FRAME_MIN_LEN; len++) {
        buf[1] = len >= 3 ? (uint8_t)(len - 3) : 0;
        buf[7] = 2;
        if (ccs_frame_decode(buf, len, 11, &pkt)) {
            fprintf(stderr, "short buffer len=%zu accepted\n", len);
            return 1;
        }
    }
    if (ccs_frame_decode(NULL, 12, 11, &pkt)) {
        fprintf(stderr, "NULL buffer accepted\n");
        return 1;
    }
    return 0;
}

static int
test_payload_bounds(void) {
    uint8_t buf[CCS_FRAME_MAX_PAYLOAD + 16];
    ccs_packet pkt;

    int n = fake_build_frame(buf, NULL, 0, 0x00, 0x80);
    if (!ccs_frame_decode(buf, (size_t)n, 11, &pkt) || pkt.payload_len != 0) {
        fprintf(stderr, "empty payload: rejected\n");
        return 1;
    }

    uint8_t payload[CCS_FRAME_MAX_PAYLOAD];
    for (int i = 0; i < CCS_FRAME_MAX_PAYLOAD; i++) {
        payload[i] = (uint8_t)i;
    }
    n = fake_build_frame(buf, payload, CCS_FRAME_MAX_PAYLOAD, 0x00, 0x80);
    if (!ccs_frame_decode(buf, (size_t)n, 26, &pkt) || pkt.payload_len != CCS_FRAME_MAX_PAYLOAD
        || memcmp(pkt.payload, payload, sizeof(payload)) != 0) {
        fprintf(stderr, "max payload: rejected or corrupted\n");
        return 1;
    }
    return 0;
}

static int
test_decode_repeatable(void) {
    const uint8_t payload[] = {0x03, 0x08, 0xA5, 0xFF, 0xFF, 0xFF, 0xFF, 0x07};
    uint8_t buf[32];
    int n = fake_build_frame(buf, payload, (int)sizeof(payload), 0xC4, 0xEA);

    ccs_packet a;
    ccs_packet b;
    memset(&a, 0, sizeof(a));
    memset(&b, 0, sizeof(b));
    if (!ccs_frame_decode(buf, (size_t)n, 20, &a) || !ccs_frame_decode(buf, (size_t)n, 20, &b)) {
        fprintf(stderr, "repeatable: rejected\n");
        return 1;
    }
    if (a.channel != b.channel || memcmp(a.header, b.header, sizeof(a.header)) != 0
        || a.payload_len != b.payload_len || memcmp(a.payload, b.payload, a.payload_len) != 0 || a.rssi != b.rssi
        || a.crc_ok != b.crc_ok || a.correlation != b.correlation) {
        fprintf(stderr, "repeatable: packets differ\n");
        return 1;
    }
    if (b.timestamp_ns < a.timestamp_ns) {
        fprintf(stderr, "repeatable: timestamps went backwards\n");
        return 1;
    }
    return 0;
}

static int
test_status_byte_is_loop_concern(void) {
    const uint8_t payload[] = {0x01};
    uint8_t buf[32];
    int n = fake_build_frame(buf, payload, 1, 0x00, 0x00);

    if (!ccs_frame_is_data(buf, (size_t)n)) {
        fprintf(stderr, "is_data: status 0 not treated as data\n");
        return 1;
    }
    buf[0] = 0x01;
    if (ccs_frame_is_data(buf, (size_t)n) || ccs_frame_is_data(buf, 0) || ccs_frame_is_data(NULL, 4)) {
        fprintf(stderr, "is_data: non-data buffer accepted\n");
        return 1;
    }
    ccs_packet pkt;
    if (!ccs_frame_decode(buf, (size_t)n, 11, &pkt)) {
        fprintf(stderr, "decode: status byte should not affect layout validation\n");
        return 1;
    }
    return 0;
}

static int
test_packet_format(void) {
    const uint8_t payload[] = {0x01, 0x02, 0x03};
    uint8_t buf[32];
    int n = fake_build_frame(buf, payload, 3, 0xD6, 0x85);
    ccs_packet pkt;
    if (!ccs_frame_decode(buf, (size_t)n, 15, &pkt)) {
        fprintf(stderr, "format: decode failed\n");
        return 1;
    }
    pkt.timestamp_ns = (uint64_t)(3600 + 2 * 60 + 3) * 1000000000ULL;

    char text[512];
    int len = ccs_packet_format(&pkt, text, sizeof(text));
    if (len <= 0 || (size_t)len >= sizeof(text)) {
        fprintf(stderr, "format: unexpected length %d\n", len);
        return 1;
    }
    const char* expect[] = {"Channel:     15\n", "Timestamp:   01:02:03\n", "Header:      aabbccdd\n",
                            "RSSI:        -115\n", "CRC OK:      True\n",    "Correlation: 5\n",
                            "Payload:     010203"};
    for (size_t i = 0; i < sizeof(expect) / sizeof(expect[0]); i++) {
        if (strstr(text, expect[i]) == NULL) {
            fprintf(stderr, "format: missing '%s' in:\n%s\n", expect[i], text);
            return 1;
        }
    }

    char small[8];
    int need = ccs_packet_format(&pkt, small, sizeof(small));
    if (need != len || strlen(small) != sizeof(small) - 1) {
        fprintf(stderr, "format: truncation mismatch need=%d len=%d\n", need, len);
        return 1;
    }
    return 0;
}

int
main(void) {
    int rc = 0;
    rc |= test_signed8();
    rc |= test_decode_valid_frame();
    rc |= test_status_bytes();
    rc |= test_declared_length_mismatch();
    rc |= test_payload_length_mismatch();
    rc |= test_short_buffers();
    rc |= test_payload_bounds();
    rc |= test_decode_repeatable();
    rc |= test_status_byte_is_loop_concern();
    rc |= test_packet_format();
    if (rc == 0) {
        fprintf(stderr, "cc2531 frame tests: OK\n");
    }
    return rc;
}
