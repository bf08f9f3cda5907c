// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief CC2531 sniffer dongle control and bulk receiver thread.
 *
 * Implements the opaque `cc2531_device` handle: power-up/down, channel
 * programming, start/stop of streaming, and the receiver thread that reads
 * the bulk endpoint, decodes frames and hands them to the packet sink.
 *
 * The transport does not support concurrent transfers. The receiver thread
 * is the only issuer of bulk reads; every control transfer is issued from the
 * owning thread, and stop() joins the receiver before sending anything.
 */

#include <atomic>
#include <ccsniff/core/status.h>
#include <ccsniff/io/cc2531_device.h>
#include <ccsniff/platform/threading.h>
#include <ccsniff/platform/timing.h>
#include <ccsniff/runtime/config.h>
#include <ccsniff/runtime/log.h>
#include <ccsniff/runtime/rt_sched.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// Internal CC2531 device structure
struct cc2531_device {
    const ccs_usb_ops* ops;
    void* handle; /* NULL once released */
    int channel;
    std::atomic<int> running;
    ccs_thread_t thread;
    int thread_started;
    ccs_packet_sink sink;
    void* sink_user;
    uint8_t ident[CCS_CC2531_IDENT_MAX];
    size_t ident_len;
    char name[128];
    unsigned int ctrl_timeout_ms;
    unsigned int power_timeout_ms;
    unsigned int power_poll_ms;
    ccs_rt_sched_params rt;
    /* Receiver counters */
    std::atomic<uint64_t> reads;
    std::atomic<uint64_t> read_timeouts;
    std::atomic<uint64_t> read_errors;
    std::atomic<uint64_t> skipped;
    std::atomic<uint64_t> malformed;
    std::atomic<uint64_t> delivered;
    std::atomic<uint64_t> rx_runs;
    /* Bulk buffer, touched only by the receiver thread */
    uint8_t rx_buf[CCS_CC2531_DATA_MAX_LEN];
};

static int
channel_valid(int channel) {
    return channel >= CCS_CC2531_MIN_CHANNEL && channel <= CCS_CC2531_MAX_CHANNEL;
}

static int
ctrl_out(struct cc2531_device* dev, uint8_t request, uint16_t index, uint8_t* data, uint16_t length) {
    return dev->ops->control_transfer(dev->handle, CCS_USB_DIR_OUT, request, 0, index, data, length,
                                      dev->ctrl_timeout_ms, NULL);
}

static int
ctrl_in(struct cc2531_device* dev, uint8_t request, uint8_t* data, uint16_t length, int* got) {
    return dev->ops->control_transfer(dev->handle, CCS_USB_DIR_IN, request, 0, 0, data, length, dev->ctrl_timeout_ms,
                                      got);
}

/**
 * @brief Request radio power-on and poll the power status until it reports on.
 *
 * @param dev Device with an open handle.
 * @return CCS_OK, CCS_ERR_POWER_ON_TIMEOUT, or the transport error.
 */
static int
power_on(struct cc2531_device* dev) {
    int r = ctrl_out(dev, CCS_CC2531_REQ_SET_POWER, CCS_CC2531_POWER_ON, NULL, 0);
    if (r < 0) {
        LOG_ERROR("CC2531: power-on request failed: %s\n", ccs_status_str(r));
        return r;
    }

    uint64_t deadline = ccs_time_monotonic_ms() + dev->power_timeout_ms;
    for (;;) {
        uint8_t status = 0;
        int got = 0;
        r = ctrl_in(dev, CCS_CC2531_REQ_GET_POWER, &status, 1, &got);
        if (r < 0) {
            LOG_ERROR("CC2531: power status query failed: %s\n", ccs_status_str(r));
            return r;
        }
        if (got >= 1 && status == CCS_CC2531_POWER_ON) {
            return CCS_OK;
        }
        if (ccs_time_monotonic_ms() >= deadline) {
            LOG_ERROR("CC2531: radio not powered after %u ms (last status %u).\n", dev->power_timeout_ms,
                      (unsigned)status);
            return CCS_ERR_POWER_ON_TIMEOUT;
        }
        ccs_sleep_ms(dev->power_poll_ms);
    }
}

/**
 * @brief Program the radio channel: select value, then the fixed follow-up.
 */
static int
program_channel(struct cc2531_device* dev, int channel) {
    uint8_t data = (uint8_t)channel;
    int r = ctrl_out(dev, CCS_CC2531_REQ_SET_CHAN, 0, &data, 1);
    if (r < 0) {
        LOG_ERROR("CC2531: set channel %d failed: %s\n", channel, ccs_status_str(r));
        return r;
    }
    data = 0x00;
    r = ctrl_out(dev, CCS_CC2531_REQ_SET_CHAN, 1, &data, 1);
    if (r < 0) {
        LOG_ERROR("CC2531: set channel %d (commit) failed: %s\n", channel, ccs_status_str(r));
        return r;
    }
    return CCS_OK;
}

/**
 * @brief Receiver thread entry: read bulk chunks, decode, dispatch.
 *
 * Runs until `running` is cleared. The read timeout bounds how long it takes
 * to notice. A vanished device ends the loop; other read errors are counted
 * and the loop pauses one poll interval before reading again.
 *
 * @param arg Pointer to `cc2531_device`.
 * @return NULL on exit.
 */
static CCS_THREAD_RETURN_TYPE
rx_thread_fn(void* arg) {
    struct cc2531_device* s = static_cast<cc2531_device*>(arg);
    (void)ccs_rt_sched_apply("RX", &s->rt);

    while (s->running.load(std::memory_order_acquire)) {
        int got = 0;
        int r = s->ops->bulk_read(s->handle, CCS_CC2531_DATA_EP, s->rx_buf, CCS_CC2531_DATA_MAX_LEN, &got,
                                  CCS_CC2531_DATA_TIMEOUT_MS);
        if (r == CCS_ERR_TIMEOUT) {
            s->read_timeouts.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (r == CCS_ERR_NO_DEVICE) {
            s->read_errors.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("CC2531: device disconnected, receiver stopping.\n");
            break;
        }
        if (r < 0) {
            s->read_errors.fetch_add(1, std::memory_order_relaxed);
            LOG_WARNING("CC2531: bulk read failed: %s\n", ccs_status_str(r));
            ccs_sleep_ms(s->power_poll_ms);
            continue;
        }
        s->reads.fetch_add(1, std::memory_order_relaxed);

        if (!ccs_frame_is_data(s->rx_buf, (size_t)got)) {
            s->skipped.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        ccs_packet pkt;
        if (!ccs_frame_decode(s->rx_buf, (size_t)got, s->channel, &pkt)) {
            s->malformed.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("CC2531: dropped malformed frame (%d bytes, declared %u).\n", got,
                      got > 1 ? (unsigned)s->rx_buf[1] : 0U);
            continue;
        }
        s->delivered.fetch_add(1, std::memory_order_relaxed);
        s->sink(&pkt, s->sink_user);
    }
    CCS_THREAD_RETURN;
}

struct cc2531_device*
ccs_cc2531_create(const ccs_usb_ops* ops, int channel, ccs_packet_sink sink, void* user, int* status_out) {
    int status = CCS_OK;
    if (status_out) {
        *status_out = CCS_OK;
    }
    if (!ops) {
        ops = ccs_usb_libusb_ops();
    }
    if (!sink || !ops->open || !ops->close || !ops->set_configuration || !ops->control_transfer
        || !ops->bulk_read) {
        if (status_out) {
            *status_out = CCS_ERR_INVALID_ARG;
        }
        return NULL;
    }
    if (!channel_valid(channel)) {
        LOG_ERROR("CC2531: invalid channel %d (must be between 11 and 26).\n", channel);
        if (status_out) {
            *status_out = CCS_ERR_INVALID_CHANNEL;
        }
        return NULL;
    }

    struct cc2531_device* dev = static_cast<cc2531_device*>(calloc(1, sizeof(struct cc2531_device)));
    if (!dev) {
        if (status_out) {
            *status_out = CCS_ERR_NO_MEMORY;
        }
        return NULL;
    }

    dev->ops = ops;
    dev->handle = NULL;
    dev->channel = channel;
    dev->running.store(0);
    dev->thread_started = 0;
    dev->sink = sink;
    dev->sink_user = user;
    dev->ident_len = 0;
    snprintf(dev->name, sizeof(dev->name), "CC2531");
    dev->ctrl_timeout_ms = (unsigned int)ccs_config_ctrl_timeout_ms();
    dev->power_timeout_ms = (unsigned int)ccs_config_power_timeout_ms();
    dev->power_poll_ms = (unsigned int)ccs_config_power_poll_ms();
    ccs_rt_sched_params_rx(&dev->rt);
    dev->reads.store(0);
    dev->read_timeouts.store(0);
    dev->read_errors.store(0);
    dev->skipped.store(0);
    dev->malformed.store(0);
    dev->delivered.store(0);
    dev->rx_runs.store(0);

    status = ops->open(ops->ctx, CCS_CC2531_VID, CCS_CC2531_PID, &dev->handle);
    if (status < 0) {
        LOG_ERROR("CC2531: failed to open %04x:%04x: %s\n", CCS_CC2531_VID, CCS_CC2531_PID, ccs_status_str(status));
        dev->handle = NULL;
        free(dev);
        if (status_out) {
            *status_out = status;
        }
        return NULL;
    }

    status = ops->set_configuration(dev->handle);
    if (status < 0) {
        LOG_ERROR("CC2531: failed to apply default configuration: %s\n", ccs_status_str(status));
        goto fail;
    }

    if (ops->get_string) {
        char name[sizeof(dev->name)];
        if (ops->get_string(dev->handle, 2, name, sizeof(name)) == CCS_OK && name[0] != '\0') {
            snprintf(dev->name, sizeof(dev->name), "%s", name);
        }
    }

    {
        int got = 0;
        status = ctrl_in(dev, CCS_CC2531_REQ_GET_IDENT, dev->ident, CCS_CC2531_IDENT_MAX, &got);
        if (status < 0) {
            LOG_ERROR("CC2531: firmware identity request failed: %s\n", ccs_status_str(status));
            goto fail;
        }
        dev->ident_len = got > 0 ? (size_t)got : 0;
    }

    status = power_on(dev);
    if (status < 0) {
        goto fail;
    }

    status = program_channel(dev, channel);
    if (status < 0) {
        goto fail;
    }

    LOG_INFO("%s: radio powered, channel %d.\n", dev->name, dev->channel);
    return dev;

fail:
    (void)ccs_cc2531_close(dev);
    free(dev);
    if (status_out) {
        *status_out = status;
    }
    return NULL;
}

int
ccs_cc2531_close(struct cc2531_device* dev) {
    if (!dev) {
        return CCS_ERR_INVALID_ARG;
    }
    if (!dev->handle) {
        return CCS_OK;
    }

    if (dev->running.load()) {
        int r = ccs_cc2531_stop(dev);
        if (r < 0) {
            LOG_WARNING("CC2531: stop during teardown failed: %s\n", ccs_status_str(r));
        }
    }

    int r = ctrl_out(dev, CCS_CC2531_REQ_SET_POWER, CCS_CC2531_POWER_OFF, NULL, 0);
    if (r < 0) {
        LOG_WARNING("CC2531: power-off request failed: %s\n", ccs_status_str(r));
    }

    dev->ops->close(dev->handle);
    dev->handle = NULL;
    LOG_DEBUG("%s: radio powered off, handle released.\n", dev->name);
    return r;
}

void
ccs_cc2531_destroy(struct cc2531_device* dev) {
    if (!dev) {
        return;
    }
    (void)ccs_cc2531_close(dev);
    free(dev);
}

int
ccs_cc2531_start(struct cc2531_device* dev) {
    if (!dev) {
        return CCS_ERR_INVALID_ARG;
    }
    if (!dev->handle) {
        return CCS_ERR_NOT_OPEN;
    }
    if (dev->running.load()) {
        return CCS_ERR_ALREADY_STREAMING;
    }

    int r = ctrl_out(dev, CCS_CC2531_REQ_SET_START, 0, NULL, 0);
    if (r < 0) {
        LOG_ERROR("CC2531: start request failed: %s\n", ccs_status_str(r));
        return r;
    }

    dev->running.store(1, std::memory_order_release);
    dev->rx_runs.fetch_add(1, std::memory_order_relaxed);
    if (ccs_thread_create(&dev->thread, (ccs_thread_fn)rx_thread_fn, dev) != 0) {
        dev->running.store(0, std::memory_order_release);
        LOG_ERROR("CC2531: failed to create receiver thread.\n");
        r = ctrl_out(dev, CCS_CC2531_REQ_SET_STOP, 0, NULL, 0);
        if (r < 0) {
            LOG_WARNING("CC2531: stop request after failed start: %s\n", ccs_status_str(r));
        }
        return CCS_ERR_THREAD;
    }
    dev->thread_started = 1;
    LOG_DEBUG("%s: streaming on channel %d.\n", dev->name, dev->channel);
    return CCS_OK;
}

int
ccs_cc2531_stop(struct cc2531_device* dev) {
    if (!dev) {
        return CCS_ERR_INVALID_ARG;
    }
    if (!dev->running.load()) {
        return CCS_ERR_NOT_STREAMING;
    }

    /* Clear the flag and join before any control transfer touches the handle */
    dev->running.store(0, std::memory_order_release);
    if (dev->thread_started) {
        ccs_thread_join(dev->thread);
        dev->thread_started = 0;
    }

    int r = ctrl_out(dev, CCS_CC2531_REQ_SET_STOP, 0, NULL, 0);
    if (r < 0) {
        LOG_ERROR("CC2531: stop request failed: %s\n", ccs_status_str(r));
        return r;
    }
    LOG_DEBUG("%s: streaming stopped.\n", dev->name);
    return CCS_OK;
}

int
ccs_cc2531_set_channel(struct cc2531_device* dev, int channel) {
    if (!dev) {
        return CCS_ERR_INVALID_ARG;
    }
    if (!channel_valid(channel)) {
        LOG_ERROR("CC2531: invalid channel %d (must be between 11 and 26).\n", channel);
        return CCS_ERR_INVALID_CHANNEL;
    }
    if (!dev->handle) {
        return CCS_ERR_NOT_OPEN;
    }

    int was_running = dev->running.load();
    if (was_running) {
        int r = ccs_cc2531_stop(dev);
        if (r < 0) {
            return r;
        }
    }

    /* Packets keep the old channel unless the radio accepted the new one */
    int r = program_channel(dev, channel);
    if (r < 0) {
        if (was_running) {
            int sr = ccs_cc2531_start(dev);
            if (sr < 0) {
                LOG_WARNING("CC2531: could not resume streaming on channel %d: %s\n", dev->channel,
                            ccs_status_str(sr));
            }
        }
        return r;
    }
    dev->channel = channel;
    LOG_INFO("%s: tuned to channel %d.\n", dev->name, channel);

    if (was_running) {
        return ccs_cc2531_start(dev);
    }
    return CCS_OK;
}

int
ccs_cc2531_get_channel(const struct cc2531_device* dev) {
    return dev ? dev->channel : CCS_ERR_INVALID_ARG;
}

int
ccs_cc2531_is_running(const struct cc2531_device* dev) {
    return (dev && dev->running.load()) ? 1 : 0;
}

int
ccs_cc2531_is_open(const struct cc2531_device* dev) {
    return (dev && dev->handle) ? 1 : 0;
}

int
ccs_cc2531_get_ident(const struct cc2531_device* dev, uint8_t* out, size_t cap) {
    if (!dev || (!out && cap > 0)) {
        return CCS_ERR_INVALID_ARG;
    }
    size_t n = dev->ident_len < cap ? dev->ident_len : cap;
    if (n > 0) {
        memcpy(out, dev->ident, n);
    }
    return (int)dev->ident_len;
}

const char*
ccs_cc2531_name(const struct cc2531_device* dev) {
    return dev ? dev->name : "CC2531";
}

int
ccs_cc2531_describe(const struct cc2531_device* dev, char* out, size_t out_size) {
    if (!dev || !out || out_size == 0) {
        return -1;
    }
    if (!dev->handle) {
        return snprintf(out, out_size, "Not connected");
    }
    return snprintf(out, out_size, "%s <Channel: %d>", dev->name, dev->channel);
}

void
ccs_cc2531_get_stats(const struct cc2531_device* dev, ccs_cc2531_stats* out) {
    if (!out) {
        return;
    }
    memset(out, 0, sizeof(*out));
    if (!dev) {
        return;
    }
    out->reads = dev->reads.load(std::memory_order_relaxed);
    out->read_timeouts = dev->read_timeouts.load(std::memory_order_relaxed);
    out->read_errors = dev->read_errors.load(std::memory_order_relaxed);
    out->skipped = dev->skipped.load(std::memory_order_relaxed);
    out->malformed = dev->malformed.load(std::memory_order_relaxed);
    out->delivered = dev->delivered.load(std::memory_order_relaxed);
    out->rx_runs = dev->rx_runs.load(std::memory_order_relaxed);
}
