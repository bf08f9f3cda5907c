// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief RAII owner for a CC2531 sniffer dongle.
 *
 * Wraps the C device API with a C++ class whose destructor guarantees the
 * radio is powered off and the handle released.
 */

#include <ccsniff/core/status.h>
#include <ccsniff/io/cc2531_sniffer.h>
#include <utility>

Cc2531Sniffer::Cc2531Sniffer(PacketHandler handler, const ccs_usb_ops* ops)
    : handler_(std::move(handler)), ops_(ops), dev_(nullptr), last_error_code_(0) {}

/**
 * @brief Destructor. Releases the device and frees the handle.
 */
Cc2531Sniffer::~Cc2531Sniffer() {
    if (dev_) {
        ccs_cc2531_destroy(dev_);
        dev_ = nullptr;
    }
}

void
Cc2531Sniffer::dispatch(const ccs_packet* pkt, void* user) {
    Cc2531Sniffer* self = static_cast<Cc2531Sniffer*>(user);
    if (self && pkt && self->handler_) {
        self->handler_(*pkt);
    }
}

int
Cc2531Sniffer::record(int status) {
    last_error_code_ = status < 0 ? status : 0;
    return last_error_code_;
}

int
Cc2531Sniffer::open(int channel) {
    if (dev_ && ccs_cc2531_is_open(dev_)) {
        return record(CCS_OK);
    }
    if (dev_) {
        ccs_cc2531_destroy(dev_);
        dev_ = nullptr;
    }
    int status = CCS_OK;
    dev_ = ccs_cc2531_create(ops_, channel, &Cc2531Sniffer::dispatch, this, &status);
    return record(dev_ ? CCS_OK : status);
}

int
Cc2531Sniffer::close() {
    if (!dev_) {
        return record(CCS_OK);
    }
    return record(ccs_cc2531_close(dev_));
}

int
Cc2531Sniffer::start() {
    if (!dev_) {
        return record(CCS_ERR_NOT_OPEN);
    }
    return record(ccs_cc2531_start(dev_));
}

int
Cc2531Sniffer::stop() {
    if (!dev_) {
        return record(CCS_ERR_NOT_STREAMING);
    }
    return record(ccs_cc2531_stop(dev_));
}

int
Cc2531Sniffer::set_channel(int channel) {
    if (!dev_) {
        return record(CCS_ERR_NOT_OPEN);
    }
    return record(ccs_cc2531_set_channel(dev_, channel));
}

int
Cc2531Sniffer::channel() const {
    return dev_ ? ccs_cc2531_get_channel(dev_) : CCS_ERR_NOT_OPEN;
}

bool
Cc2531Sniffer::running() const {
    return dev_ && ccs_cc2531_is_running(dev_);
}

bool
Cc2531Sniffer::is_open() const {
    return dev_ && ccs_cc2531_is_open(dev_);
}

std::string
Cc2531Sniffer::name() const {
    return ccs_cc2531_name(dev_);
}

std::string
Cc2531Sniffer::describe() const {
    if (!dev_) {
        return "Not connected";
    }
    char buf[192];
    if (ccs_cc2531_describe(dev_, buf, sizeof(buf)) < 0) {
        return "Not connected";
    }
    return buf;
}

ccs_cc2531_stats
Cc2531Sniffer::stats() const {
    ccs_cc2531_stats s;
    ccs_cc2531_get_stats(dev_, &s);
    return s;
}
