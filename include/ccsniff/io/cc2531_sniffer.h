// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief RAII owner for a CC2531 sniffer dongle.
 *
 * Declares the C++ wrapper that ties the device handle's lifetime to an
 * object: the destructor always stops streaming, powers the radio off and
 * releases the USB handle.
 */

#pragma once

#include <ccsniff/io/cc2531_device.h>
#include <functional>
#include <string>

/**
 * @brief RAII owner of a `cc2531_device`.
 *
 * open() acquires and powers the dongle; close() or the destructor releases
 * it. Control calls forward to the C API and record the last status.
 */
class Cc2531Sniffer {
  public:
    /* Runs on the receiver thread; must not throw or call back into this object. */
    typedef std::function<void(const ccs_packet&)> PacketHandler;

    /**
     * @brief Construct an unopened sniffer.
     * @param handler Packet handler invoked for each accepted frame.
     * @param ops Transport hooks, or nullptr for libusb.
     */
    explicit Cc2531Sniffer(PacketHandler handler, const ccs_usb_ops* ops = nullptr);

    /**
     * @brief Destructor. Ensures close() is called.
     */
    ~Cc2531Sniffer();

    /**
     * @brief Open, power up and tune the dongle. No-op when already open.
     * @param channel Initial channel, 11..26.
     * @return 0 on success, negative `ccs_status` on error.
     */
    int open(int channel = CCS_CC2531_DEFAULT_CHANNEL);

    /**
     * @brief Stop streaming, power off and release. Safe to call multiple times.
     * @return 0 on success, negative status of a failed power-off.
     */
    int close();

    int start();
    int stop();
    int set_channel(int channel);

    int channel() const;
    bool running() const;
    bool is_open() const;

    /**
     * @brief Product name from the USB string descriptor ("CC2531" when absent or unopened).
     */
    std::string name() const;

    /**
     * @brief "<name> <Channel: N>" while open, otherwise "Not connected".
     */
    std::string describe() const;

    ccs_cc2531_stats stats() const;

    bool
    ok() const {
        return last_error_code_ == 0;
    }

    /**
     * @brief Status of the last failing operation (if any).
     * @return 0 when the last operation succeeded; otherwise negative `ccs_status`.
     */
    int
    last_error_code() const {
        return last_error_code_;
    }

  private:
    // Non-copyable: the device handle has exactly one owner
    Cc2531Sniffer(const Cc2531Sniffer&) = delete;
    Cc2531Sniffer& operator=(const Cc2531Sniffer&) = delete;

    static void dispatch(const ccs_packet* pkt, void* user);

    int record(int status);

    PacketHandler handler_;
    const ccs_usb_ops* ops_;
    cc2531_device* dev_;
    int last_error_code_;
};
