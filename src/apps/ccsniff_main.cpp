// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief ccsniff-cli: capture 802.15.4 frames from a CC2531 dongle and print them.
 */

#include <ccsniff/core/status.h>
#include <ccsniff/io/cc2531_sniffer.h>
#include <ccsniff/platform/timing.h>
#include <ccsniff/protocol/cc2531_frame.h>
#include <ccsniff/runtime/config.h>
#include <ccsniff/runtime/exitflag.h>
#include <ccsniff/runtime/log.h>

#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

static void
handle_signal(int sig) {
    (void)sig;
    exitflag = 1;
}

static void
usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s [-c channel] [-t seconds] [-v] [-h]\n"
            "  -c <11..26>  capture channel (default: CCSNIFF_CHANNEL or 11)\n"
            "  -t <secs>    capture duration, 0 runs until Ctrl+C (default: 10)\n"
            "  -v           debug logging\n"
            "  -h           show this help\n",
            argv0);
}

static int
parse_int_arg(const char* s, long lo, long hi, int* out) {
    char* end = NULL;
    errno = 0;
    long v = strtol(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < lo || v > hi) {
        return -1;
    }
    *out = (int)v;
    return 0;
}

static void
print_packet(const ccs_packet& pkt) {
    char text[1024];
    if (ccs_packet_format(&pkt, text, sizeof(text)) < 0) {
        return;
    }
    printf("------------------------------\n%s\n------------------------------\n", text);
    fflush(stdout);
}

int
main(int argc, char** argv) {
    ccs_config_init();
    const ccsRuntimeConfig* cfg = ccs_get_config();
    if (cfg && cfg->log_level_is_set) {
        ccs_log_set_level(cfg->log_level);
    }

    int channel = ccs_config_channel();
    int seconds = 10;

    int opt;
    while ((opt = getopt(argc, argv, "c:t:vh")) != -1) {
        switch (opt) {
            case 'c':
                if (parse_int_arg(optarg, CCS_CC2531_MIN_CHANNEL, CCS_CC2531_MAX_CHANNEL, &channel) != 0) {
                    LOG_ERROR("Channel must be between 11 and 26.\n");
                    return 2;
                }
                break;
            case 't':
                if (parse_int_arg(optarg, 0, 86400L * 365L, &seconds) != 0) {
                    LOG_ERROR("Invalid duration '%s'.\n", optarg);
                    return 2;
                }
                break;
            case 'v': ccs_log_set_level(LOG_LEVEL_DEBUG); break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 2;
        }
    }

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);

    Cc2531Sniffer sniffer(print_packet);
    int r = sniffer.open(channel);
    if (r < 0) {
        LOG_ERROR("Unable to open CC2531: %s\n", ccs_status_str(r));
        return 1;
    }

    printf("%s\n", sniffer.describe().c_str());
    fflush(stdout);

    r = sniffer.start();
    if (r < 0) {
        LOG_ERROR("Unable to start capture: %s\n", ccs_status_str(r));
        return 1;
    }

    uint64_t deadline = ccs_time_monotonic_ms() + (uint64_t)seconds * 1000ULL;
    while (!exitflag && (seconds == 0 || ccs_time_monotonic_ms() < deadline)) {
        ccs_sleep_ms(100);
    }

    r = sniffer.stop();
    if (r < 0) {
        LOG_WARNING("Stop failed: %s\n", ccs_status_str(r));
    }

    ccs_cc2531_stats st = sniffer.stats();
    LOG_INFO("%s: captured %llu packets (%llu malformed, %llu skipped, %llu read errors).\n",
             sniffer.name().c_str(), (unsigned long long)st.delivered, (unsigned long long)st.malformed,
             (unsigned long long)st.skipped, (unsigned long long)st.read_errors);
    return 0;
}
