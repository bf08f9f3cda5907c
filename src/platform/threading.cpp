// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

/**
 * @file
 * @brief pthreads implementation of the ccsniff threading abstraction.
 */

#include <ccsniff/platform/threading.h>

#include <errno.h>
#include <sched.h>

int
ccs_thread_create(ccs_thread_t* thread, ccs_thread_fn func, void* arg) {
    if (!thread || !func) {
        return EINVAL;
    }
    return pthread_create(thread, NULL, func, arg);
}

int
ccs_thread_join(ccs_thread_t thread) {
    return pthread_join(thread, NULL);
}

int
ccs_mutex_init(ccs_mutex_t* mutex) {
    return pthread_mutex_init(mutex, NULL);
}

int
ccs_mutex_destroy(ccs_mutex_t* mutex) {
    return pthread_mutex_destroy(mutex);
}

int
ccs_mutex_lock(ccs_mutex_t* mutex) {
    return pthread_mutex_lock(mutex);
}

int
ccs_mutex_unlock(ccs_mutex_t* mutex) {
    return pthread_mutex_unlock(mutex);
}

int
ccs_thread_set_realtime_priority(int priority) {
    int lo = sched_get_priority_min(SCHED_FIFO);
    int hi = sched_get_priority_max(SCHED_FIFO);
    if (lo < 0 || hi < 0) {
        return -1;
    }
    if (priority <= 0) {
        priority = lo;
    }
    if (priority > hi) {
        priority = hi;
    }
    struct sched_param sp;
    sp.sched_priority = priority;
    int r = pthread_setschedparam(pthread_self(), SCHED_FIFO, &sp);
    if (r != 0) {
        errno = r;
        return -1;
    }
    return 0;
}

int
ccs_thread_set_affinity(int cpu_index) {
#if CCS_PLATFORM_LINUX
    if (cpu_index < 0 || cpu_index >= CPU_SETSIZE) {
        errno = EINVAL;
        return -1;
    }
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(cpu_index, &set);
    int r = pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
    if (r != 0) {
        errno = r;
        return -1;
    }
    return 0;
#else
    (void)cpu_index;
    errno = ENOTSUP;
    return -1;
#endif
}
