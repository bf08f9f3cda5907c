// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#pragma once

/**
 * @file
 * @brief Threading abstraction for ccsniff.
 *
 * Thin wrappers over pthreads for the receiver thread and the few
 * synchronization points the library needs.
 */

#include <ccsniff/platform/platform.h>

#include <pthread.h>

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Type Definitions
 *============================================================================*/

typedef pthread_t ccs_thread_t;
typedef pthread_mutex_t ccs_mutex_t;

/* Thread function signature */
typedef void* (*ccs_thread_fn)(void*);
#define CCS_THREAD_RETURN_TYPE void*
#define CCS_THREAD_RETURN      return NULL

/*============================================================================
 * Thread Functions
 *============================================================================*/

/**
 * @brief Create and start a new thread.
 *
 * @param thread    Pointer to thread handle (output).
 * @param func      Thread entry function.
 * @param arg       Argument passed to thread function.
 * @return 0 on success, non-zero error code on failure.
 */
int ccs_thread_create(ccs_thread_t* thread, ccs_thread_fn func, void* arg);

/**
 * @brief Wait for a thread to terminate.
 *
 * @param thread    Thread handle.
 * @return 0 on success, non-zero error code on failure.
 */
int ccs_thread_join(ccs_thread_t thread);

/*============================================================================
 * Mutex Functions
 *============================================================================*/

int ccs_mutex_init(ccs_mutex_t* mutex);
int ccs_mutex_destroy(ccs_mutex_t* mutex);
int ccs_mutex_lock(ccs_mutex_t* mutex);
int ccs_mutex_unlock(ccs_mutex_t* mutex);

/*============================================================================
 * Thread Priority / Scheduling (Optional)
 *============================================================================*/

/**
 * @brief Attempt to set realtime priority for current thread.
 *
 * @param priority  SCHED_FIFO priority; 0 selects the scheduler minimum.
 * @return 0 on success, non-zero on failure (may require elevated privileges).
 */
int ccs_thread_set_realtime_priority(int priority);

/**
 * @brief Set CPU affinity for current thread.
 *
 * @param cpu_index     CPU core index to pin to.
 * @return 0 on success, non-zero on failure or if unsupported.
 */
int ccs_thread_set_affinity(int cpu_index);

#ifdef __cplusplus
}
#endif
