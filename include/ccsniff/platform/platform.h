// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#pragma once

/*
 * Platform detection macros for ccsniff
 */

/* Detect Linux */
#if defined(__linux__) && !defined(__CYGWIN__)
#define CCS_PLATFORM_LINUX 1
#else
#define CCS_PLATFORM_LINUX 0
#endif

/* Detect macOS */
#if defined(__APPLE__) && defined(__MACH__)
#define CCS_PLATFORM_MACOS 1
#else
#define CCS_PLATFORM_MACOS 0
#endif

/* Detect POSIX-like systems (including Cygwin) */
#if CCS_PLATFORM_LINUX || CCS_PLATFORM_MACOS || defined(__CYGWIN__) || defined(__FreeBSD__) || defined(__NetBSD__)     \
    || defined(__OpenBSD__)
#define CCS_PLATFORM_POSIX 1
#else
#define CCS_PLATFORM_POSIX 0
#endif

#if !CCS_PLATFORM_POSIX
#error "ccsniff requires a POSIX platform (pthreads, libusb-1.0)"
#endif

/* Compiler detection */
#if defined(__GNUC__) && !defined(__clang__)
#define CCS_COMPILER_GCC 1
#else
#define CCS_COMPILER_GCC 0
#endif

#if defined(__clang__)
#define CCS_COMPILER_CLANG 1
#else
#define CCS_COMPILER_CLANG 0
#endif
