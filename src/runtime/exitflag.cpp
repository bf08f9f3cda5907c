// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 by the ccsniff authors
 */

#include <ccsniff/runtime/exitflag.h>

extern "C" {
volatile uint8_t exitflag = 0;
}
