/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// class
#include "subcall/dispatch.hpp"

int main(int argc, char** argv) {
    return subcall::dispatch(argc, argv);
}
