/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of rindex and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef RINDEX_SUBCALL_DISPATCH_HPP
#define RINDEX_SUBCALL_DISPATCH_HPP

#include <iosfwd>
#include <memory>
#include <string>

#include "subcall/subcall.hpp"

namespace subcall {

void show_version(std::ostream& _str);
void show_usage(std::ostream& _str);

// nullptr for an unknown subcommand name
std::unique_ptr<subcall> make_subcall(const std::string& name);

/**
 * Command line entry point. A leading subcommand name is consumed,
 * anything else runs compute.
 * @return 0 on success, 1 on any error (logged)
 */
int dispatch(int argc, char** argv);

} // namespace subcall

#endif // RINDEX_SUBCALL_DISPATCH_HPP
