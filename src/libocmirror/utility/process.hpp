/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_process_hpp
#define libocmirror_utility_process_hpp

#include <string>
#include <iostream>

#include "libocmirror/CLIArguments.hpp"

/**
 * Utility functions for subprocess handling
 */

namespace libocmirror {
namespace process {

int forkExecWait(const CLIArguments& args, std::iostream* const childStdoutStream = nullptr);
std::string getHostname();

}}

#endif
