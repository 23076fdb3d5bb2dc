/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <cstdlib>

#include <boost/format.hpp>

#include "libocmirror/utility/logging.hpp"

namespace libocmirror {
namespace environment {

boost::optional<std::string> lookupVariable(const std::string& key) {
    const char* p = getenv(key.c_str());
    if(p == nullptr) {
        return {};
    }
    logMessage(boost::format("Got environment variable %s=%s") % key % p, LogLevel::DEBUG);
    return std::string{p};
}

}}
