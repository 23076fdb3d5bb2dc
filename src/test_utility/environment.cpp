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

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"

namespace test_utility {
namespace environment {

void setVariable(const std::string& key, const std::string& value) {
    int overwrite = 1;
    if(setenv(key.c_str(), value.c_str(), overwrite) != 0) {
        auto message = boost::format("Failed to setenv(%s, %s, %d): %s")
            % key % value % overwrite % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

void unsetVariable(const std::string& key) {
    if(unsetenv(key.c_str()) != 0) {
        auto message = boost::format("Failed to unsetenv(%s): %s") % key % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

}
}
