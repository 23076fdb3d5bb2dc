/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef ocmirror_test_utility_config_hpp
#define ocmirror_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "libocmirror/PathRAII.hpp"
#include "common/Config.hpp"

namespace test_utility {
namespace config {

struct ConfigRAII {
    std::shared_ptr<ocmirror::common::Config> config;
    libocmirror::PathRAII prefixDir;
};

/**
 * Creates an installation prefix in a temporary directory, with an
 * etc/ocmirror.json validated against the schema shipped in the repository,
 * and returns the Config loaded from it. Signature stores and translation
 * patterns are left to the built-in defaults.
 */
ConfigRAII makeConfig();

}
}

#endif
