/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_test_utility_environment_hpp
#define ocmirror_test_utility_environment_hpp

#include <string>

namespace test_utility {
namespace environment {

void setVariable(const std::string& key, const std::string& value);
void unsetVariable(const std::string& key);

}
}

#endif
