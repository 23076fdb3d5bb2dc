/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_digest_hpp
#define libocmirror_utility_digest_hpp

#include <string>

/**
 * Utility functions for content-addressed digests ("algorithm:hex")
 */

namespace libocmirror {
namespace digest {

std::string computeSha256(const std::string& content);
bool isValid(const std::string& digest);
std::string getAlgorithm(const std::string& digest);
std::string getHex(const std::string& digest);
void verifyContent(const std::string& content, const std::string& expectedDigest);

}}

#endif
