/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_filesystem_hpp
#define libocmirror_utility_filesystem_hpp

#include <string>
#include <ios>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation
 */

namespace libocmirror {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
std::string readFile(const boost::filesystem::path& path);
void writeFile(const std::string& content,
               const boost::filesystem::path& filename,
               const std::ios_base::openmode mode = std::ios_base::out | std::ios_base::binary);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
boost::filesystem::path makeTemporaryDirectory(const boost::filesystem::path& parent, const std::string& prefix);

}}

#endif
