/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_LayerArchive_hpp
#define ocmirror_release_LayerArchive_hpp

#include <map>
#include <set>
#include <string>

#include <boost/optional.hpp>


namespace ocmirror {
namespace release {
namespace layer {

/**
 * Reads the regular files with the given paths out of an image layer
 * (tar archive, optionally compressed) held in memory. Entry paths are
 * compared without a leading "./" or "/". Paths not in the layer are
 * absent from the result.
 */
std::map<std::string, std::string> extractFiles(const std::string& layer, const std::set<std::string>& paths);

std::string normalizeEntryPath(const std::string& path);

// normalized path of an archive entry, none when the entry has no pathname
boost::optional<std::string> getEntryPath(const char* pathname);

}
}
}

#endif
