/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/Metadata.hpp"

#include <algorithm>


namespace ocmirror {
namespace release {

common::ImageReference mapToDestination(const common::ImageReference& reference,
                                        const common::ImageReference& root,
                                        const common::ImageReference& destination) {
    auto mapped = reference.withServer(destination.getServer());
    if(reference.getRepository() == root.getRepository()) {
        mapped = mapped.withRepository(destination.getRepository());
    }
    return mapped;
}

void appendMissing(std::vector<std::string>& to, const std::vector<std::string>& from) {
    for(const auto& element : from) {
        if(std::find(to.cbegin(), to.cend(), element) == to.cend()) {
            to.push_back(element);
        }
    }
}

}
}
