/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_MetadataPrinter_hpp
#define ocmirror_release_MetadataPrinter_hpp

#include <iostream>
#include <string>
#include <vector>

#include "release/Metadata.hpp"


namespace ocmirror {
namespace release {

/**
 * Prints resolved metadata as a YAML document. Blobs and manifests are always
 * listed by key; signature stores, operators and related images keep the
 * order in which they were resolved unless sorting is requested.
 */
class MetadataPrinter {
public:
    MetadataPrinter(bool sortMetadata = false);

    void print(const ReleaseMetadata& metadata, std::ostream& out = std::cout) const;
    void print(const OperatorMetadata& metadata, std::ostream& out = std::cout) const;

private:
    void printHeader(const common::ImageReference& reference,
                     const std::string& manifestDigest,
                     std::vector<std::string> signatureStores,
                     const std::vector<std::string>& signingKeys,
                     std::ostream& out) const;
    void printGraph(const ImageGraph& graph, std::ostream& out) const;

private:
    bool sortMetadata;
};

}
}

#endif
