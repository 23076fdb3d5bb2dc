/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_Metadata_hpp
#define ocmirror_release_Metadata_hpp

#include <string>
#include <vector>

#include "common/ImageReference.hpp"
#include "release/ImageGraph.hpp"


namespace ocmirror {
namespace release {

/**
 * Content graph of an OpenShift release image. Built fresh by each
 * resolution and not modified once returned.
 */
struct ReleaseMetadata : ImageGraph {
    common::ImageReference reference;   // root, as requested
    std::string manifestDigest;         // digest of the root document
    std::string rawImageReferences;     // release-manifests/image-references
    std::string rawReleaseMetadata;     // release-manifests/release-metadata, empty if absent
    std::vector<std::string> signatureStores;
    std::vector<std::string> signingKeys; // armored key text
};

struct OperatorRecord {
    std::string package;
    std::string channel;
    common::ImageReference bundleImage;
    std::string bundleName;
    std::vector<common::ImageReference> relatedImages;
};

/**
 * Content graph of an operator catalog index restricted to the selected
 * packages: the index image, the bundle images and their related images.
 */
struct OperatorMetadata : ImageGraph {
    common::ImageReference reference;
    std::string manifestDigest;
    std::string indexDatabase;          // raw SQLite database
    std::vector<OperatorRecord> operators;
    std::vector<std::string> signatureStores;
    std::vector<std::string> signingKeys;
};

// where a reference of the graph rooted at "root" lands once mirrored to "destination":
// the root repository becomes the destination repository, other repositories keep
// their path on the destination server
common::ImageReference mapToDestination(const common::ImageReference& reference,
                                        const common::ImageReference& root,
                                        const common::ImageReference& destination);

// appends the elements of "from" missing in "to", keeping their order
void appendMissing(std::vector<std::string>& to, const std::vector<std::string>& from);

}
}

#endif
