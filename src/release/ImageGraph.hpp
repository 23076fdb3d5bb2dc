/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_ImageGraph_hpp
#define ocmirror_release_ImageGraph_hpp

#include <map>
#include <set>
#include <string>

#include "common/ImageReference.hpp"
#include "registry/Manifest.hpp"
#include "registry/RegistryClient.hpp"


namespace ocmirror {
namespace release {

/**
 * Manifests and content-addressed blobs reachable from a set of images.
 * Every repository in the value space of 'blobs' is the repository of a
 * key of 'manifests', and every key of 'manifests' has its document in
 * 'documents'.
 */
struct ImageGraph {
    // blob digest -> repositories the blob is referenced from
    std::map<std::string, std::set<std::string>> blobs;
    // manifest reference (by digest) -> tag label
    std::map<common::ImageReference, std::string> manifests;
    // manifest digest -> document, byte-exact as fetched
    std::map<std::string, registry::ManifestDoc> documents;

    void addManifest(const common::ImageReference& reference, const std::string& label, const registry::ManifestDoc& manifest);
    // union of manifests and of the repository sets of blobs
    void merge(const ImageGraph& other);
};

/**
 * Fetches the manifest of 'reference' into the graph under 'label'. The
 * children of a manifest list are fetched as well, so that the list can be
 * replicated. Returns the manifest for the target platform (the fetched
 * manifest itself when it is not a list).
 */
struct CollectedImage {
    registry::ManifestDoc manifest;         // as referenced, possibly a list
    registry::ManifestDoc platformManifest; // manifest of the target platform
};

// adds the manifest of the reference, and all the children of a list, to the graph
CollectedImage collectImage(registry::RegistryClient& client,
                            const common::ImageReference& reference,
                            const std::string& label,
                            const registry::Platform& platform,
                            ImageGraph& graph);

}
}

#endif
