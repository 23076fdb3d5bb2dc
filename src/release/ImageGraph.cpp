/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/ImageGraph.hpp"

#include <boost/format.hpp>

#include "libocmirror/utility/logging.hpp"
#include "registry/Utility.hpp"


namespace ocmirror {
namespace release {

void ImageGraph::addManifest(const common::ImageReference& reference, const std::string& label, const registry::ManifestDoc& manifest) {
    auto key = reference.withDigest(manifest.getDigest()).normalize();
    manifests.emplace(key, label);
    documents.emplace(manifest.getDigest(), manifest);
    for(const auto& digest : manifest.getBlobDigests()) {
        blobs[digest].insert(reference.getRepository());
    }
}

void ImageGraph::merge(const ImageGraph& other) {
    for(const auto& manifest : other.manifests) {
        manifests.insert(manifest);
    }
    for(const auto& document : other.documents) {
        documents.insert(document);
    }
    for(const auto& blob : other.blobs) {
        blobs[blob.first].insert(blob.second.cbegin(), blob.second.cend());
    }
}

CollectedImage collectImage(registry::RegistryClient& client,
                            const common::ImageReference& reference,
                            const std::string& label,
                            const registry::Platform& platform,
                            ImageGraph& graph) {
    auto manifest = client.fetchManifest(reference);
    graph.addManifest(reference, label, manifest);

    if(!manifest.isList()) {
        return CollectedImage{manifest, manifest};
    }

    auto selected = registry::utility::selectPlatformManifest(manifest, platform);
    auto platformManifest = registry::ManifestDoc{};
    for(const auto& child : manifest.getManifests()) {
        auto childManifest = client.fetchManifest(reference.withDigest(child.digest).normalize());
        graph.addManifest(reference, label, childManifest);
        if(child.digest == selected.digest) {
            platformManifest = childManifest;
        }
    }

    libocmirror::logMessage(boost::format("> %-15.15s: %s (%d platform manifests)") % "manifest list" % reference % manifest.getManifests().size(),
                            libocmirror::LogLevel::DEBUG);
    return CollectedImage{manifest, platformManifest};
}

}
}
