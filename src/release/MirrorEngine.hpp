/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_MirrorEngine_hpp
#define ocmirror_release_MirrorEngine_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "registry/RegistryClient.hpp"
#include "release/Metadata.hpp"


namespace ocmirror {
namespace release {

/**
 * Replicates a resolved release or operator index to a destination.
 *
 * Blobs are pushed first, once per destination repository and digest, then
 * the image manifests, then the manifest lists, and finally the root manifest
 * at the destination reference. A failed push aborts the operation and leaves
 * the destination incomplete. In dry-run mode nothing is written.
 */
class MirrorEngine {
public:
    MirrorEngine(std::shared_ptr<const common::Config> config, std::shared_ptr<registry::RegistryClient> client);

    void putRelease(const common::ImageReference& destination, const ReleaseMetadata& metadata, bool dryRun) const;
    void putOperators(const common::ImageReference& destination, const OperatorMetadata& metadata, bool dryRun) const;

private:
    struct BlobCopy {
        common::ImageReference source;
        common::ImageReference destination;
        std::string digest;
    };
    struct ManifestCopy {
        common::ImageReference destination;
        const registry::ManifestDoc* manifest;
    };

    void put(const common::ImageReference& root,
             const std::string& rootDigest,
             const common::ImageReference& destination,
             const ImageGraph& graph,
             bool dryRun) const;
    std::vector<BlobCopy> planBlobCopies(const common::ImageReference& root,
                                         const common::ImageReference& destination,
                                         const ImageGraph& graph) const;
    void copyBlob(const BlobCopy& copy, bool dryRun) const;
    void pushManifests(const std::vector<ManifestCopy>& copies, bool dryRun) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<registry::RegistryClient> client;
    const std::string sysname = "MirrorEngine";
};

}
}

#endif
