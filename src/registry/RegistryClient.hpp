/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_RegistryClient_hpp
#define ocmirror_registry_RegistryClient_hpp

#include <string>

#include "common/ImageReference.hpp"
#include "registry/Manifest.hpp"


namespace ocmirror {
namespace registry {

/**
 * Transport to a container registry. Implementations must be safe to call
 * from several threads at once, since resolution and mirroring fan out over
 * a worker pool. Failures are reported as libocmirror::Error with kind
 * Transport (or ReferenceResolution when the registry reports the
 * requested manifest does not exist).
 */
class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    // the returned document is verified against the reference's digest, if any
    virtual ManifestDoc fetchManifest(const common::ImageReference& reference) = 0;
    virtual std::string fetchBlob(const common::ImageReference& repository, const std::string& digest) = 0;
    virtual bool blobExists(const common::ImageReference& repository, const std::string& digest) = 0;
    virtual void pushBlob(const common::ImageReference& repository, const std::string& digest, const std::string& content) = 0;
    // pushed at the reference's tag, or at its digest when it has no tag
    virtual void pushManifest(const common::ImageReference& reference, const ManifestDoc& manifest) = 0;
};

}
}

#endif
