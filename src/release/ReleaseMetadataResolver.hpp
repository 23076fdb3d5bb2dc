/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_ReleaseMetadataResolver_hpp
#define ocmirror_release_ReleaseMetadataResolver_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "registry/RegistryClient.hpp"
#include "release/EndpointTranslator.hpp"
#include "release/Metadata.hpp"
#include "release/SignatureVerifier.hpp"


namespace ocmirror {
namespace release {

/**
 * Discovers the manifests and blobs making up an OpenShift release image.
 *
 * The release image carries, in its layers, the "image-references"
 * ImageStream naming every component image of the release, and optionally
 * the ConfigMap with the stores and keys to verify the release with.
 */
class ReleaseMetadataResolver {
public:
    struct Component {
        std::string name;
        common::ImageReference reference;
    };

    static const std::string IMAGE_REFERENCES_PATH;
    static const std::string RELEASE_METADATA_PATH;

public:
    ReleaseMetadataResolver(std::shared_ptr<const common::Config> config,
                            std::shared_ptr<registry::RegistryClient> client,
                            std::shared_ptr<const SignatureVerifier> verifier);

    ReleaseMetadata resolve(const common::ImageReference& reference,
                            const EndpointTranslator& translator,
                            const std::vector<std::string>& signatureStores,
                            const std::vector<std::string>& signingKeys,
                            bool verify) const;

    // image-references document of the release once mirrored to the destination
    std::string translate(const common::ImageReference& destination, const ReleaseMetadata& metadata) const;

    static std::vector<Component> parseImageReferences(const std::string& document);

private:
    void readReleaseFiles(const common::ImageReference& reference,
                          const registry::ManifestDoc& manifest,
                          ReleaseMetadata& metadata) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<registry::RegistryClient> client;
    std::shared_ptr<const SignatureVerifier> verifier;
    const std::string sysname = "ReleaseResolver";
};

}
}

#endif
