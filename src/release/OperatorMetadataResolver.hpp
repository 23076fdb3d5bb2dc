/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_OperatorMetadataResolver_hpp
#define ocmirror_release_OperatorMetadataResolver_hpp

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "common/PackageChannel.hpp"
#include "registry/RegistryClient.hpp"
#include "release/EndpointTranslator.hpp"
#include "release/IndexDatabase.hpp"
#include "release/Metadata.hpp"
#include "release/SignatureVerifier.hpp"


namespace ocmirror {
namespace release {

/**
 * Resolves the bundles selected from an operator catalog index image,
 * together with their related images.
 */
class OperatorMetadataResolver {
public:
    static const std::string RELATED_IMAGES_LABEL;

public:
    OperatorMetadataResolver(std::shared_ptr<const common::Config> config,
                             std::shared_ptr<registry::RegistryClient> client,
                             std::shared_ptr<const SignatureVerifier> verifier);

    OperatorMetadata resolve(const common::ImageReference& reference,
                             const common::PackageChannels& packageChannels,
                             const EndpointTranslator& translator,
                             const std::vector<std::string>& signatureStores,
                             const std::vector<std::string>& signingKeys,
                             bool verify) const;

    // Labels of an image configuration (docker or OCI)
    static std::map<std::string, std::string> parseImageLabels(const std::string& imageConfig);
    // image names listed in a related-images label
    static std::vector<std::string> parseRelatedImagesLabel(const std::string& label);

private:
    std::string readIndexDatabase(const common::ImageReference& reference, const registry::ManifestDoc& manifest) const;
    OperatorRecord selectBundle(const IndexDatabase& database,
                                const std::string& package,
                                const common::PackageChannel& channel,
                                const EndpointTranslator& translator) const;
    void collectBundle(OperatorRecord& record,
                       const EndpointTranslator& translator,
                       const registry::Platform& platform,
                       ImageGraph& graph) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<registry::RegistryClient> client;
    std::shared_ptr<const SignatureVerifier> verifier;
    const std::string sysname = "OperatorResolver";
};

}
}

#endif
