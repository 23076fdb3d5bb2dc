/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Release and operator index images published to an InMemoryRegistry.
 */

#ifndef ocmirror_test_utility_release_hpp
#define ocmirror_test_utility_release_hpp

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "common/ImageReference.hpp"
#include "registry/Manifest.hpp"
#include "test_utility/registry.hpp"

namespace test_utility {
namespace release {

struct ReleaseImage {
    ocmirror::common::ImageReference reference;
    ocmirror::registry::ManifestDoc manifest;
    std::string imageReferences;
    std::string releaseMetadata;
    // component name -> reference as listed in the image references
    std::map<std::string, ocmirror::common::ImageReference> components;
    // layer shared by the release and by every component
    std::string baseLayerDigest;
};

/**
 * Publishes under "server" the release openshift-release-dev/ocp-release:4.4.6-x86_64
 * with three components in openshift-release-dev/ocp-v4.0-art-dev: two images
 * and a manifest list for amd64 and arm64. The image references always name
 * the components on quay.io. A non-empty "configMap" is shipped as the
 * release verification ConfigMap.
 */
ReleaseImage addReleaseImage(registry::InMemoryRegistry& registry,
                             const std::string& server,
                             const std::string& configMap = "");

// verification ConfigMap declaring one store and one armored key
std::string makeVerificationConfigMap(const std::string& store, const std::string& armoredKey);

struct OperatorIndexImage {
    ocmirror::common::ImageReference reference;
    ocmirror::registry::ManifestDoc manifest;
    ocmirror::common::ImageReference bundle;
    std::vector<ocmirror::common::ImageReference> relatedImages;
};

/**
 * Publishes under "server" the index redhat/redhat-operator-index:v4.8 whose
 * database holds the package ocs-operator with the default channel
 * stable-4.8 and the channel eus-4.6, and the package orphan-operator
 * without a default channel. The stable-4.8 head bundle lists related
 * images both in its label and in the database; the eus-4.6 head bundle
 * has none. Bundles and related images are named on
 * registry.redhat.io in the database.
 */
OperatorIndexImage addOperatorIndexImage(registry::InMemoryRegistry& registry,
                                         const std::string& server,
                                         const boost::filesystem::path& workDirectory);

}
}

#endif
