/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_Manifest_hpp
#define ocmirror_registry_Manifest_hpp

#include <cstdint>
#include <string>
#include <vector>

#include <boost/optional.hpp>


namespace ocmirror {
namespace registry {

namespace mediatype {

extern const std::string DOCKER_MANIFEST_V2;
extern const std::string DOCKER_MANIFEST_LIST_V2;
extern const std::string DOCKER_MANIFEST_V1;
extern const std::string DOCKER_MANIFEST_V1_SIGNED;
extern const std::string OCI_MANIFEST_V1;
extern const std::string OCI_INDEX_V1;

// value for the Accept header of manifest requests
std::string acceptedManifestTypes();

}

struct Platform {
    std::string os;
    std::string architecture;
    std::string variant;
};

struct Descriptor {
    std::string mediaType;
    std::string digest;
    std::int64_t size = 0;
    boost::optional<Platform> platform;
};

/**
 * A manifest as stored in the registry. The raw bytes are kept untouched so
 * that pushing the document elsewhere preserves its digest.
 * Supported: Docker schema2 manifests and manifest lists, OCI manifests and
 * indexes. Docker schema1 documents are rejected.
 */
class ManifestDoc {
public:
    ManifestDoc() = default;
    ManifestDoc(std::string raw, std::string mediaType = "");

    const std::string& getRaw() const { return raw; }
    const std::string& getMediaType() const { return mediaType; }
    const std::string& getDigest() const { return digest; }

    bool isList() const;
    const Descriptor& getConfig() const;
    const std::vector<Descriptor>& getLayers() const { return layers; }
    const std::vector<Descriptor>& getManifests() const { return manifests; }

    // config followed by the layers
    std::vector<std::string> getBlobDigests() const;

private:
    std::string raw;
    std::string mediaType;
    std::string digest;
    boost::optional<Descriptor> config;
    std::vector<Descriptor> layers;
    std::vector<Descriptor> manifests;
};

}
}

#endif
