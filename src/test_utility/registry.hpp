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
 * @brief In-memory registry and builders of images, layers and operator
 * index databases.
 */

#ifndef ocmirror_test_utility_registry_hpp
#define ocmirror_test_utility_registry_hpp

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

#include "common/ImageReference.hpp"
#include "registry/Manifest.hpp"
#include "registry/RegistryClient.hpp"

namespace test_utility {
namespace registry {

/**
 * Registry keeping blobs and manifests per repository (server/repository).
 * Pushes can be made to fail after a given number of successful ones.
 */
class InMemoryRegistry : public ocmirror::registry::RegistryClient {
public:
    ocmirror::registry::ManifestDoc fetchManifest(const ocmirror::common::ImageReference& reference) override;
    std::string fetchBlob(const ocmirror::common::ImageReference& repository, const std::string& digest) override;
    bool blobExists(const ocmirror::common::ImageReference& repository, const std::string& digest) override;
    void pushBlob(const ocmirror::common::ImageReference& repository, const std::string& digest, const std::string& content) override;
    void pushManifest(const ocmirror::common::ImageReference& reference, const ocmirror::registry::ManifestDoc& manifest) override;

    // returns the digest of the blob
    std::string addBlob(const ocmirror::common::ImageReference& repository, const std::string& content);
    void addManifest(const ocmirror::common::ImageReference& reference, const ocmirror::registry::ManifestDoc& manifest);

    void failPushesAfter(int successfulPushes);

    std::set<std::string> getBlobDigests(const ocmirror::common::ImageReference& repository) const;
    bool hasManifest(const ocmirror::common::ImageReference& reference) const;
    std::vector<ocmirror::common::ImageReference> getPushedManifests() const;
    int getNumberOfBlobPushes() const;
    int getNumberOfBlobFetches() const;

private:
    void countPush();
    static std::string makeManifestKey(const ocmirror::common::ImageReference& reference);

private:
    mutable std::mutex mutex;
    std::map<std::string, std::map<std::string, std::string>> blobs;
    std::map<std::string, std::map<std::string, ocmirror::registry::ManifestDoc>> manifests;
    std::vector<ocmirror::common::ImageReference> pushedManifests;
    int blobPushes = 0;
    int blobFetches = 0;
    int pushes = 0;
    int maxPushes = -1;
};

// gzip-compressed tar archive holding the given regular files (path -> content)
std::string makeLayer(const std::map<std::string, std::string>& files);

// docker image configuration with the given labels
std::string makeImageConfig(const std::map<std::string, std::string>& labels = {},
                            const std::string& os = "linux",
                            const std::string& architecture = "amd64");

/**
 * Adds the config and layers as blobs of the reference's repository and
 * a docker schema2 manifest referencing them, tagged when the reference
 * has a tag. Returns the manifest.
 */
ocmirror::registry::ManifestDoc addImage(InMemoryRegistry& registry,
                                         const ocmirror::common::ImageReference& reference,
                                         const std::vector<std::string>& layers,
                                         const std::string& config = makeImageConfig());

// adds a docker manifest list of manifests already in the reference's repository
ocmirror::registry::ManifestDoc addManifestList(InMemoryRegistry& registry,
                                                const ocmirror::common::ImageReference& reference,
                                                const std::vector<std::pair<ocmirror::registry::Platform, ocmirror::registry::ManifestDoc>>& manifests);

// tables of the operator index database read by ocmirror
extern const std::string INDEX_DATABASE_SCHEMA;

// runs the SQL statements on a new database created at the path; returns the database file
std::string makeIndexDatabase(const boost::filesystem::path& file, const std::string& statements);

}
}

#endif
