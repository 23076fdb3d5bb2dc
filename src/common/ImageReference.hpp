/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_ImageReference_hpp
#define ocmirror_common_ImageReference_hpp

#include <string>
#include <ostream>


namespace ocmirror {
namespace common {

/**
 * Immutable reference to an image in a registry: server/repository[:tag][@digest].
 * The repository holds the full path below the server (e.g.
 * "openshift-release-dev/ocp-release"). Derived references are obtained
 * through the with*() functions, which never modify the original.
 */
class ImageReference {
public:
    ImageReference() = default;
    ImageReference(std::string server, std::string repository, std::string tag, std::string digest);

    static ImageReference parse(const std::string& input);

    const std::string& getServer() const { return server; }
    const std::string& getRepository() const { return repository; }
    const std::string& getTag() const { return tag; }
    const std::string& getDigest() const { return digest; }

    std::string getFullName() const;
    std::string string() const;

    ImageReference withServer(const std::string& newServer) const;
    ImageReference withRepository(const std::string& newRepository) const;
    ImageReference withTag(const std::string& newTag) const;
    ImageReference withDigest(const std::string& newDigest) const;
    ImageReference normalize() const;

    bool equalsIgnoringServer(const ImageReference&) const;

    static const std::string DEFAULT_SERVER;
    static const std::string DEFAULT_REPOSITORY_NAMESPACE;
    static const std::string DEFAULT_TAG;

private:
    std::string server;
    std::string repository;
    std::string tag;
    std::string digest;
};

bool operator==(const ImageReference&, const ImageReference&);
bool operator!=(const ImageReference&, const ImageReference&);
bool operator<(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

}
}

#endif
