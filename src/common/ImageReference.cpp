/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageReference.hpp"

#include <utility>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"
#include "common/regex.hpp"


namespace ocmirror {
namespace common {

const std::string ImageReference::DEFAULT_SERVER{"docker.io"};
const std::string ImageReference::DEFAULT_REPOSITORY_NAMESPACE{"library"};
const std::string ImageReference::DEFAULT_TAG{"latest"};

ImageReference::ImageReference(std::string server, std::string repository, std::string tag, std::string digest)
    : server{std::move(server)}
    , repository{std::move(repository)}
    , tag{std::move(tag)}
    , digest{std::move(digest)}
{}

/**
 * The first path component is a domain if it contains a '.' or a ':' or is
 * "localhost"; otherwise the reference lives on Docker Hub, where single
 * component names belong to the "library" namespace.
 */
static std::pair<std::string, std::string> splitName(const std::string& name) {
    auto separator = name.find('/');
    if(separator != std::string::npos) {
        auto first = name.substr(0, separator);
        if(first.find_first_of(".:") != std::string::npos || first == "localhost") {
            return {first, name.substr(separator + 1)};
        }
        return {ImageReference::DEFAULT_SERVER, name};
    }
    return {ImageReference::DEFAULT_SERVER, name};
}

ImageReference ImageReference::parse(const std::string& input) {
    libocmirror::logMessage(boost::format("Parsing image reference from string: %s") % input,
                            libocmirror::LogLevel::DEBUG);

    boost::smatch matches;
    if(!boost::regex_match(input, matches, regex::reference)) {
        auto message = boost::format("Invalid image reference '%s'") % input;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }

    auto nameAndServer = splitName(matches[1].str());
    auto tag = std::string{};
    auto digest = std::string{};

    if(matches[3].matched) {
        digest = matches[3].str();
    }
    if(matches[2].matched) {
        tag = matches[2].str();
    }
    else if(digest.empty()) {
        tag = DEFAULT_TAG;
    }

    // docker.io/ubuntu and ubuntu both denote docker.io/library/ubuntu
    if(nameAndServer.first == DEFAULT_SERVER
       && nameAndServer.second.find('/') == std::string::npos) {
        nameAndServer.second = DEFAULT_REPOSITORY_NAMESPACE + "/" + nameAndServer.second;
    }

    return ImageReference{nameAndServer.first, nameAndServer.second, tag, digest};
}

std::string ImageReference::getFullName() const {
    return server + "/" + repository;
}

std::string ImageReference::string() const {
    auto output = getFullName();
    if(!tag.empty()) {
        output += ":" + tag;
    }
    if(!digest.empty()) {
        output += "@" + digest;
    }
    return output;
}

ImageReference ImageReference::withServer(const std::string& newServer) const {
    auto output = *this;
    output.server = newServer;
    return output;
}

ImageReference ImageReference::withRepository(const std::string& newRepository) const {
    auto output = *this;
    output.repository = newRepository;
    return output;
}

ImageReference ImageReference::withTag(const std::string& newTag) const {
    auto output = *this;
    output.tag = newTag;
    return output;
}

ImageReference ImageReference::withDigest(const std::string& newDigest) const {
    auto output = *this;
    output.digest = newDigest;
    return output;
}

/**
 * Clears the tag if the digest is also present, as Docker and Podman do:
 * a digest identifies the content, the tag is ignored.
 */
ImageReference ImageReference::normalize() const {
    auto output = *this;
    if(!digest.empty() && !tag.empty()) {
        output.tag.clear();
    }
    return output;
}

bool ImageReference::equalsIgnoringServer(const ImageReference& rhs) const {
    return repository == rhs.repository
        && tag == rhs.tag
        && digest == rhs.digest;
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.string() == rhs.string();
}

bool operator!=(const ImageReference& lhs, const ImageReference& rhs) {
    return !(lhs == rhs);
}

bool operator<(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

}
}
