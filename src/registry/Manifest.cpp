/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Manifest.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/digest.hpp"
#include "libocmirror/utility/json.hpp"


namespace ocmirror {
namespace registry {

namespace mediatype {

const std::string DOCKER_MANIFEST_V2{"application/vnd.docker.distribution.manifest.v2+json"};
const std::string DOCKER_MANIFEST_LIST_V2{"application/vnd.docker.distribution.manifest.list.v2+json"};
const std::string DOCKER_MANIFEST_V1{"application/vnd.docker.distribution.manifest.v1+json"};
const std::string DOCKER_MANIFEST_V1_SIGNED{"application/vnd.docker.distribution.manifest.v1+prettyjws"};
const std::string OCI_MANIFEST_V1{"application/vnd.oci.image.manifest.v1+json"};
const std::string OCI_INDEX_V1{"application/vnd.oci.image.index.v1+json"};

std::string acceptedManifestTypes() {
    return boost::algorithm::join(std::vector<std::string>{
        DOCKER_MANIFEST_LIST_V2, DOCKER_MANIFEST_V2, OCI_INDEX_V1, OCI_MANIFEST_V1
    }, ", ");
}

}

static void throwMalformed(const std::string& what) {
    auto message = boost::format("Malformed image manifest: %s") % what;
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
}

static const rapidjson::Value& getArrayMember(const rapidjson::Value& json, const char* name) {
    auto it = json.FindMember(name);
    if(it == json.MemberEnd() || !it->value.IsArray()) {
        throwMalformed((boost::format("member \"%s\" is missing or not an array") % name).str());
    }
    return it->value;
}

static Descriptor parseDescriptor(const rapidjson::Value& value) {
    if(!value.IsObject()) {
        throwMalformed("descriptor is not an object");
    }
    auto descriptor = Descriptor{};
    descriptor.digest = libocmirror::json::getString(value, "digest");
    if(!libocmirror::digest::isValid(descriptor.digest)) {
        auto message = boost::format("Manifest descriptor has invalid digest \"%s\"") % descriptor.digest;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }
    if(value.HasMember("mediaType") && value["mediaType"].IsString()) {
        descriptor.mediaType = value["mediaType"].GetString();
    }
    if(value.HasMember("size") && value["size"].IsInt64()) {
        descriptor.size = value["size"].GetInt64();
    }
    auto platform = value.FindMember("platform");
    if(platform != value.MemberEnd() && platform->value.IsObject()) {
        auto p = Platform{};
        p.os = libocmirror::json::getString(platform->value, "os");
        p.architecture = libocmirror::json::getString(platform->value, "architecture");
        if(platform->value.HasMember("variant")) {
            p.variant = libocmirror::json::getString(platform->value, "variant");
        }
        descriptor.platform = p;
    }
    return descriptor;
}

static std::string inferMediaType(const rapidjson::Document& json) {
    if(json.HasMember("mediaType") && json["mediaType"].IsString()) {
        return json["mediaType"].GetString();
    }
    if(json.HasMember("schemaVersion") && json["schemaVersion"].IsInt() && json["schemaVersion"].GetInt() == 1) {
        return mediatype::DOCKER_MANIFEST_V1;
    }
    // OCI documents may omit the mediaType field
    if(json.HasMember("manifests")) {
        return mediatype::OCI_INDEX_V1;
    }
    return mediatype::OCI_MANIFEST_V1;
}

ManifestDoc::ManifestDoc(std::string rawDocument, std::string type)
    : raw{std::move(rawDocument)}
{
    auto json = rapidjson::Document{};
    try {
        json = libocmirror::json::parse(raw);
    }
    catch(libocmirror::Error& e) {
        OCMIRROR_RETHROW_ERROR(e, "Failed to parse image manifest");
    }
    if(!json.IsObject()) {
        throwMalformed("document is not a JSON object");
    }

    // registries may append parameters, e.g. "; charset=utf-8"
    mediaType = type.substr(0, type.find(';'));
    if(mediaType.empty() || mediaType == "application/json" || mediaType == "text/plain") {
        mediaType = inferMediaType(json);
    }

    if(mediaType == mediatype::DOCKER_MANIFEST_V1 || mediaType == mediatype::DOCKER_MANIFEST_V1_SIGNED) {
        OCMIRROR_THROW_ERROR_OF_KIND("Docker schema1 manifests are not supported",
                                     libocmirror::ErrorKind::ReferenceResolution);
    }

    if(mediaType == mediatype::DOCKER_MANIFEST_LIST_V2 || mediaType == mediatype::OCI_INDEX_V1) {
        for(const auto& entry : getArrayMember(json, "manifests").GetArray()) {
            manifests.push_back(parseDescriptor(entry));
        }
    }
    else if(mediaType == mediatype::DOCKER_MANIFEST_V2 || mediaType == mediatype::OCI_MANIFEST_V1) {
        auto configMember = json.FindMember("config");
        if(configMember == json.MemberEnd()) {
            throwMalformed("member \"config\" is missing");
        }
        config = parseDescriptor(configMember->value);
        for(const auto& entry : getArrayMember(json, "layers").GetArray()) {
            layers.push_back(parseDescriptor(entry));
        }
    }
    else {
        auto message = boost::format("Unsupported manifest media type \"%s\"") % mediaType;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }

    digest = libocmirror::digest::computeSha256(raw);
}

bool ManifestDoc::isList() const {
    return !config;
}

const Descriptor& ManifestDoc::getConfig() const {
    if(!config) {
        auto message = boost::format("Manifest %s is a %s and has no config") % digest % mediaType;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return *config;
}

std::vector<std::string> ManifestDoc::getBlobDigests() const {
    auto digests = std::vector<std::string>{};
    if(config) {
        digests.push_back(config->digest);
    }
    for(const auto& layer : layers) {
        digests.push_back(layer.digest);
    }
    return digests;
}

}
}
