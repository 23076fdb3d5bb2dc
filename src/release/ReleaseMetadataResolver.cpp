/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/ReleaseMetadataResolver.hpp"

#include <set>

#include <rapidjson/document.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/concurrency.hpp"
#include "libocmirror/utility/json.hpp"
#include "registry/Utility.hpp"
#include "release/LayerArchive.hpp"
#include "release/VerificationConfigMap.hpp"


namespace ocmirror {
namespace release {

const std::string ReleaseMetadataResolver::IMAGE_REFERENCES_PATH{"release-manifests/image-references"};
const std::string ReleaseMetadataResolver::RELEASE_METADATA_PATH{"release-manifests/release-metadata"};

ReleaseMetadataResolver::ReleaseMetadataResolver(std::shared_ptr<const common::Config> config,
                                                 std::shared_ptr<registry::RegistryClient> client,
                                                 std::shared_ptr<const SignatureVerifier> verifier)
    : config{std::move(config)}
    , client{std::move(client)}
    , verifier{std::move(verifier)}
{}

ReleaseMetadata ReleaseMetadataResolver::resolve(const common::ImageReference& reference,
                                                 const EndpointTranslator& translator,
                                                 const std::vector<std::string>& signatureStores,
                                                 const std::vector<std::string>& signingKeys,
                                                 bool verify) const {
    printLog(boost::format("Resolving release %s") % reference, libocmirror::LogLevel::INFO);

    auto metadata = ReleaseMetadata{};
    metadata.reference = reference;
    metadata.signatureStores = signatureStores;
    metadata.signingKeys = signingKeys;

    auto platform = registry::utility::getTargetPlatform(*config);
    auto rootLabel = reference.getTag().empty() ? reference.getDigest() : reference.getTag();
    auto releaseImage = collectImage(*client, reference, rootLabel, platform, metadata);
    metadata.manifestDigest = releaseImage.manifest.getDigest();
    printLog(boost::format("> %-15.15s: %s") % "release" % metadata.manifestDigest, libocmirror::LogLevel::GENERAL);

    readReleaseFiles(reference, releaseImage.platformManifest, metadata);

    if(verify) {
        verifier->verify(metadata.manifestDigest, reference, metadata.signatureStores, metadata.signingKeys);
    }
    else {
        printLog(boost::format("Skipping signature verification of %s") % reference, libocmirror::LogLevel::WARN);
    }

    auto components = parseImageReferences(metadata.rawImageReferences);
    printLog(boost::format("> %-15.15s: %d") % "components" % components.size(), libocmirror::LogLevel::GENERAL);

    auto graphs = std::vector<ImageGraph>(components.size());
    libocmirror::concurrency::forEachIndex(components.size(), config->getConcurrency(), [&](size_t i) {
        auto componentReference = translator.translate(components[i].reference);
        printLog(boost::format("> %-15.15s: %s") % components[i].name % componentReference, libocmirror::LogLevel::INFO);
        try {
            collectImage(*client, componentReference, components[i].name, platform, graphs[i]);
        }
        catch(libocmirror::Error& e) {
            auto message = boost::format("Failed to resolve component %s of release %s") % components[i].name % reference;
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }
    });
    for(const auto& graph : graphs) {
        metadata.merge(graph);
    }

    printLog(boost::format("> %-15.15s: %d") % "blobs" % metadata.blobs.size(), libocmirror::LogLevel::GENERAL);
    printLog(boost::format("> %-15.15s: %d") % "manifests" % metadata.manifests.size(), libocmirror::LogLevel::GENERAL);
    return metadata;
}

void ReleaseMetadataResolver::readReleaseFiles(const common::ImageReference& reference,
                                               const registry::ManifestDoc& manifest,
                                               ReleaseMetadata& metadata) const {
    auto remaining = std::set<std::string>{IMAGE_REFERENCES_PATH, RELEASE_METADATA_PATH, VerificationConfigMap::PATH};
    auto files = std::map<std::string, std::string>{};

    // files in upper layers hide those in lower layers
    const auto& layers = manifest.getLayers();
    for(auto layer = layers.crbegin(); layer != layers.crend() && !remaining.empty(); ++layer) {
        auto content = client->fetchBlob(reference, layer->digest);
        for(auto& file : layer::extractFiles(content, remaining)) {
            remaining.erase(file.first);
            files.insert(std::move(file));
        }
    }

    auto imageReferences = files.find(IMAGE_REFERENCES_PATH);
    if(imageReferences == files.cend()) {
        auto message = boost::format("%s is not a release image: %s was not found in its layers")
            % reference % IMAGE_REFERENCES_PATH;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }
    metadata.rawImageReferences = imageReferences->second;

    auto releaseMetadata = files.find(RELEASE_METADATA_PATH);
    if(releaseMetadata != files.cend()) {
        metadata.rawReleaseMetadata = releaseMetadata->second;
    }

    auto configMap = files.find(VerificationConfigMap::PATH);
    if(configMap != files.cend()) {
        auto verification = VerificationConfigMap::parse(configMap->second);
        appendMissing(metadata.signatureStores, verification.signatureStores);
        appendMissing(metadata.signingKeys, verification.signingKeys);
        printLog(boost::format("Release %s declares %d signature stores and %d signing keys")
                    % reference % verification.signatureStores.size() % verification.signingKeys.size(),
                 libocmirror::LogLevel::DEBUG);
    }
}

std::vector<ReleaseMetadataResolver::Component> ReleaseMetadataResolver::parseImageReferences(const std::string& document) {
    auto components = std::vector<Component>{};
    try {
        auto json = libocmirror::json::parse(document);
        const auto& tags = libocmirror::json::getMember(libocmirror::json::getMember(json, "spec"), "tags");
        if(!tags.IsArray()) {
            OCMIRROR_THROW_ERROR("Member \"spec.tags\" is not an array");
        }
        for(const auto& tag : tags.GetArray()) {
            auto name = libocmirror::json::getString(tag, "name");
            auto from = libocmirror::json::getString(libocmirror::json::getMember(tag, "from"), "name");
            components.push_back(Component{name, common::ImageReference::parse(from)});
        }
    }
    catch(libocmirror::Error& e) {
        e.setKind(libocmirror::ErrorKind::ReferenceResolution);
        OCMIRROR_RETHROW_ERROR(e, "Failed to parse the image references of the release");
    }
    return components;
}

std::string ReleaseMetadataResolver::translate(const common::ImageReference& destination, const ReleaseMetadata& metadata) const {
    auto json = libocmirror::json::parse(metadata.rawImageReferences);
    auto& allocator = json.GetAllocator();

    if(json.HasMember("spec") && json["spec"].HasMember("tags") && json["spec"]["tags"].IsArray()) {
        for(auto& tag : json["spec"]["tags"].GetArray()) {
            if(!tag.HasMember("from") || !tag["from"].HasMember("name") || !tag["from"]["name"].IsString()) {
                continue;
            }
            auto& name = tag["from"]["name"];
            auto source = common::ImageReference::parse(name.GetString());
            auto translated = mapToDestination(source, metadata.reference, destination).string();
            printLog(boost::format("> %-15.15s: %s -> %s") % "translate" % source % translated, libocmirror::LogLevel::DEBUG);
            name.SetString(translated.c_str(), allocator);
        }
    }

    printLog(boost::format("Translated image references of %s for %s") % metadata.reference % destination, libocmirror::LogLevel::INFO);
    return libocmirror::json::serialize(json);
}

void ReleaseMetadataResolver::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
