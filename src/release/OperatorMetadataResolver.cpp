/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/OperatorMetadataResolver.hpp"

#include <algorithm>

#include <boost/algorithm/string/join.hpp>
#include <rapidjson/document.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/utility/concurrency.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "libocmirror/utility/json.hpp"
#include "registry/Utility.hpp"
#include "release/LayerArchive.hpp"


namespace ocmirror {
namespace release {

const std::string OperatorMetadataResolver::RELATED_IMAGES_LABEL{"operators.operatorframework.io.bundle.related-images"};

static void addRelatedImage(OperatorRecord& record, const common::ImageReference& image) {
    const auto& images = record.relatedImages;
    if(std::find(images.cbegin(), images.cend(), image) == images.cend()) {
        record.relatedImages.push_back(image);
    }
}

OperatorMetadataResolver::OperatorMetadataResolver(std::shared_ptr<const common::Config> config,
                                                   std::shared_ptr<registry::RegistryClient> client,
                                                   std::shared_ptr<const SignatureVerifier> verifier)
    : config{std::move(config)}
    , client{std::move(client)}
    , verifier{std::move(verifier)}
{}

OperatorMetadata OperatorMetadataResolver::resolve(const common::ImageReference& reference,
                                                   const common::PackageChannels& packageChannels,
                                                   const EndpointTranslator& translator,
                                                   const std::vector<std::string>& signatureStores,
                                                   const std::vector<std::string>& signingKeys,
                                                   bool verify) const {
    printLog(boost::format("Resolving operator index %s") % reference, libocmirror::LogLevel::INFO);

    auto metadata = OperatorMetadata{};
    metadata.reference = reference;
    metadata.signatureStores = signatureStores;
    metadata.signingKeys = signingKeys;

    auto platform = registry::utility::getTargetPlatform(*config);
    auto rootLabel = reference.getTag().empty() ? reference.getDigest() : reference.getTag();
    auto index = collectImage(*client, reference, rootLabel, platform, metadata);
    metadata.manifestDigest = index.manifest.getDigest();
    printLog(boost::format("> %-15.15s: %s") % "index" % metadata.manifestDigest, libocmirror::LogLevel::GENERAL);

    if(verify) {
        verifier->verify(metadata.manifestDigest, reference, metadata.signatureStores, metadata.signingKeys);
    }
    else {
        printLog(boost::format("Skipping signature verification of %s") % reference, libocmirror::LogLevel::WARN);
    }

    metadata.indexDatabase = readIndexDatabase(reference, index.platformManifest);

    // SQLite reads from a file
    auto workDir = libocmirror::PathRAII{libocmirror::filesystem::makeTemporaryDirectory(config->getTempDir(), "ocmirror-index")};
    auto databaseFile = workDir.getPath() / "index.db";
    libocmirror::filesystem::writeFile(metadata.indexDatabase, databaseFile);
    auto database = IndexDatabase{databaseFile};

    for(const auto& packageChannel : packageChannels) {
        metadata.operators.push_back(selectBundle(database, packageChannel.first, packageChannel.second, translator));
    }

    auto graphs = std::vector<ImageGraph>(metadata.operators.size());
    libocmirror::concurrency::forEachIndex(metadata.operators.size(), config->getConcurrency(), [&](size_t i) {
        collectBundle(metadata.operators[i], translator, platform, graphs[i]);
    });
    for(const auto& graph : graphs) {
        metadata.merge(graph);
    }

    printLog(boost::format("> %-15.15s: %d") % "blobs" % metadata.blobs.size(), libocmirror::LogLevel::GENERAL);
    printLog(boost::format("> %-15.15s: %d") % "manifests" % metadata.manifests.size(), libocmirror::LogLevel::GENERAL);
    return metadata;
}

std::string OperatorMetadataResolver::readIndexDatabase(const common::ImageReference& reference, const registry::ManifestDoc& manifest) const {
    auto imageConfig = client->fetchBlob(reference, manifest.getConfig().digest);
    auto labels = parseImageLabels(imageConfig);

    auto path = IndexDatabase::DEFAULT_PATH;
    auto label = labels.find(IndexDatabase::LABEL);
    if(label != labels.cend() && !label->second.empty()) {
        path = layer::normalizeEntryPath(label->second);
    }
    printLog(boost::format("> %-15.15s: %s") % "database" % path, libocmirror::LogLevel::INFO);

    // files in upper layers hide those in lower layers
    const auto& layers = manifest.getLayers();
    for(auto layer = layers.crbegin(); layer != layers.crend(); ++layer) {
        auto content = client->fetchBlob(reference, layer->digest);
        auto files = layer::extractFiles(content, {path});
        if(!files.empty()) {
            return files.cbegin()->second;
        }
    }

    auto message = boost::format("%s is not an operator index image: %s was not found in its layers") % reference % path;
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
}

OperatorRecord OperatorMetadataResolver::selectBundle(const IndexDatabase& database,
                                                      const std::string& package,
                                                      const common::PackageChannel& channel,
                                                      const EndpointTranslator& translator) const {
    if(!database.hasPackage(package)) {
        auto message = boost::format("Package %s was not found in the operator index") % package;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::PackageNotFound);
    }

    auto record = OperatorRecord{};
    record.package = package;

    if(common::isDefaultChannel(channel)) {
        auto defaultChannel = database.getDefaultChannel(package);
        if(!defaultChannel) {
            auto message = boost::format("Package %s has no default channel") % package;
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ChannelNotFound);
        }
        record.channel = *defaultChannel;
    }
    else {
        record.channel = boost::get<common::ExplicitChannel>(channel).name;
        auto channels = database.getChannels(package);
        if(std::find(channels.cbegin(), channels.cend(), record.channel) == channels.cend()) {
            auto message = boost::format("Channel %s was not found for package %s (available channels: %s)")
                % record.channel % package % boost::algorithm::join(channels, ", ");
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ChannelNotFound);
        }
    }

    auto head = database.getChannelHead(package, record.channel);
    if(!head) {
        auto message = boost::format("Channel %s of package %s has no head bundle") % record.channel % package;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ChannelNotFound);
    }
    record.bundleName = *head;
    record.bundleImage = translator.translate(common::ImageReference::parse(database.getBundlePath(record.bundleName)));

    for(const auto& image : database.getRelatedImages(record.bundleName)) {
        addRelatedImage(record, translator.translate(common::ImageReference::parse(image)));
    }

    printLog(boost::format("> %-15.15s: %s (channel %s, bundle %s)") % package % record.bundleImage % record.channel % record.bundleName,
             libocmirror::LogLevel::GENERAL);
    return record;
}

void OperatorMetadataResolver::collectBundle(OperatorRecord& record,
                                             const EndpointTranslator& translator,
                                             const registry::Platform& platform,
                                             ImageGraph& graph) const {
    auto bundle = collectImage(*client, record.bundleImage, record.bundleName, platform, graph);

    auto imageConfig = client->fetchBlob(record.bundleImage, bundle.platformManifest.getConfig().digest);
    auto labels = parseImageLabels(imageConfig);
    auto label = labels.find(RELATED_IMAGES_LABEL);
    if(label != labels.cend()) {
        for(const auto& image : parseRelatedImagesLabel(label->second)) {
            addRelatedImage(record, translator.translate(common::ImageReference::parse(image)));
        }
    }

    for(const auto& relatedImage : record.relatedImages) {
        printLog(boost::format("> %-15.15s: %s") % "related image" % relatedImage, libocmirror::LogLevel::INFO);
        try {
            collectImage(*client, relatedImage, record.bundleName, platform, graph);
        }
        catch(libocmirror::Error& e) {
            auto message = boost::format("Failed to resolve related image %s of bundle %s") % relatedImage % record.bundleName;
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }
    }
}

std::map<std::string, std::string> OperatorMetadataResolver::parseImageLabels(const std::string& imageConfig) {
    auto labels = std::map<std::string, std::string>{};
    auto json = libocmirror::json::parse(imageConfig);
    if(!json.IsObject() || !json.HasMember("config") || !json["config"].IsObject()) {
        return labels;
    }
    const auto& containerConfig = json["config"];
    if(!containerConfig.HasMember("Labels") || !containerConfig["Labels"].IsObject()) {
        return labels;
    }
    for(const auto& label : containerConfig["Labels"].GetObject()) {
        if(label.value.IsString()) {
            labels[label.name.GetString()] = label.value.GetString();
        }
    }
    return labels;
}

std::vector<std::string> OperatorMetadataResolver::parseRelatedImagesLabel(const std::string& label) {
    auto images = std::vector<std::string>{};
    try {
        auto json = libocmirror::json::parse(label);
        if(!json.IsArray()) {
            OCMIRROR_THROW_ERROR("Expected a JSON array");
        }
        for(const auto& element : json.GetArray()) {
            if(element.IsString()) {
                images.push_back(element.GetString());
            }
            else if(element.IsObject()) {
                images.push_back(libocmirror::json::getString(element, "image"));
            }
            else {
                OCMIRROR_THROW_ERROR("Expected strings or objects with an \"image\" member");
            }
        }
    }
    catch(libocmirror::Error& e) {
        e.setKind(libocmirror::ErrorKind::ReferenceResolution);
        auto message = boost::format("Failed to parse label %s") % RELATED_IMAGES_LABEL;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
    return images;
}

void OperatorMetadataResolver::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
