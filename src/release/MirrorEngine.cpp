/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/MirrorEngine.hpp"

#include <map>
#include <set>
#include <utility>
#include <vector>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/concurrency.hpp"


namespace ocmirror {
namespace release {

MirrorEngine::MirrorEngine(std::shared_ptr<const common::Config> config, std::shared_ptr<registry::RegistryClient> client)
    : config{std::move(config)}
    , client{std::move(client)}
{}

void MirrorEngine::putRelease(const common::ImageReference& destination, const ReleaseMetadata& metadata, bool dryRun) const {
    printLog(boost::format("Mirroring release %s to %s") % metadata.reference % destination, libocmirror::LogLevel::INFO);
    put(metadata.reference, metadata.manifestDigest, destination, metadata, dryRun);
}

void MirrorEngine::putOperators(const common::ImageReference& destination, const OperatorMetadata& metadata, bool dryRun) const {
    printLog(boost::format("Mirroring operator index %s to %s") % metadata.reference % destination, libocmirror::LogLevel::INFO);
    put(metadata.reference, metadata.manifestDigest, destination, metadata, dryRun);
}

void MirrorEngine::put(const common::ImageReference& root,
                       const std::string& rootDigest,
                       const common::ImageReference& destination,
                       const ImageGraph& graph,
                       bool dryRun) const {
    if(!destination.getDigest().empty() && destination.getDigest() != rootDigest) {
        auto message = boost::format("Cannot mirror %s (%s) to %s: the destination names a different digest")
            % root % rootDigest % destination;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }
    auto rootDocument = graph.documents.find(rootDigest);
    if(rootDocument == graph.documents.cend()) {
        auto message = boost::format("Manifest %s of %s was not resolved") % rootDigest % root;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }

    // plan everything before writing anything
    auto blobCopies = planBlobCopies(root, destination, graph);
    auto imageManifests = std::vector<ManifestCopy>{};
    auto manifestLists = std::vector<ManifestCopy>{};
    for(const auto& manifest : graph.manifests) {
        const auto& digest = manifest.first.getDigest();
        auto document = graph.documents.find(digest);
        if(document == graph.documents.cend()) {
            auto message = boost::format("Manifest %s was not resolved") % manifest.first;
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
        }
        auto copy = ManifestCopy{mapToDestination(manifest.first, root, destination).withTag(""), &document->second};
        if(copy.destination.getRepository() == destination.getRepository() && digest == rootDigest) {
            continue;
        }
        if(document->second.isList()) {
            manifestLists.push_back(copy);
        }
        else {
            imageManifests.push_back(copy);
        }
    }

    printLog(boost::format("> %-15.15s: %d") % "blob copies" % blobCopies.size(), libocmirror::LogLevel::GENERAL);
    printLog(boost::format("> %-15.15s: %d") % "manifests" % (imageManifests.size() + manifestLists.size() + 1), libocmirror::LogLevel::GENERAL);

    try {
        libocmirror::concurrency::forEachIndex(blobCopies.size(), config->getConcurrency(), [&](size_t i) {
            copyBlob(blobCopies[i], dryRun);
        });
        pushManifests(imageManifests, dryRun);
        pushManifests(manifestLists, dryRun);
        pushManifests({ManifestCopy{destination, &rootDocument->second}}, dryRun);
    }
    catch(libocmirror::Error& e) {
        e.setKind(libocmirror::ErrorKind::PartialMirror);
        auto message = boost::format("Failed to mirror %s to %s, the destination is left incomplete") % root % destination;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

std::vector<MirrorEngine::BlobCopy> MirrorEngine::planBlobCopies(const common::ImageReference& root,
                                                                const common::ImageReference& destination,
                                                                const ImageGraph& graph) const {
    // blob namespaces carry no server: take it from a manifest of the namespace
    // that references the blob, as the same path may exist on several servers
    auto sources = std::map<std::pair<std::string, std::string>, common::ImageReference>{};
    for(const auto& manifest : graph.manifests) {
        const auto& reference = manifest.first;
        auto document = graph.documents.find(reference.getDigest());
        if(document == graph.documents.cend()) {
            continue;
        }
        for(const auto& digest : document->second.getBlobDigests()) {
            sources.emplace(std::make_pair(reference.getRepository(), digest),
                            common::ImageReference{reference.getServer(), reference.getRepository(), "", ""});
        }
    }

    auto copies = std::vector<BlobCopy>{};
    auto planned = std::set<std::pair<std::string, std::string>>{};
    for(const auto& blob : graph.blobs) {
        for(const auto& repository : blob.second) {
            auto source = sources.find(std::make_pair(repository, blob.first));
            if(source == sources.cend()) {
                auto message = boost::format("Blob %s belongs to repository %s, which has no resolved manifest")
                    % blob.first % repository;
                OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
            }
            auto target = mapToDestination(source->second, root, destination);
            if(planned.emplace(target.getFullName(), blob.first).second) {
                copies.push_back(BlobCopy{source->second, target, blob.first});
            }
        }
    }
    return copies;
}

void MirrorEngine::copyBlob(const BlobCopy& copy, bool dryRun) const {
    if(dryRun) {
        printLog(boost::format("> %-15.15s: %s -> %s (dry run)") % copy.digest % copy.source % copy.destination, libocmirror::LogLevel::INFO);
        return;
    }
    if(client->blobExists(copy.destination, copy.digest)) {
        printLog(boost::format("> %-15.15s: %s (already present)") % copy.digest % copy.destination, libocmirror::LogLevel::DEBUG);
        return;
    }
    auto content = client->fetchBlob(copy.source, copy.digest);
    client->pushBlob(copy.destination, copy.digest, content);
    printLog(boost::format("> %-15.15s: %s -> %s") % copy.digest % copy.source % copy.destination, libocmirror::LogLevel::INFO);
}

void MirrorEngine::pushManifests(const std::vector<ManifestCopy>& copies, bool dryRun) const {
    libocmirror::concurrency::forEachIndex(copies.size(), config->getConcurrency(), [&](size_t i) {
        const auto& copy = copies[i];
        if(dryRun) {
            printLog(boost::format("> %-15.15s: %s (dry run)") % "manifest" % copy.destination, libocmirror::LogLevel::INFO);
            return;
        }
        client->pushManifest(copy.destination, *copy.manifest);
        printLog(boost::format("> %-15.15s: %s") % "manifest" % copy.destination, libocmirror::LogLevel::INFO);
    });
}

void MirrorEngine::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
