/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry.hpp"

#include <cstdint>
#include <memory>

#include <archive.h>
#include <archive_entry.h>
#include <boost/format.hpp>
#include <rapidjson/document.h>
#include <sqlite3.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/digest.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "libocmirror/utility/json.hpp"

using namespace ocmirror;

namespace test_utility {
namespace registry {

std::string InMemoryRegistry::makeManifestKey(const common::ImageReference& reference) {
    return reference.getDigest().empty() ? reference.getTag() : reference.getDigest();
}

ocmirror::registry::ManifestDoc InMemoryRegistry::fetchManifest(const common::ImageReference& reference) {
    std::lock_guard<std::mutex> lock{mutex};
    auto repository = manifests.find(reference.getFullName());
    if(repository != manifests.cend()) {
        auto manifest = repository->second.find(makeManifestKey(reference));
        if(manifest != repository->second.cend()) {
            return manifest->second;
        }
    }
    auto message = boost::format("manifest unknown: %s") % reference;
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
}

std::string InMemoryRegistry::fetchBlob(const common::ImageReference& repository, const std::string& digest) {
    std::lock_guard<std::mutex> lock{mutex};
    ++blobFetches;
    auto repositoryBlobs = blobs.find(repository.getFullName());
    if(repositoryBlobs != blobs.cend()) {
        auto blob = repositoryBlobs->second.find(digest);
        if(blob != repositoryBlobs->second.cend()) {
            return blob->second;
        }
    }
    auto message = boost::format("blob unknown: %s in %s") % digest % repository.getFullName();
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
}

bool InMemoryRegistry::blobExists(const common::ImageReference& repository, const std::string& digest) {
    std::lock_guard<std::mutex> lock{mutex};
    auto repositoryBlobs = blobs.find(repository.getFullName());
    return repositoryBlobs != blobs.cend() && repositoryBlobs->second.count(digest) > 0;
}

void InMemoryRegistry::pushBlob(const common::ImageReference& repository, const std::string& digest, const std::string& content) {
    std::lock_guard<std::mutex> lock{mutex};
    countPush();
    if(libocmirror::digest::computeSha256(content) != digest) {
        auto message = boost::format("digest invalid: %s") % digest;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
    }
    blobs[repository.getFullName()][digest] = content;
    ++blobPushes;
}

void InMemoryRegistry::pushManifest(const common::ImageReference& reference, const ocmirror::registry::ManifestDoc& manifest) {
    std::lock_guard<std::mutex> lock{mutex};
    countPush();
    for(const auto& digest : manifest.getBlobDigests()) {
        if(blobs[reference.getFullName()].count(digest) == 0) {
            auto message = boost::format("blob unknown: manifest %s references %s") % reference % digest;
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
        }
    }
    for(const auto& child : manifest.getManifests()) {
        if(manifests[reference.getFullName()].count(child.digest) == 0) {
            auto message = boost::format("manifest unknown: list %s references %s") % reference % child.digest;
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
        }
    }
    auto& repository = manifests[reference.getFullName()];
    repository[manifest.getDigest()] = manifest;
    if(!reference.getTag().empty()) {
        repository[reference.getTag()] = manifest;
    }
    pushedManifests.push_back(reference);
}

void InMemoryRegistry::countPush() {
    if(maxPushes >= 0 && pushes >= maxPushes) {
        OCMIRROR_THROW_ERROR_OF_KIND("push refused by the registry", libocmirror::ErrorKind::Transport);
    }
    ++pushes;
}

std::string InMemoryRegistry::addBlob(const common::ImageReference& repository, const std::string& content) {
    auto digest = libocmirror::digest::computeSha256(content);
    std::lock_guard<std::mutex> lock{mutex};
    blobs[repository.getFullName()][digest] = content;
    return digest;
}

void InMemoryRegistry::addManifest(const common::ImageReference& reference, const ocmirror::registry::ManifestDoc& manifest) {
    std::lock_guard<std::mutex> lock{mutex};
    auto& repository = manifests[reference.getFullName()];
    repository[manifest.getDigest()] = manifest;
    if(!reference.getTag().empty()) {
        repository[reference.getTag()] = manifest;
    }
}

void InMemoryRegistry::failPushesAfter(int successfulPushes) {
    std::lock_guard<std::mutex> lock{mutex};
    pushes = 0;
    maxPushes = successfulPushes;
}

std::set<std::string> InMemoryRegistry::getBlobDigests(const common::ImageReference& repository) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto digests = std::set<std::string>{};
    auto repositoryBlobs = blobs.find(repository.getFullName());
    if(repositoryBlobs != blobs.cend()) {
        for(const auto& blob : repositoryBlobs->second) {
            digests.insert(blob.first);
        }
    }
    return digests;
}

bool InMemoryRegistry::hasManifest(const common::ImageReference& reference) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto repository = manifests.find(reference.getFullName());
    return repository != manifests.cend() && repository->second.count(makeManifestKey(reference)) > 0;
}

std::vector<common::ImageReference> InMemoryRegistry::getPushedManifests() const {
    std::lock_guard<std::mutex> lock{mutex};
    return pushedManifests;
}

int InMemoryRegistry::getNumberOfBlobPushes() const {
    std::lock_guard<std::mutex> lock{mutex};
    return blobPushes;
}

int InMemoryRegistry::getNumberOfBlobFetches() const {
    std::lock_guard<std::mutex> lock{mutex};
    return blobFetches;
}

static la_ssize_t appendToString(struct archive*, void* clientData, const void* buffer, size_t length) {
    static_cast<std::string*>(clientData)->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

std::string makeLayer(const std::map<std::string, std::string>& files) {
    auto layer = std::string{};
    auto writer = std::unique_ptr<struct archive, int(*)(struct archive*)>{archive_write_new(), archive_write_free};
    archive_write_add_filter_gzip(writer.get());
    archive_write_set_format_pax_restricted(writer.get());
    if(archive_write_open(writer.get(), &layer, nullptr, appendToString, nullptr) != ARCHIVE_OK) {
        auto message = boost::format("Failed to create layer archive: %s") % archive_error_string(writer.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    for(const auto& file : files) {
        auto entry = std::unique_ptr<struct archive_entry, void(*)(struct archive_entry*)>{archive_entry_new(), archive_entry_free};
        archive_entry_set_pathname(entry.get(), file.first.c_str());
        archive_entry_set_size(entry.get(), file.second.size());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        if(archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK
           || archive_write_data(writer.get(), file.second.data(), file.second.size()) < 0) {
            auto message = boost::format("Failed to add %s to layer archive: %s") % file.first % archive_error_string(writer.get());
            OCMIRROR_THROW_ERROR(message.str());
        }
    }

    if(archive_write_close(writer.get()) != ARCHIVE_OK) {
        auto message = boost::format("Failed to close layer archive: %s") % archive_error_string(writer.get());
        OCMIRROR_THROW_ERROR(message.str());
    }
    return layer;
}

std::string makeImageConfig(const std::map<std::string, std::string>& labels,
                            const std::string& os,
                            const std::string& architecture) {
    auto json = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = json.GetAllocator();

    auto jsonLabels = rapidjson::Value{rapidjson::kObjectType};
    for(const auto& label : labels) {
        jsonLabels.AddMember(rapidjson::Value{label.first.c_str(), allocator},
                             rapidjson::Value{label.second.c_str(), allocator},
                             allocator);
    }
    auto config = rapidjson::Value{rapidjson::kObjectType};
    config.AddMember("Labels", jsonLabels, allocator);

    json.AddMember("architecture", rapidjson::Value{architecture.c_str(), allocator}, allocator);
    json.AddMember("os", rapidjson::Value{os.c_str(), allocator}, allocator);
    json.AddMember("config", config, allocator);
    return libocmirror::json::serialize(json);
}

static rapidjson::Value makeDescriptor(const std::string& mediaType, const std::string& content, rapidjson::Document::AllocatorType& allocator) {
    auto descriptor = rapidjson::Value{rapidjson::kObjectType};
    descriptor.AddMember("mediaType", rapidjson::Value{mediaType.c_str(), allocator}, allocator);
    descriptor.AddMember("size", static_cast<int64_t>(content.size()), allocator);
    auto digest = libocmirror::digest::computeSha256(content);
    descriptor.AddMember("digest", rapidjson::Value{digest.c_str(), allocator}, allocator);
    return descriptor;
}

ocmirror::registry::ManifestDoc addImage(InMemoryRegistry& registry,
                                         const common::ImageReference& reference,
                                         const std::vector<std::string>& layers,
                                         const std::string& config) {
    auto json = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = json.GetAllocator();
    json.AddMember("schemaVersion", 2, allocator);
    json.AddMember("mediaType", rapidjson::Value{ocmirror::registry::mediatype::DOCKER_MANIFEST_V2.c_str(), allocator}, allocator);

    registry.addBlob(reference, config);
    json.AddMember("config", makeDescriptor("application/vnd.docker.container.image.v1+json", config, allocator), allocator);

    auto jsonLayers = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& layer : layers) {
        registry.addBlob(reference, layer);
        jsonLayers.PushBack(makeDescriptor("application/vnd.docker.image.rootfs.diff.tar.gzip", layer, allocator), allocator);
    }
    json.AddMember("layers", jsonLayers, allocator);

    auto manifest = ocmirror::registry::ManifestDoc{libocmirror::json::serialize(json), ocmirror::registry::mediatype::DOCKER_MANIFEST_V2};
    registry.addManifest(reference, manifest);
    return manifest;
}

ocmirror::registry::ManifestDoc addManifestList(InMemoryRegistry& registry,
                                                const common::ImageReference& reference,
                                                const std::vector<std::pair<ocmirror::registry::Platform, ocmirror::registry::ManifestDoc>>& manifests) {
    auto json = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = json.GetAllocator();
    json.AddMember("schemaVersion", 2, allocator);
    json.AddMember("mediaType", rapidjson::Value{ocmirror::registry::mediatype::DOCKER_MANIFEST_LIST_V2.c_str(), allocator}, allocator);

    auto jsonManifests = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& entry : manifests) {
        const auto& platform = entry.first;
        auto descriptor = makeDescriptor(entry.second.getMediaType(), entry.second.getRaw(), allocator);
        auto jsonPlatform = rapidjson::Value{rapidjson::kObjectType};
        jsonPlatform.AddMember("architecture", rapidjson::Value{platform.architecture.c_str(), allocator}, allocator);
        jsonPlatform.AddMember("os", rapidjson::Value{platform.os.c_str(), allocator}, allocator);
        if(!platform.variant.empty()) {
            jsonPlatform.AddMember("variant", rapidjson::Value{platform.variant.c_str(), allocator}, allocator);
        }
        descriptor.AddMember("platform", jsonPlatform, allocator);
        jsonManifests.PushBack(descriptor, allocator);
    }
    json.AddMember("manifests", jsonManifests, allocator);

    auto list = ocmirror::registry::ManifestDoc{libocmirror::json::serialize(json), ocmirror::registry::mediatype::DOCKER_MANIFEST_LIST_V2};
    registry.addManifest(reference, list);
    return list;
}

const std::string INDEX_DATABASE_SCHEMA =
    "CREATE TABLE package (name TEXT PRIMARY KEY, default_channel TEXT);"
    "CREATE TABLE channel (name TEXT, package_name TEXT, head_operatorbundle_name TEXT, PRIMARY KEY(name, package_name));"
    "CREATE TABLE channel_entry (entry_id INTEGER PRIMARY KEY, channel_name TEXT, package_name TEXT,"
    " operatorbundle_name TEXT, replaces INTEGER, depth INTEGER);"
    "CREATE TABLE operatorbundle (name TEXT PRIMARY KEY, csv TEXT, bundle TEXT, bundlepath TEXT,"
    " version TEXT, skiprange TEXT, replaces TEXT, skips TEXT);"
    "CREATE TABLE related_image (image TEXT, operatorbundle_name TEXT);";

std::string makeIndexDatabase(const boost::filesystem::path& file, const std::string& statements) {
    {
        sqlite3* handle = nullptr;
        auto rc = sqlite3_open(file.string().c_str(), &handle);
        auto db = std::unique_ptr<sqlite3, int(*)(sqlite3*)>{handle, sqlite3_close};
        if(rc != SQLITE_OK) {
            auto message = boost::format("Failed to create database %s") % file;
            OCMIRROR_THROW_ERROR(message.str());
        }
        char* error = nullptr;
        if(sqlite3_exec(db.get(), statements.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
            auto message = boost::format("Failed to populate database %s: %s") % file % (error ? error : "unknown error");
            sqlite3_free(error);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
    return libocmirror::filesystem::readFile(file);
}

}
}
