/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature.hpp"

#include <iterator>
#include <sstream>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/digest.hpp"

using namespace ocmirror;

namespace test_utility {
namespace signature {

static const std::string keyHeader = "FAKE PUBLIC KEY";
static const std::string signatureHeader = "FAKE SIGNATURE";

static std::string toKeyId(const std::string& fingerprint) {
    return fingerprint.size() > 16 ? fingerprint.substr(fingerprint.size() - 16) : fingerprint;
}

void FakeGpgEngine::addSecretKey(const std::string& fingerprint, const std::string& username, const std::string& passphrase) {
    std::lock_guard<std::mutex> lock{mutex};
    auto& key = keys[fingerprint];
    key.username = username;
    key.passphrase = passphrase;
    key.secret = true;
}

std::string FakeGpgEngine::makeArmoredKey(const std::string& fingerprint, const std::string& username) {
    return keyHeader + "\n" + fingerprint + "\n" + username + "\n";
}

std::vector<std::string> FakeGpgEngine::importKey(const std::string& armoredKey) {
    auto stream = std::istringstream{armoredKey};
    std::string header, fingerprint, username;
    std::getline(stream, header);
    std::getline(stream, fingerprint);
    std::getline(stream, username);
    if(header != keyHeader || fingerprint.empty()) {
        OCMIRROR_THROW_ERROR("Failed to import GPG key: not a fake key");
    }

    std::lock_guard<std::mutex> lock{mutex};
    auto& key = keys[fingerprint];
    key.username = username;
    key.trusted = true;
    return {fingerprint};
}

std::string FakeGpgEngine::sign(const std::string& data, const std::string& keyId, const std::string& passphrase) {
    std::lock_guard<std::mutex> lock{mutex};
    auto key = keys.find(keyId);
    if(key == keys.cend() || !key->second.secret) {
        auto message = boost::format("No secret key %s") % keyId;
        OCMIRROR_THROW_ERROR(message.str());
    }
    if(key->second.passphrase != passphrase) {
        OCMIRROR_THROW_ERROR("Bad passphrase");
    }
    return signatureHeader + "\n" + keyId + "\n" + libocmirror::digest::computeSha256(data) + "\n" + data;
}

ocmirror::signature::GpgVerification FakeGpgEngine::verify(const std::string& signedData) {
    ++verifications;
    auto result = ocmirror::signature::GpgVerification{};

    auto stream = std::istringstream{signedData};
    std::string header, fingerprint, checksum;
    std::getline(stream, header);
    std::getline(stream, fingerprint);
    std::getline(stream, checksum);
    if(header != signatureHeader) {
        return result;
    }
    auto data = std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());

    std::lock_guard<std::mutex> lock{mutex};
    result.keyId = toKeyId(fingerprint);
    auto key = keys.find(fingerprint);
    if(key == keys.cend()) {
        result.status = ocmirror::signature::status::NO_PUBLIC_KEY;
        return result;
    }

    result.username = key->second.username;
    result.payload = data;
    if(libocmirror::digest::computeSha256(data) != checksum) {
        result.status = ocmirror::signature::status::SIGNATURE_BAD;
        return result;
    }

    result.status = ocmirror::signature::status::SIGNATURE_VALID;
    result.fingerprint = fingerprint;
    result.timestamp = 1600000000;
    result.trust = key->second.trusted ? ocmirror::signature::GpgTrust::ULTIMATE : ocmirror::signature::GpgTrust::UNDEFINED;
    return result;
}

boost::optional<std::string> InMemorySignatureStore::fetch(const std::string& url) {
    std::lock_guard<std::mutex> lock{mutex};
    fetchedUrls.push_back(url);
    auto it = contents.find(url);
    if(it == contents.cend()) {
        return boost::none;
    }
    return it->second;
}

void InMemorySignatureStore::publish(const std::string& url, const std::string& content) {
    std::lock_guard<std::mutex> lock{mutex};
    contents[url] = content;
}

std::map<std::string, std::string> InMemorySignatureStore::getContents() const {
    std::lock_guard<std::mutex> lock{mutex};
    return contents;
}

std::vector<std::string> InMemorySignatureStore::getFetchedUrls() const {
    std::lock_guard<std::mutex> lock{mutex};
    return fetchedUrls;
}

}
}
