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
 * @brief In-memory stand-ins for the GPG engine and the signature stores.
 */

#ifndef ocmirror_test_utility_signature_hpp
#define ocmirror_test_utility_signature_hpp

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "signature/GpgEngine.hpp"
#include "signature/SignatureStore.hpp"

namespace test_utility {
namespace signature {

/**
 * Signs by prefixing the data with a header naming the signing key and a
 * checksum of the data. Keys become trusted (ULTIMATE) when imported with
 * importKey(makeArmoredKey(...)); secret keys are registered with addSecretKey().
 */
class FakeGpgEngine : public ocmirror::signature::GpgEngine {
public:
    void addSecretKey(const std::string& fingerprint, const std::string& username, const std::string& passphrase);
    static std::string makeArmoredKey(const std::string& fingerprint, const std::string& username);

    std::vector<std::string> importKey(const std::string& armoredKey) override;
    std::string sign(const std::string& data, const std::string& keyId, const std::string& passphrase) override;
    ocmirror::signature::GpgVerification verify(const std::string& signedData) override;

    int getNumberOfVerifications() const { return verifications; }

private:
    struct Key {
        std::string username;
        std::string passphrase;
        bool trusted = false;
        bool secret = false;
    };

    std::mutex mutex;
    std::map<std::string, Key> keys;
    std::atomic<int> verifications{0};
};

class InMemorySignatureStore : public ocmirror::signature::SignatureStore {
public:
    boost::optional<std::string> fetch(const std::string& url) override;
    void publish(const std::string& url, const std::string& content) override;

    std::map<std::string, std::string> getContents() const;
    std::vector<std::string> getFetchedUrls() const;

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> contents;
    std::vector<std::string> fetchedUrls;
};

}
}

#endif
