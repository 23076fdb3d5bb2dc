/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_AtomicSigner_hpp
#define ocmirror_signature_AtomicSigner_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "signature/GpgEngine.hpp"
#include "signature/SignatureStore.hpp"
#include "signature/VerificationResult.hpp"


namespace ocmirror {
namespace signature {

/**
 * Creates and verifies atomic container signatures kept in signature stores
 * at <location>/sha256=<hex>/signature-<n>, with ordinals starting at 1.
 */
class AtomicSigner {
public:
    struct SigningIdentity {
        std::string keyId;
        std::string passphrase;
    };

public:
    AtomicSigner(std::shared_ptr<const common::Config> config,
                 std::shared_ptr<GpgEngine> gpg,
                 std::shared_ptr<SignatureStore> store,
                 std::vector<std::string> locations);

    void setSigningIdentity(const SigningIdentity&);

    /**
     * Signs the digest and publishes the signature to every location, in the
     * first free ordinal of each. Returns the URL of the first published copy.
     */
    std::string atomicsign(const std::string& digest, const common::ImageReference& reference);

    /**
     * Returns the first valid signature of the digest found in the locations,
     * otherwise the last one examined. Empty when no location holds any signature.
     */
    boost::optional<VerificationResult> atomicverify(const std::string& digest, const common::ImageReference& reference);

    static std::string makeSignatureUrl(const std::string& location, const std::string& digest, int ordinal);

private:
    boost::optional<VerificationResult> verifyLocation(const std::string& location, const std::string& digest) const;
    VerificationResult verifySignature(const std::string& signedContent, const std::string& digest, const std::string& url) const;
    int findFreeOrdinal(const std::string& location, const std::string& digest) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<GpgEngine> gpg;
    std::shared_ptr<SignatureStore> store;
    std::vector<std::string> locations;
    boost::optional<SigningIdentity> signingIdentity;
    GpgTrust trustThreshold;
    const std::string sysname = "AtomicSigner";
};

}
}

#endif
