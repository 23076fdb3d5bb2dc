/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/AtomicSigner.hpp"

#include <chrono>

#include <boost/algorithm/string/predicate.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/concurrency.hpp"
#include "libocmirror/utility/digest.hpp"
#include "signature/AtomicPayload.hpp"


namespace ocmirror {
namespace signature {

AtomicSigner::AtomicSigner(std::shared_ptr<const common::Config> config,
                           std::shared_ptr<GpgEngine> gpg,
                           std::shared_ptr<SignatureStore> store,
                           std::vector<std::string> locations)
    : config{std::move(config)}
    , gpg{std::move(gpg)}
    , store{std::move(store)}
    , locations{std::move(locations)}
    , trustThreshold{parseGpgTrust(this->config->getTrustThreshold())}
{}

void AtomicSigner::setSigningIdentity(const SigningIdentity& identity) {
    signingIdentity = identity;
}

std::string AtomicSigner::makeSignatureUrl(const std::string& location, const std::string& digest, int ordinal) {
    auto base = location;
    while(boost::algorithm::ends_with(base, "/")) {
        base.pop_back();
    }
    auto url = boost::format("%s/%s=%s/signature-%d")
        % base % libocmirror::digest::getAlgorithm(digest) % libocmirror::digest::getHex(digest) % ordinal;
    return url.str();
}

std::string AtomicSigner::atomicsign(const std::string& digest, const common::ImageReference& reference) {
    if(!signingIdentity) {
        OCMIRROR_THROW_ERROR("Failed to create atomic signature: no signing key configured");
    }
    if(locations.empty()) {
        OCMIRROR_THROW_ERROR("Failed to create atomic signature: no signature store configured");
    }

    auto payload = AtomicPayload{};
    payload.dockerReference = reference.string();
    payload.manifestDigest = digest;
    payload.creator = "ocmirror " + config->buildTime.version;
    payload.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    auto signedContent = gpg->sign(payload.serialize(), signingIdentity->keyId, signingIdentity->passphrase);

    auto firstUrl = std::string{};
    for(const auto& location : locations) {
        auto url = makeSignatureUrl(location, digest, findFreeOrdinal(location, digest));
        store->publish(url, signedContent);
        printLog(boost::format("Signed %s (%s) -> %s") % reference % digest % url, libocmirror::LogLevel::INFO);
        if(firstUrl.empty()) {
            firstUrl = url;
        }
    }
    return firstUrl;
}

int AtomicSigner::findFreeOrdinal(const std::string& location, const std::string& digest) const {
    auto maxOrdinal = config->getMaxSignatureOrdinal();
    for(int ordinal = 1; ordinal <= maxOrdinal; ++ordinal) {
        if(!store->fetch(makeSignatureUrl(location, digest, ordinal))) {
            return ordinal;
        }
    }
    auto message = boost::format("No free signature slot for %s in %s: all %d ordinals are taken")
        % digest % location % maxOrdinal;
    OCMIRROR_THROW_ERROR(message.str());
}

boost::optional<VerificationResult> AtomicSigner::atomicverify(const std::string& digest, const common::ImageReference& reference) {
    printLog(boost::format("Verifying signatures of %s (%s) in %d store(s)") % reference % digest % locations.size(),
             libocmirror::LogLevel::INFO);

    // locations are probed independently, each result lands in its own slot
    auto perLocation = std::vector<boost::optional<VerificationResult>>(locations.size());
    libocmirror::concurrency::forEachIndex(locations.size(), config->getConcurrency(), [&](size_t i) {
        perLocation[i] = verifyLocation(locations[i], digest);
    });

    auto lastAttempted = boost::optional<VerificationResult>{};
    for(const auto& result : perLocation) {
        if(!result) {
            continue;
        }
        if(isValid(*result)) {
            printLog(boost::format("Found valid signature of %s: %s") % digest % *result, libocmirror::LogLevel::INFO);
            return result;
        }
        lastAttempted = result;
    }

    if(lastAttempted) {
        printLog(boost::format("No valid signature of %s, last examined: %s") % digest % *lastAttempted,
                 libocmirror::LogLevel::WARN);
    }
    else {
        printLog(boost::format("No signature of %s found") % digest, libocmirror::LogLevel::WARN);
    }
    return lastAttempted;
}

boost::optional<VerificationResult> AtomicSigner::verifyLocation(const std::string& location, const std::string& digest) const {
    auto lastAttempted = boost::optional<VerificationResult>{};
    auto maxOrdinal = config->getMaxSignatureOrdinal();

    for(int ordinal = 1; ordinal <= maxOrdinal; ++ordinal) {
        auto url = makeSignatureUrl(location, digest, ordinal);
        auto signedContent = store->fetch(url);
        if(!signedContent) {
            break;
        }
        auto result = verifySignature(*signedContent, digest, url);
        printLog(boost::format("> %-15.15s: %s") % url % result, libocmirror::LogLevel::DEBUG);
        if(isValid(result)) {
            return result;
        }
        lastAttempted = result;
    }

    return lastAttempted;
}

VerificationResult AtomicSigner::verifySignature(const std::string& signedContent, const std::string& digest, const std::string& url) const {
    auto verification = gpg->verify(signedContent);

    auto details = SignatureDetails{};
    details.keyId = verification.keyId;
    details.username = verification.username;
    details.statusGpg = verification.status;
    details.url = url;
    details.signerShortName = (boost::format("keyid=%s status=%s") % verification.keyId % verification.status).str();
    details.signerLongName = (boost::format("Signature made using key ID %s by %s: %s")
                              % verification.keyId
                              % (verification.username.empty() ? std::string{"unknown signer"} : verification.username)
                              % verification.status).str();

    auto mismatch = boost::optional<std::string>{};
    try {
        auto payload = AtomicPayload::parse(verification.payload);
        if(payload.manifestDigest != digest) {
            mismatch = (boost::format("payload digest %s does not match %s") % payload.manifestDigest % digest).str();
        }
    }
    catch(const libocmirror::Error& e) {
        mismatch = std::string{e.what()};
    }

    if(mismatch) {
        auto result = GenericGpgResult{details};
        result.statusAtomic = mismatch;
        result.fingerprint = boost::none;
        result.timestamp = boost::none;
        result.trust = GpgTrust::UNDEFINED;
        result.valid = false;
        return result;
    }

    auto result = AtomicSignature{details};
    result.fingerprint = verification.fingerprint;
    result.timestamp = verification.timestamp;
    result.trust = verification.trust;
    result.valid = verification.status == status::SIGNATURE_VALID && verification.trust >= trustThreshold;
    return result;
}

void AtomicSigner::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
