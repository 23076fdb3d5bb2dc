/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/SignatureVerifier.hpp"

#include <sstream>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"
#include "signature/AtomicSigner.hpp"
#include "signature/GpgDriver.hpp"


namespace ocmirror {
namespace release {

SignatureVerifier::SignatureVerifier(std::shared_ptr<const common::Config> config,
                                     std::shared_ptr<signature::SignatureStore> store)
    : SignatureVerifier(config, store, [config]() {
        return std::make_shared<signature::GpgDriver>(config);
    })
{}

SignatureVerifier::SignatureVerifier(std::shared_ptr<const common::Config> config,
                                     std::shared_ptr<signature::SignatureStore> store,
                                     GpgEngineFactory makeGpgEngine)
    : config{std::move(config)}
    , store{std::move(store)}
    , makeGpgEngine{std::move(makeGpgEngine)}
{}

signature::VerificationResult SignatureVerifier::verify(const std::string& digest,
                                                        const common::ImageReference& reference,
                                                        const std::vector<std::string>& signatureStores,
                                                        const std::vector<std::string>& signingKeys) const {
    if(signatureStores.empty()) {
        auto message = boost::format("Cannot verify %s: no signature stores are configured") % reference;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::SignatureRequirement);
    }
    if(signingKeys.empty()) {
        auto message = boost::format("Cannot verify %s: no signing keys are configured") % reference;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::SignatureRequirement);
    }

    auto gpg = makeGpgEngine();
    for(const auto& key : signingKeys) {
        gpg->importKey(key);
    }

    auto signer = signature::AtomicSigner{config, gpg, store, signatureStores};
    auto result = signer.atomicverify(digest, reference);

    if(!result) {
        auto message = boost::format("No signature found for %s (%s) in the signature stores") % reference % digest;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::SignatureRequirement);
    }
    if(!signature::isValid(*result)) {
        auto details = std::stringstream{};
        details << *result;
        auto message = boost::format("No valid signature found for %s (%s): %s") % reference % digest % details.str();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::SignatureRequirement);
    }

    libocmirror::logMessage(boost::format("> %-15.15s: %s") % "signature" % signature::getDetails(*result).signerLongName,
                            libocmirror::LogLevel::INFO);
    return *result;
}

}
}
