/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_SignatureVerifier_hpp
#define ocmirror_release_SignatureVerifier_hpp

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "signature/GpgEngine.hpp"
#include "signature/SignatureStore.hpp"
#include "signature/VerificationResult.hpp"


namespace ocmirror {
namespace release {

/**
 * Requires a valid atomic signature for the manifest digest of a release or
 * catalog index. Every verification imports the signing keys into a fresh
 * GPG engine, so that only those keys are trusted.
 */
class SignatureVerifier {
public:
    using GpgEngineFactory = std::function<std::shared_ptr<signature::GpgEngine>()>;

public:
    SignatureVerifier(std::shared_ptr<const common::Config> config,
                      std::shared_ptr<signature::SignatureStore> store);
    SignatureVerifier(std::shared_ptr<const common::Config> config,
                      std::shared_ptr<signature::SignatureStore> store,
                      GpgEngineFactory makeGpgEngine);

    // throws an Error of kind SignatureRequirement when no valid signature is found
    signature::VerificationResult verify(const std::string& digest,
                                         const common::ImageReference& reference,
                                         const std::vector<std::string>& signatureStores,
                                         const std::vector<std::string>& signingKeys) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<signature::SignatureStore> store;
    GpgEngineFactory makeGpgEngine;
};

}
}

#endif
