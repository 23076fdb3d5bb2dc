/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_VerificationResult_hpp
#define ocmirror_signature_VerificationResult_hpp

#include <cstdint>
#include <string>
#include <ostream>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "signature/GpgEngine.hpp"


namespace ocmirror {
namespace signature {

struct SignatureDetails {
    boost::optional<std::string> fingerprint;
    std::string keyId;
    std::string signerLongName;
    std::string signerShortName;
    boost::optional<std::string> statusAtomic; // set when the payload is missing or does not match
    std::string statusGpg;
    boost::optional<std::int64_t> timestamp;
    GpgTrust trust = GpgTrust::UNDEFINED;
    std::string username;
    bool valid = false;
    std::string url; // where the signature was fetched from
};

// signature whose payload binds the probed digest
struct AtomicSignature : SignatureDetails {};

// signature that verified (or failed to) as plain GPG data only
struct GenericGpgResult : SignatureDetails {};

using VerificationResult = boost::variant<AtomicSignature, GenericGpgResult>;

const SignatureDetails& getDetails(const VerificationResult&);
// "atomicsigner" or "gpg"
std::string getType(const VerificationResult&);
bool isValid(const VerificationResult&);

std::ostream& operator<<(std::ostream&, const VerificationResult&);

}
}

#endif
