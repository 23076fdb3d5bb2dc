/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_GpgEngine_hpp
#define ocmirror_signature_GpgEngine_hpp

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include <boost/optional.hpp>


namespace ocmirror {
namespace signature {

// GPG ownertrust levels, ordered from least to most trusted
enum class GpgTrust {
    NEVER,
    UNDEFINED,
    MARGINAL,
    FULLY,
    ULTIMATE
};

GpgTrust parseGpgTrust(const std::string&);
std::string toString(GpgTrust);
std::ostream& operator<<(std::ostream&, GpgTrust);

namespace status {

extern const std::string SIGNATURE_VALID;
extern const std::string SIGNATURE_BAD;
extern const std::string SIGNATURE_EXPIRED;
extern const std::string KEY_EXPIRED;
extern const std::string KEY_REVOKED;
extern const std::string NO_PUBLIC_KEY;
extern const std::string SIGNATURE_ERROR;
extern const std::string NO_SIGNATURE;

}

struct GpgVerification {
    std::string status = status::NO_SIGNATURE;
    boost::optional<std::string> fingerprint;
    std::string keyId;
    std::string username;
    boost::optional<std::int64_t> timestamp;
    GpgTrust trust = GpgTrust::UNDEFINED;
    std::string payload; // signed content, empty when it could not be extracted
};

/**
 * Signing and verification primitives of an OpenPGP implementation.
 * Implementations must allow concurrent calls to verify().
 */
class GpgEngine {
public:
    virtual ~GpgEngine() = default;

    // returns the fingerprints of the imported keys
    virtual std::vector<std::string> importKey(const std::string& armoredKey) = 0;
    virtual std::string sign(const std::string& data, const std::string& keyId, const std::string& passphrase) = 0;
    virtual GpgVerification verify(const std::string& signedData) = 0;
};

}
}

#endif
