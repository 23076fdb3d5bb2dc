/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/VerificationResult.hpp"


namespace ocmirror {
namespace signature {

namespace {

class DetailsVisitor : public boost::static_visitor<const SignatureDetails&> {
public:
    const SignatureDetails& operator()(const AtomicSignature& signature) const {
        return signature;
    }
    const SignatureDetails& operator()(const GenericGpgResult& result) const {
        return result;
    }
};

class TypeVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const AtomicSignature&) const {
        return "atomicsigner";
    }
    std::string operator()(const GenericGpgResult&) const {
        return "gpg";
    }
};

}

const SignatureDetails& getDetails(const VerificationResult& result) {
    return boost::apply_visitor(DetailsVisitor{}, result);
}

std::string getType(const VerificationResult& result) {
    return boost::apply_visitor(TypeVisitor{}, result);
}

bool isValid(const VerificationResult& result) {
    return getDetails(result).valid;
}

std::ostream& operator<<(std::ostream& os, const VerificationResult& result) {
    const auto& details = getDetails(result);
    os << "type=" << getType(result)
       << " valid=" << (details.valid ? "true" : "false")
       << " keyid=" << details.keyId
       << " fingerprint=" << details.fingerprint.value_or("none")
       << " trust=" << details.trust
       << " status=" << details.statusGpg;
    if(details.statusAtomic) {
        os << " (" << *details.statusAtomic << ")";
    }
    return os;
}

}
}
