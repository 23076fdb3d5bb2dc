/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/GpgEngine.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"


namespace ocmirror {
namespace signature {

namespace status {

const std::string SIGNATURE_VALID{"signature valid"};
const std::string SIGNATURE_BAD{"signature bad"};
const std::string SIGNATURE_EXPIRED{"signature expired"};
const std::string KEY_EXPIRED{"key expired"};
const std::string KEY_REVOKED{"key revoked"};
const std::string NO_PUBLIC_KEY{"no public key"};
const std::string SIGNATURE_ERROR{"signature error"};
const std::string NO_SIGNATURE{"no signature"};

}

GpgTrust parseGpgTrust(const std::string& name) {
    if(name == "NEVER") {
        return GpgTrust::NEVER;
    }
    else if(name == "UNDEFINED") {
        return GpgTrust::UNDEFINED;
    }
    else if(name == "MARGINAL") {
        return GpgTrust::MARGINAL;
    }
    else if(name == "FULLY") {
        return GpgTrust::FULLY;
    }
    else if(name == "ULTIMATE") {
        return GpgTrust::ULTIMATE;
    }
    auto message = boost::format("Invalid GPG trust level \"%s\"") % name;
    OCMIRROR_THROW_ERROR(message.str());
}

std::string toString(GpgTrust trust) {
    switch(trust) {
        case GpgTrust::NEVER: return "NEVER";
        case GpgTrust::UNDEFINED: return "UNDEFINED";
        case GpgTrust::MARGINAL: return "MARGINAL";
        case GpgTrust::FULLY: return "FULLY";
        case GpgTrust::ULTIMATE: return "ULTIMATE";
    }
    OCMIRROR_THROW_ERROR("Unexpected GPG trust level");
}

std::ostream& operator<<(std::ostream& os, GpgTrust trust) {
    return os << toString(trust);
}

}
}
