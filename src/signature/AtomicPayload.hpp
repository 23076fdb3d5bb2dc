/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_AtomicPayload_hpp
#define ocmirror_signature_AtomicPayload_hpp

#include <cstdint>
#include <string>

#include <boost/optional.hpp>


namespace ocmirror {
namespace signature {

/**
 * Content of an atomic container signature ("simple signing" format):
 *
 * {"critical":{"identity":{"docker-reference":...},
 *              "image":{"docker-manifest-digest":...},
 *              "type":"atomic container signature"},
 *  "optional":{"creator":...,"timestamp":...}}
 */
struct AtomicPayload {
    std::string dockerReference;
    std::string manifestDigest;
    std::string creator;
    boost::optional<std::int64_t> timestamp;

    static const std::string TYPE;

    std::string serialize() const;
    // throws if the document is not an atomic container signature
    static AtomicPayload parse(const std::string& document);
};

}
}

#endif
