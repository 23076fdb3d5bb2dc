/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_SignatureStore_hpp
#define ocmirror_signature_SignatureStore_hpp

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "common/Config.hpp"


namespace ocmirror {
namespace signature {

/**
 * Location serving and accepting atomic signature blobs, addressed by URL.
 * Implementations must be safe to use from several threads.
 */
class SignatureStore {
public:
    virtual ~SignatureStore() = default;

    // empty when nothing is stored at the URL
    virtual boost::optional<std::string> fetch(const std::string& url) = 0;
    virtual void publish(const std::string& url, const std::string& content) = 0;
};

// store that dispatches http(s):// and file:// URLs to the matching implementation
std::shared_ptr<SignatureStore> makeSignatureStore(std::shared_ptr<const common::Config> config);

}
}

#endif
