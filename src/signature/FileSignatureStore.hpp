/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_FileSignatureStore_hpp
#define ocmirror_signature_FileSignatureStore_hpp

#include <string>

#include <boost/filesystem.hpp>

#include "signature/SignatureStore.hpp"


namespace ocmirror {
namespace signature {

class FileSignatureStore : public SignatureStore {
public:
    boost::optional<std::string> fetch(const std::string& url) override;
    void publish(const std::string& url, const std::string& content) override;

    static boost::filesystem::path getPath(const std::string& url);
};

}
}

#endif
