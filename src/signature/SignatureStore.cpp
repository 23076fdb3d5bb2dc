/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/SignatureStore.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libocmirror/Error.hpp"
#include "signature/FileSignatureStore.hpp"
#include "signature/HttpSignatureStore.hpp"


namespace ocmirror {
namespace signature {

namespace {

class DispatchingSignatureStore : public SignatureStore {
public:
    DispatchingSignatureStore(std::shared_ptr<const common::Config> config)
        : http{std::move(config)}
    {}

    boost::optional<std::string> fetch(const std::string& url) override {
        return select(url).fetch(url);
    }

    void publish(const std::string& url, const std::string& content) override {
        select(url).publish(url, content);
    }

private:
    SignatureStore& select(const std::string& url) {
        if(boost::algorithm::starts_with(url, "file://")) {
            return file;
        }
        if(boost::algorithm::starts_with(url, "https://") || boost::algorithm::starts_with(url, "http://")) {
            return http;
        }
        auto message = boost::format("Unsupported signature store URL \"%s\": expected http(s):// or file://") % url;
        OCMIRROR_THROW_ERROR(message.str());
    }

private:
    FileSignatureStore file;
    HttpSignatureStore http;
};

}

std::shared_ptr<SignatureStore> makeSignatureStore(std::shared_ptr<const common::Config> config) {
    return std::make_shared<DispatchingSignatureStore>(std::move(config));
}

}
}
