/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_HttpSignatureStore_hpp
#define ocmirror_signature_HttpSignatureStore_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>
#include <cpprest/http_client.h>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "signature/SignatureStore.hpp"


namespace ocmirror {
namespace signature {

/**
 * Signature store served over HTTP(S): signatures are read with GET and
 * published with PUT. Missing signatures are reported by 404, or by 403
 * for object storage that hides absent keys.
 */
class HttpSignatureStore : public SignatureStore {
public:
    HttpSignatureStore(std::shared_ptr<const common::Config> config);

    boost::optional<std::string> fetch(const std::string& url) override;
    void publish(const std::string& url, const std::string& content) override;

private:
    web::http::http_response send(const std::string& url, web::http::http_request& request) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::shared_ptr<const common::Config> config;
    const std::string sysname = "HttpSignatureStore";
};

}
}

#endif
