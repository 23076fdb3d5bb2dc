/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/HttpSignatureStore.hpp"

#include <chrono>
#include <vector>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "registry/Utility.hpp"

using namespace web;
using namespace web::http;

namespace ocmirror {
namespace signature {

HttpSignatureStore::HttpSignatureStore(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

boost::optional<std::string> HttpSignatureStore::fetch(const std::string& url) {
    auto request = http_request{methods::GET};
    auto response = send(url, request);

    if(response.status_code() == status_codes::NotFound || response.status_code() == status_codes::Forbidden) {
        printLog(boost::format("No signature at %s (%d)") % url % response.status_code(), libocmirror::LogLevel::DEBUG);
        return boost::none;
    }
    if(response.status_code() != status_codes::OK) {
        auto message = boost::format("Failed to fetch signature %s. Received HTTP response status code (%d): %s")
            % url % response.status_code() % response.reason_phrase();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
    }

    try {
        auto body = response.extract_vector().get();
        return std::string(body.cbegin(), body.cend());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to read signature %s: %s") % url % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
    }
}

void HttpSignatureStore::publish(const std::string& url, const std::string& content) {
    auto request = http_request{methods::PUT};
    request.set_body(std::vector<unsigned char>(content.cbegin(), content.cend()));
    auto response = send(url, request);

    if(response.status_code() < 200 || response.status_code() >= 300) {
        auto message = boost::format("Failed to publish signature %s. Received HTTP response status code (%d): %s")
            % url % response.status_code() % response.reason_phrase();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
    }
    printLog(boost::format("Published signature to %s") % url, libocmirror::LogLevel::INFO);
}

http_response HttpSignatureStore::send(const std::string& url, http_request& request) const {
    try {
        auto uri = web::uri{url};
        auto secure = uri.scheme() == "https";

        auto clientConfig = client::http_client_config{};
        clientConfig.set_validate_certificates(config->isSecureRegistryEnforced());
        clientConfig.set_timeout(std::chrono::seconds{60});
        auto proxy = registry::utility::getProxy(uri.host(), secure);
        if(!proxy.empty()) {
            clientConfig.set_proxy(web_proxy(proxy));
        }

        auto client = client::http_client{uri.authority(), clientConfig};
        request.set_request_uri(uri.resource());
        printLog(boost::format("httpclient: %s %s") % request.method() % url, libocmirror::LogLevel::DEBUG);
        return client.request(request).get();
    }
    catch(const std::exception& e) {
        auto message = boost::format("HTTP %s request to signature store %s failed: %s") % request.method() % url % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::Transport);
    }
}

void HttpSignatureStore::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
