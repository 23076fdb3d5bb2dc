/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_HttpRegistryClient_hpp
#define ocmirror_registry_HttpRegistryClient_hpp

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/format.hpp>
#include <cpprest/http_client.h>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "registry/RegistryClient.hpp"


namespace ocmirror {
namespace registry {

/**
 * Docker Registry HTTP API v2 client built on cpprestsdk.
 * Anonymous bearer tokens are requested on demand when a registry answers
 * 401 and cached per repository, so concurrent callers share them.
 */
class HttpRegistryClient : public RegistryClient {
public:
    HttpRegistryClient(std::shared_ptr<const common::Config> config);

    ManifestDoc fetchManifest(const common::ImageReference& reference) override;
    std::string fetchBlob(const common::ImageReference& repository, const std::string& digest) override;
    bool blobExists(const common::ImageReference& repository, const std::string& digest) override;
    void pushBlob(const common::ImageReference& repository, const std::string& digest, const std::string& content) override;
    void pushManifest(const common::ImageReference& reference, const ManifestDoc& manifest) override;

private:
    using RequestFactory = std::function<web::http::http_request()>;

    web::http::http_response send(const common::ImageReference& repository,
                                  const RequestFactory& makeRequest,
                                  const std::string& baseUri = "");
    web::http::http_response execute(web::http::client::http_client& client, const web::http::http_request& request) const;
    std::string requestAuthorizationToken(web::http::http_response& response, const std::string& server) const;
    std::unique_ptr<web::http::client::http_client> setupHttpClient(const std::string& uri, const std::string& server) const;
    std::string downloadBlob(const common::ImageReference& repository, const std::string& digest);
    std::string makeRepositoryPath(const common::ImageReference& repository, const std::string& suffix) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    std::string sysname = "HttpRegistryClient";
    std::shared_ptr<const common::Config> config;
    std::mutex tokensMutex;
    std::map<std::string, std::string> tokens;
};

}
}

#endif
