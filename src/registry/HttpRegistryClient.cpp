/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/HttpRegistryClient.hpp"

#include <chrono>
#include <tuple>
#include <vector>

#include <boost/regex.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/digest.hpp"
#include "registry/Utility.hpp"

using namespace web;
using namespace web::http;

namespace ocmirror {
namespace registry {

using libocmirror::ErrorKind;
using libocmirror::LogLevel;

HttpRegistryClient::HttpRegistryClient(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

static std::string toString(const std::vector<unsigned char>& bytes) {
    return std::string(bytes.cbegin(), bytes.cend());
}

static void throwUnexpectedStatus(const http_response& response, const std::string& what, ErrorKind kind = ErrorKind::Transport) {
    auto message = boost::format("Failed to %s. Received HTTP response status code (%d): %s")
        % what % response.status_code() % response.reason_phrase();
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), kind);
}

ManifestDoc HttpRegistryClient::fetchManifest(const common::ImageReference& reference) {
    printLog(boost::format("Fetching manifest of %s") % reference, LogLevel::DEBUG);

    auto target = reference.getDigest().empty() ? reference.getTag() : reference.getDigest();
    auto path = makeRepositoryPath(reference, "manifests/" + target);

    auto response = send(reference, [&]() {
        auto request = http_request{methods::GET};
        request.set_request_uri(path);
        request.headers().add(header_names::accept, mediatype::acceptedManifestTypes());
        return request;
    });

    if(response.status_code() == status_codes::NotFound) {
        throwUnexpectedStatus(response, "fetch manifest of " + reference.string(), ErrorKind::ReferenceResolution);
    }
    if(response.status_code() != status_codes::OK) {
        throwUnexpectedStatus(response, "fetch manifest of " + reference.string());
    }

    auto raw = std::string{};
    try {
        raw = toString(response.extract_vector().get());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to read manifest of %s: %s") % reference % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }

    if(!reference.getDigest().empty()) {
        libocmirror::digest::verifyContent(raw, reference.getDigest());
    }

    auto manifest = ManifestDoc{raw, response.headers().content_type()};
    printLog(boost::format("Fetched manifest %s (%s) of %s") % manifest.getDigest() % manifest.getMediaType() % reference,
             LogLevel::DEBUG);
    return manifest;
}

std::string HttpRegistryClient::fetchBlob(const common::ImageReference& repository, const std::string& digest) {
    auto retries = config->getRegistryRetries();
    for(int attempt = 1; attempt <= retries; ++attempt) {
        try {
            auto content = downloadBlob(repository, digest);
            libocmirror::digest::verifyContent(content, digest);
            return content;
        }
        catch(libocmirror::Error& e) {
            if(attempt == retries) {
                auto message = boost::format("Failed to download blob %s from %s. Exceeded max number of retries (%d).")
                    % digest % repository.getFullName() % retries;
                OCMIRROR_RETHROW_ERROR(e, message.str());
            }
            printLog(boost::format("> %-15.15s: %s (%s)") % "retry" % digest % e.what(), LogLevel::INFO);
        }
    }
    auto message = boost::format("Failed to download blob %s: no download attempt configured") % digest;
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
}

std::string HttpRegistryClient::downloadBlob(const common::ImageReference& repository, const std::string& digest) {
    auto path = makeRepositoryPath(repository, "blobs/" + digest);
    auto response = send(repository, [&]() {
        auto request = http_request{methods::GET};
        request.set_request_uri(path);
        return request;
    });

    // registries commonly redirect blob downloads to a storage backend
    if(response.status_code() > 300 && response.status_code() < 309) {
        auto location = response.headers()[header_names::location];
        boost::smatch matches;
        static const boost::regex re("(https?://[^/]+)(/.*)");
        if(!boost::regex_match(location, matches, re)) {
            auto message = boost::format("Failed to parse redirected download location: %s") % location;
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
        }
        printLog(boost::format("Blob %s: download redirected to %s") % digest % matches[1].str(), LogLevel::DEBUG);
        auto client = setupHttpClient(matches[1].str(), repository.getServer());
        auto request = http_request{methods::GET};
        request.set_request_uri(matches[2].str());
        response = execute(*client, request);
    }

    if(response.status_code() != status_codes::OK) {
        throwUnexpectedStatus(response, "download blob " + digest);
    }

    try {
        return toString(response.extract_vector().get());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Download stream error for blob %s: %s") % digest % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }
}

bool HttpRegistryClient::blobExists(const common::ImageReference& repository, const std::string& digest) {
    auto path = makeRepositoryPath(repository, "blobs/" + digest);
    auto response = send(repository, [&]() {
        auto request = http_request{methods::HEAD};
        request.set_request_uri(path);
        return request;
    });

    if(response.status_code() == status_codes::OK) {
        return true;
    }
    if(response.status_code() == status_codes::NotFound) {
        return false;
    }
    throwUnexpectedStatus(response, "check existence of blob " + digest + " in " + repository.getFullName());
    return false;
}

void HttpRegistryClient::pushBlob(const common::ImageReference& repository, const std::string& digest, const std::string& content) {
    if(blobExists(repository, digest)) {
        printLog(boost::format("> %-15.15s: %s -> %s") % "exists" % digest % repository.getFullName(), LogLevel::INFO);
        return;
    }

    auto uploadPath = makeRepositoryPath(repository, "blobs/uploads/");
    auto response = send(repository, [&]() {
        auto request = http_request{methods::POST};
        request.set_request_uri(uploadPath);
        return request;
    });
    if(response.status_code() != status_codes::Accepted) {
        throwUnexpectedStatus(response, "start upload of blob " + digest + " to " + repository.getFullName());
    }

    // the upload location may be absolute or relative to the registry
    auto location = response.headers()[header_names::location];
    auto baseUri = std::string{};
    auto path = location;
    boost::smatch matches;
    static const boost::regex absolute("(https?://[^/]+)(/.*)");
    if(boost::regex_match(location, matches, absolute)) {
        baseUri = matches[1].str();
        path = matches[2].str();
    }
    path += (path.find('?') == std::string::npos ? "?" : "&");
    path += "digest=" + web::uri::encode_data_string(digest);

    response = send(repository, [&]() {
        auto request = http_request{methods::PUT};
        request.set_request_uri(path);
        request.set_body(std::vector<unsigned char>(content.cbegin(), content.cend()));
        return request;
    }, baseUri);
    if(response.status_code() != status_codes::Created) {
        throwUnexpectedStatus(response, "upload blob " + digest + " to " + repository.getFullName());
    }

    printLog(boost::format("> %-15.15s: %s -> %s") % "pushed" % digest % repository.getFullName(), LogLevel::INFO);
}

void HttpRegistryClient::pushManifest(const common::ImageReference& reference, const ManifestDoc& manifest) {
    auto target = reference.getTag().empty() ? manifest.getDigest() : reference.getTag();
    auto path = makeRepositoryPath(reference, "manifests/" + target);
    const auto& raw = manifest.getRaw();

    auto response = send(reference, [&]() {
        auto request = http_request{methods::PUT};
        request.set_request_uri(path);
        request.set_body(std::vector<unsigned char>(raw.cbegin(), raw.cend()));
        request.headers().set_content_type(manifest.getMediaType());
        return request;
    });
    if(response.status_code() < 200 || response.status_code() >= 300) {
        throwUnexpectedStatus(response, "push manifest " + manifest.getDigest() + " to " + reference.string());
    }

    printLog(boost::format("> %-15.15s: %s -> %s") % "pushed manifest" % manifest.getDigest() % reference, LogLevel::INFO);
}

http_response HttpRegistryClient::send(const common::ImageReference& repository,
                                       const RequestFactory& makeRequest,
                                       const std::string& baseUri) {
    auto uri = baseUri.empty() ? utility::getServerUri(repository.getServer(), config->isSecureRegistryEnforced()) : baseUri;
    auto client = setupHttpClient(uri, repository.getServer());
    auto tokenKey = repository.getFullName();

    // copy the token: other workers may refresh it concurrently
    auto token = std::string{};
    {
        std::lock_guard<std::mutex> lock{tokensMutex};
        auto it = tokens.find(tokenKey);
        if(it != tokens.cend()) {
            token = it->second;
        }
    }

    auto request = makeRequest();
    if(!token.empty()) {
        request.headers().add(header_names::authorization, "Bearer " + token);
    }
    auto response = execute(*client, request);

    if(response.status_code() == status_codes::Unauthorized) {
        printLog(boost::format("Received %d from %s, requesting new authorization token") % response.status_code() % uri,
                 LogLevel::DEBUG);
        token = requestAuthorizationToken(response, repository.getServer());
        {
            std::lock_guard<std::mutex> lock{tokensMutex};
            tokens[tokenKey] = token;
        }
        request = makeRequest();
        request.headers().add(header_names::authorization, "Bearer " + token);
        response = execute(*client, request);

        if(response.status_code() == status_codes::Unauthorized || response.status_code() == status_codes::Forbidden) {
            auto message = boost::format("Access to %s was denied (%d): the repository may be private"
                                         " or not present in the remote registry")
                % repository.getFullName() % response.status_code();
            OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
        }
    }

    return response;
}

http_response HttpRegistryClient::execute(client::http_client& client, const http_request& request) const {
    printLog(boost::format("httpclient: %s %s%s") % request.method() % client.base_uri().to_string() % request.request_uri().to_string(),
             LogLevel::DEBUG);
    try {
        auto response = client.request(request).get();
        printLog(boost::format("Received HTTP response status code (%d): %s") % response.status_code() % response.reason_phrase(),
                 LogLevel::DEBUG);
        return response;
    }
    catch(const std::exception& e) {
        auto message = boost::format("HTTP %s request to %s failed: %s")
            % request.method() % client.base_uri().to_string() % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }
}

std::string HttpRegistryClient::requestAuthorizationToken(http_response& response, const std::string& server) const {
    auto header = response.headers()[header_names::www_authenticate];
    if(header.find("Bearer") == std::string::npos) {
        auto message = boost::format("Registry %s requires an unsupported authentication scheme: %s") % server % header;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }

    std::string realm, service, scope;
    std::tie(realm, service, scope) = utility::parseWwwAuthenticateHeader(header);

    auto tokenClient = setupHttpClient(realm, server);
    auto tokenUriBuilder = uri_builder{""};
    if(!scope.empty()) {
        tokenUriBuilder.append_query("scope", scope);
    }
    if(!service.empty()) {
        tokenUriBuilder.append_query("service", service);
    }
    auto tokenRequest = http_request{methods::GET};
    tokenRequest.set_request_uri(tokenUriBuilder.to_string());

    auto tokenResponse = execute(*tokenClient, tokenRequest);
    if(tokenResponse.status_code() != status_codes::OK) {
        throwUnexpectedStatus(tokenResponse, "get authorization token from " + realm);
    }

    try {
        auto body = tokenResponse.extract_json(true).get();
        for(const auto* field : {"token", "access_token"}) {
            if(body.has_field(field) && body.at(field).is_string()) {
                printLog(boost::format("Got new authorization token for %s") % server, LogLevel::DEBUG);
                return body.at(field).as_string();
            }
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to parse authorization token response from %s: %s") % realm % e.what();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }

    auto message = boost::format("Authorization token response from %s contains no token") % realm;
    OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
}

std::unique_ptr<client::http_client> HttpRegistryClient::setupHttpClient(const std::string& uri, const std::string& server) const {
    auto clientConfig = client::http_client_config{};
    clientConfig.set_validate_certificates(config->isSecureRegistryEnforced());
    clientConfig.set_timeout(std::chrono::seconds{300});

    auto proxy = utility::getProxy(server, config->isSecureRegistryEnforced());
    if(!proxy.empty()) {
        printLog(boost::format("Setting proxy for HTTP client: %s") % proxy, LogLevel::DEBUG);
        clientConfig.set_proxy(web_proxy(proxy));
    }

    return std::unique_ptr<client::http_client>(new client::http_client(uri, clientConfig));
}

std::string HttpRegistryClient::makeRepositoryPath(const common::ImageReference& repository, const std::string& suffix) const {
    return (boost::format("/v2/%s/%s") % repository.getRepository() % suffix).str();
}

void HttpRegistryClient::printLog(const boost::format& message, LogLevel level) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level);
}

}
}
