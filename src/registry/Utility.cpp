/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Utility.hpp"

#include <vector>

#include <boost/predef.h>
#include <boost/algorithm/string.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/environment.hpp"


namespace ocmirror {
namespace registry {
namespace utility {

Platform getCurrentPlatform() {
    auto platform = Platform{"linux", "", ""};

    #if BOOST_ARCH_X86
        #if BOOST_ARCH_X86_64
            platform.architecture = "amd64";
        #elif BOOST_ARCH_X86_32
            platform.architecture = "386";
        #endif

    #elif BOOST_ARCH_ARM
        #if BOOST_ARCH_WORD_BITS_64
            platform.architecture = "arm64";
            platform.variant = "v8";
        #elif BOOST_ARCH_WORD_BITS_32
            platform.architecture = "arm";
            platform.variant = "v" + std::to_string(BOOST_VERSION_NUMBER_MAJOR(BOOST_ARCH_ARM));
        #endif

    #elif BOOST_ARCH_PPC_64
        #if BOOST_ENDIAN_LITTLE_BYTE || BOOST_ENDIAN_LITTLE_WORD
            platform.architecture = "ppc64le";
        #else
            platform.architecture = "ppc64";
        #endif

    #elif BOOST_ARCH_SYS390
        platform.architecture = "s390x";

    #elif BOOST_ARCH_RISCV
        platform.architecture = "riscv64";

    #else
        #error "Failed to detect CPU architecture for determining current platform"
    #endif

    if(platform.architecture.empty()) {
        OCMIRROR_THROW_ERROR("Failed to detect CPU architecture");
    }

    printLog(boost::format("Detected current platform: %s/%s%s")
                % platform.os % platform.architecture
                % (platform.variant.empty() ? "" : "/" + platform.variant),
             libocmirror::LogLevel::DEBUG);
    return platform;
}

/**
 * The configured os/architecture/variant, falling back to the host platform
 * for the architecture.
 */
Platform getTargetPlatform(const common::Config& config) {
    auto platform = Platform{};
    auto architecture = config.getTargetArchitecture();
    if(architecture) {
        platform.architecture = *architecture;
        platform.variant = config.getTargetVariant().value_or("");
    }
    else {
        platform = getCurrentPlatform();
    }
    platform.os = config.getTargetOs();
    return platform;
}

/**
 * Picks the entry of a manifest list matching the target platform. An entry
 * without variant is kept as best match so far; an exact variant match wins.
 */
Descriptor selectPlatformManifest(const ManifestDoc& list, const Platform& target) {
    const Descriptor* bestMatch = nullptr;

    for(const auto& entry : list.getManifests()) {
        if(!entry.platform) {
            continue;
        }
        const auto& platform = *entry.platform;
        if(platform.os != target.os || platform.architecture != target.architecture) {
            continue;
        }
        if(platform.variant.empty() || target.variant.empty()) {
            if(!bestMatch) {
                bestMatch = &entry;
            }
        }
        else if(platform.variant == target.variant) {
            bestMatch = &entry;
            break;
        }
    }

    if(!bestMatch) {
        auto message = boost::format("Failed to find manifest for platform %s/%s in manifest list %s")
            % target.os % target.architecture % list.getDigest();
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }

    printLog(boost::format("Selected manifest %s for platform %s/%s") % bestMatch->digest % target.os % target.architecture,
             libocmirror::LogLevel::DEBUG);
    return *bestMatch;
}

static std::string getParam(const std::string& header, const std::string& param) {
    auto paramPosition = header.find(param + "=\"");
    if(paramPosition == std::string::npos) {
        return std::string{};
    }
    auto begin = paramPosition + param.size() + 2;
    auto end = header.find('"', begin);
    return header.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}

/**
 * Extracts realm, service and scope from a bearer challenge, e.g.
 * Bearer realm="https://auth.docker.io/token",service="registry.docker.io",scope="repository:a/b:pull"
 */
std::tuple<std::string, std::string, std::string> parseWwwAuthenticateHeader(const std::string& header) {
    auto realm = getParam(header, "realm");
    auto service = std::string{};
    auto scope = std::string{};

    if(realm.find("service=") == std::string::npos) {
        service = getParam(header, "service");
    }
    if(realm.find("scope=") == std::string::npos) {
        scope = getParam(header, "scope");
    }

    printLog(boost::format("Parsed Www-Authenticate header: realm=%s service=%s scope=%s") % realm % service % scope,
             libocmirror::LogLevel::DEBUG);

    return std::tuple<std::string, std::string, std::string>{realm, service, scope};
}

std::string getServerUri(const std::string& server, bool secure) {
    // Docker Hub's API is not served at its reference domain
    auto host = server == common::ImageReference::DEFAULT_SERVER ? std::string{"registry-1.docker.io"} : server;
    return (secure ? "https://" : "http://") + host;
}

static bool isInNoProxyList(const std::string& server, const std::string& noProxyList) {
    if(noProxyList == "*") {
        return true;
    }
    auto hostnames = std::vector<std::string>{};
    boost::split(hostnames, noProxyList, boost::is_any_of(","));
    auto host = server.substr(0, server.find(':'));
    for(auto hostname : hostnames) {
        boost::algorithm::trim(hostname);
        if(hostname.empty()) {
            continue;
        }
        if(hostname == server || hostname == host
           || (hostname.front() == '.' && boost::algorithm::ends_with(host, hostname))) {
            return true;
        }
    }
    return false;
}

/**
 * Proxy from the environment, following the conventions of curl:
 * lower case names win, and only the lower case http_proxy is honored
 * for plain HTTP.
 */
std::string getProxy(const std::string& server, bool secure) {
    auto lookup = [](const char* name) {
        auto value = libocmirror::environment::lookupVariable(name);
        return value ? *value : std::string{};
    };

    auto noProxy = lookup("no_proxy");
    if(noProxy.empty()) {
        noProxy = lookup("NO_PROXY");
    }
    if(!noProxy.empty() && isInNoProxyList(server, noProxy)) {
        return std::string{};
    }

    auto proxy = lookup("ALL_PROXY");
    if(!proxy.empty()) {
        return proxy;
    }
    if(secure) {
        proxy = lookup("https_proxy");
        return proxy.empty() ? lookup("HTTPS_PROXY") : proxy;
    }
    return lookup("http_proxy");
}

void printLog(const std::string& message, libocmirror::LogLevel level,
              std::ostream& outStream, std::ostream& errStream) {
    libocmirror::Logger::getInstance().log(message, "Registry_Utility", level, outStream, errStream);
}

void printLog(const boost::format& message, libocmirror::LogLevel level,
              std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), level, outStream, errStream);
}

}
}
}
