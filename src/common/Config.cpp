/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/json.hpp"


namespace ocmirror {
namespace common {

const std::vector<std::string> Config::DEFAULT_SIGNATURE_STORES{
    "https://mirror.openshift.com/pub/openshift-v4/signatures/openshift/release",
    "https://storage.googleapis.com/openshift-release/official/signatures/openshift/release"
};

const std::vector<std::string> Config::DEFAULT_TRANSLATION_PATTERNS{
    "^quay\\.io",
    "^registry\\.redhat\\.io",
    "^registry\\.access\\.redhat\\.com",
    "^registry-proxy\\.engineering\\.redhat\\.com"
};

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/ocmirror.json", installationPrefixDir / "etc/ocmirror.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libocmirror::json::readAndValidate(configFilename, configSchemaFilename) }
{}

static std::vector<std::string> getStringArrayOr(const rapidjson::Document& json,
                                                 const char* key,
                                                 const std::vector<std::string>& fallback) {
    if(!json.HasMember(key)) {
        return fallback;
    }
    return libocmirror::json::getStringArray(json, key);
}

boost::filesystem::path Config::getGpgPath() const {
    if(!json.HasMember("gpgPath")) {
        return "gpg";
    }
    return json["gpgPath"].GetString();
}

boost::filesystem::path Config::getTempDir() const {
    auto temp = json.HasMember("tempDir")
        ? boost::filesystem::path{json["tempDir"].GetString()}
        : boost::filesystem::temp_directory_path();
    if(!boost::filesystem::is_directory(temp)) {
        auto message = boost::format("Invalid temporary directory %s") % temp;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return temp;
}

std::vector<std::string> Config::getDefaultSignatureStores() const {
    return getStringArrayOr(json, "signatureStores", DEFAULT_SIGNATURE_STORES);
}

std::vector<std::string> Config::getTranslationPatterns() const {
    return getStringArrayOr(json, "translationPatterns", DEFAULT_TRANSLATION_PATTERNS);
}

size_t Config::getConcurrency() const {
    if(!json.HasMember("concurrency")) {
        return 8;
    }
    return json["concurrency"].GetUint();
}

std::string Config::getTrustThreshold() const {
    if(!json.HasMember("trustThreshold")) {
        return "FULLY";
    }
    return json["trustThreshold"].GetString();
}

std::string Config::getTargetOs() const {
    if(!json.HasMember("os")) {
        return "linux";
    }
    return json["os"].GetString();
}

boost::optional<std::string> Config::getTargetArchitecture() const {
    if(!json.HasMember("architecture")) {
        return {};
    }
    return std::string{json["architecture"].GetString()};
}

boost::optional<std::string> Config::getTargetVariant() const {
    if(!json.HasMember("variant")) {
        return {};
    }
    return std::string{json["variant"].GetString()};
}

bool Config::isSecureRegistryEnforced() const {
    if(!json.HasMember("enforceSecureRegistry")) {
        return true;
    }
    return json["enforceSecureRegistry"].GetBool();
}

int Config::getRegistryRetries() const {
    if(!json.HasMember("registryRetries")) {
        return 3;
    }
    return json["registryRetries"].GetInt();
}

int Config::getMaxSignatureOrdinal() const {
    if(!json.HasMember("maxSignatureOrdinal")) {
        return 16;
    }
    return json["maxSignatureOrdinal"].GetInt();
}

}} // namespaces
