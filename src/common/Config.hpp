/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_Config_hpp
#define ocmirror_common_Config_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/ImageReference.hpp"
#include "common/PackageChannel.hpp"


namespace ocmirror {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
            boost::filesystem::path installationPrefixDir;
        };

        // options shared by all the commands
        struct Mirror {
            bool checkSignatures = true;
            bool dryRun = false;
            std::vector<std::string> signatureStores;
            std::vector<std::string> signingKeys; // armored key text
        };

        struct CommandDump {
            ImageReference index;
            PackageChannels packageChannels;
            bool sortMetadata = false;
            bool translate = false;
        };

        struct CommandMirror {
            ImageReference source;
            ImageReference destination;
            PackageChannels packageChannels;
        };

        boost::filesystem::path getGpgPath() const;
        boost::filesystem::path getTempDir() const;
        std::vector<std::string> getDefaultSignatureStores() const;
        std::vector<std::string> getTranslationPatterns() const;
        size_t getConcurrency() const;
        std::string getTrustThreshold() const;
        std::string getTargetOs() const;
        boost::optional<std::string> getTargetArchitecture() const;
        boost::optional<std::string> getTargetVariant() const;
        bool isSecureRegistryEnforced() const;
        int getRegistryRetries() const;
        int getMaxSignatureOrdinal() const;

        static const std::vector<std::string> DEFAULT_SIGNATURE_STORES;
        static const std::vector<std::string> DEFAULT_TRANSLATION_PATTERNS;

        BuildTime buildTime;
        rapidjson::Document json{ rapidjson::kObjectType };
        Mirror mirror;
        CommandDump commandDump;
        CommandMirror commandMirror;
};

}
}

#endif
