/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/VerificationConfigMap.hpp"

#include <algorithm>
#include <sstream>

#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>


namespace ocmirror {
namespace release {

const std::string VerificationConfigMap::PATH{"release-manifests/0000_90_cluster-update-keys_configmap.yaml"};

static size_t countIndentation(const std::string& line) {
    auto position = line.find_first_not_of(' ');
    return position == std::string::npos ? line.size() : position;
}

static std::string unquote(std::string value) {
    boost::algorithm::trim(value);
    if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

VerificationConfigMap VerificationConfigMap::parse(const std::string& yaml) {
    static const boost::regex entryRegex{R"(^( *)(store-[^:\s]+|verifier-public-key-[^:\s]+):\s*(.*)$)"};

    auto configMap = VerificationConfigMap{};
    auto lines = std::vector<std::string>{};
    auto stream = std::istringstream{yaml};
    auto line = std::string{};
    while(std::getline(stream, line)) {
        boost::algorithm::trim_right_if(line, boost::is_any_of("\r"));
        lines.push_back(line);
    }

    for(size_t i = 0; i < lines.size(); ++i) {
        boost::smatch matches;
        if(!boost::regex_match(lines[i], matches, entryRegex)) {
            continue;
        }
        auto keyIndentation = matches[1].length();
        auto key = matches[2].str();
        auto value = matches[3].str();

        // block scalar: the following more indented lines
        if(!value.empty() && value[0] == '|') {
            auto blockLines = std::vector<std::string>{};
            auto blockIndentation = std::string::npos;
            while(i + 1 < lines.size()) {
                const auto& next = lines[i + 1];
                auto isBlank = boost::algorithm::trim_copy(next).empty();
                if(!isBlank && countIndentation(next) <= static_cast<size_t>(keyIndentation)) {
                    break;
                }
                ++i;
                if(isBlank) {
                    blockLines.push_back("");
                    continue;
                }
                if(blockIndentation == std::string::npos) {
                    blockIndentation = countIndentation(next);
                }
                blockLines.push_back(next.substr(std::min(blockIndentation, countIndentation(next))));
            }
            while(!blockLines.empty() && blockLines.back().empty()) {
                blockLines.pop_back();
            }
            value = boost::algorithm::join(blockLines, "\n");
            if(value.empty() || value.back() != '\n') {
                value += "\n";
            }
        }
        else {
            value = unquote(value);
        }

        if(boost::algorithm::starts_with(key, "store-")) {
            configMap.signatureStores.push_back(value);
        }
        else {
            configMap.signingKeys.push_back(value);
        }
    }

    return configMap;
}

}
}
