/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PackageChannel.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/string.hpp"


namespace ocmirror {
namespace common {

bool operator==(const ExplicitChannel& lhs, const ExplicitChannel& rhs) {
    return lhs.name == rhs.name;
}

bool operator==(const DefaultChannel&, const DefaultChannel&) {
    return true;
}

bool isDefaultChannel(const PackageChannel& channel) {
    return boost::get<DefaultChannel>(&channel) != nullptr;
}

std::string toString(const PackageChannel& channel) {
    if(const auto* explicitChannel = boost::get<ExplicitChannel>(&channel)) {
        return explicitChannel->name;
    }
    return "<default>";
}

/**
 * Parses "package" or "package:channel".
 */
std::pair<std::string, PackageChannel> parsePackageChannel(const std::string& token) {
    static const boost::regex validName{"[A-Za-z0-9][A-Za-z0-9._-]*"};

    auto packageAndChannel = std::pair<std::string, std::string>{};
    try {
        packageAndChannel = libocmirror::string::parseKeyValuePair(token, ':');
    }
    catch(libocmirror::Error& e) {
        auto message = boost::format("Invalid package selector '%s'") % token;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }

    const auto& package = packageAndChannel.first;
    const auto& channel = packageAndChannel.second;
    bool hasChannelSeparator = token.find(':') != std::string::npos;

    if(!boost::regex_match(package, validName)
       || (hasChannelSeparator && !boost::regex_match(channel, validName))) {
        auto message = boost::format("Invalid package selector '%s': expected 'package' or 'package:channel'") % token;
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(hasChannelSeparator) {
        return {package, PackageChannel{ExplicitChannel{channel}}};
    }
    return {package, PackageChannel{DefaultChannel{}}};
}

PackageChannels parsePackageChannels(const std::vector<std::string>& tokens) {
    auto packageChannels = PackageChannels{};
    for(const auto& token : tokens) {
        auto entry = parsePackageChannel(token);
        if(packageChannels.count(entry.first) != 0) {
            auto message = boost::format("Package '%s' was selected more than once") % entry.first;
            OCMIRROR_THROW_ERROR(message.str());
        }
        packageChannels.insert(std::move(entry));
    }
    return packageChannels;
}

std::ostream& operator<<(std::ostream& os, const PackageChannel& channel) {
    os << toString(channel);
    return os;
}

}
}
