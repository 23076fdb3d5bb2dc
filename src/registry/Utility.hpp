/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_Utility_hpp
#define ocmirror_registry_Utility_hpp

#include <string>
#include <tuple>
#include <iostream>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "registry/Manifest.hpp"


namespace ocmirror {
namespace registry {
namespace utility {

Platform getCurrentPlatform();
Platform getTargetPlatform(const common::Config& config);
Descriptor selectPlatformManifest(const ManifestDoc& list, const Platform& target);
std::tuple<std::string, std::string, std::string> parseWwwAuthenticateHeader(const std::string& header);
std::string getServerUri(const std::string& server, bool secure);
std::string getProxy(const std::string& server, bool secure);
void printLog(const std::string& message, libocmirror::LogLevel,
              std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
void printLog(const boost::format& message, libocmirror::LogLevel,
              std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);

}
}
}

#endif
