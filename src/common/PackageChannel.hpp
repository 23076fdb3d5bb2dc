/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_PackageChannel_hpp
#define ocmirror_common_PackageChannel_hpp

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <ostream>

#include <boost/variant.hpp>


namespace ocmirror {
namespace common {

// the channel was named by the caller and must exist
struct ExplicitChannel {
    std::string name;
};

// the package's default channel is used
struct DefaultChannel {};

using PackageChannel = boost::variant<DefaultChannel, ExplicitChannel>;
using PackageChannels = std::map<std::string, PackageChannel>;

bool operator==(const ExplicitChannel&, const ExplicitChannel&);
bool operator==(const DefaultChannel&, const DefaultChannel&);

bool isDefaultChannel(const PackageChannel&);
std::string toString(const PackageChannel&);

std::pair<std::string, PackageChannel> parsePackageChannel(const std::string& token);
PackageChannels parsePackageChannels(const std::vector<std::string>& tokens);

std::ostream& operator<<(std::ostream&, const PackageChannel&);

}
}

#endif
