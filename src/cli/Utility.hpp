/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_Utility_hpp
#define ocmirror_cli_Utility_hpp

#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/LogLevel.hpp"
#include "common/ImageReference.hpp"
#include "common/PackageChannel.hpp"

namespace ocmirror {
namespace cli {
namespace utility {

common::ImageReference parseImageReference(const std::string& input);

common::PackageChannels parsePackageChannels(libocmirror::CLIArguments::const_iterator begin,
                                             libocmirror::CLIArguments::const_iterator end);

std::vector<std::string> readSigningKeys(const std::vector<std::string>& keyFiles);

std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments> groupOptionsAndPositionalArguments(
        const libocmirror::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libocmirror::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

void printLog(  const std::string& message, libocmirror::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libocmirror::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
