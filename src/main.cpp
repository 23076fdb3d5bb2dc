/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <clocale>
#include <exception>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "common/Config.hpp"
#include "cli/CLI.hpp"

using namespace ocmirror;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libocmirror::Logger::getInstance();

    try {
        auto installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto config = std::make_shared<common::Config>(installationPrefixDir);

        auto args = libocmirror::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libocmirror::Error& e) {
        // command line errors were already reported to the user with a pointer to the help
        if(e.getLogLevel() > libocmirror::LogLevel::INFO) {
            logger.log(std::string{e.what()}, "main", libocmirror::LogLevel::ERROR);
        }
        // the full trace needs --verbose or --debug
        if(logger.getLevel() <= libocmirror::LogLevel::INFO) {
            logger.logErrorTrace(e, "main");
        }
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libocmirror::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
