/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cstring>

#include <boost/filesystem.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/filesystem.hpp"


namespace ocmirror {
namespace cli {
namespace utility {

/**
 * Parse the reference of a release image or of an operator index image
 */
common::ImageReference parseImageReference(const std::string& input) {
    printLog(boost::format("Parsing image reference from string: %s") % input, libocmirror::LogLevel::DEBUG);

    auto reference = common::ImageReference{};
    try {
        reference = common::ImageReference::parse(input);
    }
    catch(libocmirror::Error& e) {
        auto message = boost::format("Invalid image reference '%s'") % input;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Successfully parsed image reference %s") % reference.string(), libocmirror::LogLevel::DEBUG);
    return reference;
}

/**
 * Parse the "package[:channel]" tokens that select operators from an index
 */
common::PackageChannels parsePackageChannels(libocmirror::CLIArguments::const_iterator begin,
                                             libocmirror::CLIArguments::const_iterator end) {
    auto tokens = std::vector<std::string>(begin, end);
    return common::parsePackageChannels(tokens);
}

/**
 * Read the armored public keys stored in the given files
 */
std::vector<std::string> readSigningKeys(const std::vector<std::string>& keyFiles) {
    auto keys = std::vector<std::string>{};
    keys.reserve(keyFiles.size());
    for(const auto& file : keyFiles) {
        printLog(boost::format("Reading signing key from %s") % file, libocmirror::LogLevel::DEBUG);
        if(!boost::filesystem::is_regular_file(file)) {
            auto message = boost::format("Signing key file %s does not exist") % file;
            OCMIRROR_THROW_ERROR(message.str());
        }
        keys.push_back(libocmirror::filesystem::readFile(file));
    }
    return keys;
}

static bool hasDashPrefix(const char* s) {
    bool result = strlen(s) > 1 && s[0]=='-' && s[1]!='-';
    return result;
}

static bool hasDashDashPrefix(const char* s) {
    bool result = strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
    return result;
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    return option->semantic()->max_tokens() > 0;
}

static libocmirror::CLIArguments::const_iterator processPossibleValueInNextToken(
        libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd,
        libocmirror::CLIArguments& argsGroup) {
    argsGroup.push_back(*arg);

    // a following token without dash is the value of the option
    auto nextArg = arg+1;
    if(nextArg != argsEnd && !hasDashPrefix(*nextArg)) {
        argsGroup.push_back(*nextArg);
        ++arg;
    }

    return arg;
}

static libocmirror::CLIArguments::const_iterator processDashDashOption(
        libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd,
        libocmirror::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // adjacent style ("--option=value")
    if(argString.find('=') != std::string::npos) {
        argsGroup.push_back(argString);
        return arg;
    }

    auto argOption = optionsDescription.find_nothrow(argString.substr(2), false);

    // unknown option: Boost reports the error later
    if(!argOption) {
        argsGroup.push_back(*arg);
        return arg;
    }

    if(optionTakesValue(argOption)) {
        return processPossibleValueInNextToken(arg, argsEnd, argsGroup);
    }

    argsGroup.push_back(*arg);
    return arg;
}

static libocmirror::CLIArguments::const_iterator processDashOption(
        libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd,
        libocmirror::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto shortOptions = std::string{*arg}.substr(1);

    for(auto it = shortOptions.cbegin(); it != shortOptions.cend(); ++it) {
        auto argOption = optionsDescription.find_nothrow(std::string{"-"} + *it, false);
        bool isLastCharacter = it+1 == shortOptions.cend();

        if(!argOption) {
            argsGroup.push_back(*arg);
            break;
        }

        if(optionTakesValue(argOption)) {
            if(isLastCharacter) {
                arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
            }
            else {
                // sticky value ("-kFILE")
                argsGroup.push_back(*arg);
                break;
            }
        }
        else if(isLastCharacter) {
            argsGroup.push_back(*arg);
        }
    }

    return arg;
}

/**
 * Group option arguments and positional arguments into two individual CLIArguments objects.
 *
 * The first group contains the program/command name, its options and their values, if present;
 * it is meant to be further processed by boost::program_options.
 * The second group contains all the arguments from the first positional argument onwards,
 * including the options of the subcommand, which are not parsed here.
 *
 * E.g. "ocmirror --verbose mirror --help src dst" is grouped into
 * ("ocmirror --verbose", "mirror --help src dst").
 */
std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments> groupOptionsAndPositionalArguments(
        const libocmirror::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    if(isOption(args.argv()[0])) {
        auto message = boost::format("Expected a program or command name as first argument, got '%s'") % args.argv()[0];
        OCMIRROR_THROW_ERROR(message.str());
    }
    nameAndOptionArgs.push_back(args.argv()[0]);

    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libocmirror::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processDashDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else {
            arg = processDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libocmirror::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'ocmirror help %s'") % quantity % command % command;
        printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }
}

void printLog(const std::string& message, libocmirror::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    libocmirror::Logger::getInstance().log(message, "CLI", LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libocmirror::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
