/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <iostream>
#include <stdexcept>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/utility/environment.hpp"
#include "libocmirror/utility/string.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace ocmirror {
namespace cli {

static const std::string SIGNATURE_STORE_VARIABLE = "OPM_SIGNATURE_STORE";
static const std::string SIGNING_KEY_VARIABLE = "OPM_SIGNING_KEY";

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)")
        ("check-signatures", "Require a valid signature of the index (default)")
        ("no-check-signatures", "Do not verify the signatures of the index")
        ("dry-run", "Resolve and plan without writing to the destination")
        ("signature-store,s",
            boost::program_options::value<std::vector<std::string>>()->composing(),
            "Signature store URL, repeatable (default from $OPM_SIGNATURE_STORE, else the built-in stores)")
        ("signing-key,k",
            boost::program_options::value<std::vector<std::string>>()->composing(),
            "File with an armored public key trusted for verification, repeatable (default from $OPM_SIGNING_KEY)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    boost::program_options::variables_map values;
    auto factory = cli::CommandObjectsFactory{};
    auto& logger = libocmirror::Logger::getInstance();

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values); // throw if options are invalid
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'ocmirror help'") % e.what();
        logger.log(message, "CLI", libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }

    // configure logger
    if(values.count("debug")) {
        logger.setLevel(libocmirror::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libocmirror::LogLevel::INFO);
    }
    else {
        logger.setLevel(libocmirror::LogLevel::WARN);
    }

    // --help overrides other arguments and options
    if(values.count("help")) {
        return factory.makeCommandObject("help", libocmirror::CLIArguments{}, std::move(conf));
    }

    // --version overrides other arguments and options
    if(values.count("version")) {
        return factory.makeCommandObject("version", libocmirror::CLIArguments{}, std::move(conf));
    }

    // no command name => return help command
    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    auto commandName = std::string{positionalArgs.argv()[0]};

    bool isCommandHelpFollowedByAnArgument = commandName == "help" && positionalArgs.argc() > 1;
    if(isCommandHelpFollowedByAnArgument) {
        return parseCommandHelpOfCommand(positionalArgs);
    }

    if(commandName != "help" && commandName != "version") {
        parseMirrorOptions(values, *conf);
    }

    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

void CLI::parseMirrorOptions(const boost::program_options::variables_map& values, common::Config& conf) const {
    if(values.count("check-signatures") && values.count("no-check-signatures")) {
        auto message = boost::format("The options '--check-signatures' and '--no-check-signatures' cannot be used together"
                                     "\nSee 'ocmirror help'");
        utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }
    conf.mirror.checkSignatures = values.count("no-check-signatures") == 0;
    conf.mirror.dryRun = values.count("dry-run") > 0;

    if(values.count("signature-store")) {
        conf.mirror.signatureStores = values["signature-store"].as<std::vector<std::string>>();
    }
    else if(auto stores = libocmirror::environment::lookupVariable(SIGNATURE_STORE_VARIABLE)) {
        conf.mirror.signatureStores = libocmirror::string::splitWhitespaceSeparated(*stores);
    }
    if(conf.mirror.signatureStores.empty()) {
        conf.mirror.signatureStores = conf.getDefaultSignatureStores();
    }

    auto keyFiles = std::vector<std::string>{};
    if(values.count("signing-key")) {
        keyFiles = values["signing-key"].as<std::vector<std::string>>();
    }
    else if(auto keys = libocmirror::environment::lookupVariable(SIGNING_KEY_VARIABLE)) {
        keyFiles = libocmirror::string::splitWhitespaceSeparated(*keys);
    }

    try {
        conf.mirror.signingKeys = utility::readSigningKeys(keyFiles);
    }
    catch(libocmirror::Error& e) {
        auto message = boost::format("%s\nSee 'ocmirror help'") % e.what();
        utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_RETHROW_ERROR(e, message.str(), libocmirror::LogLevel::INFO);
    }

    utility::printLog(boost::format("signature checks: %s, dry run: %s, %d signature store(s), %d signing key(s)")
                        % (conf.mirror.checkSignatures ? "on" : "off")
                        % (conf.mirror.dryRun ? "on" : "off")
                        % conf.mirror.signatureStores.size()
                        % conf.mirror.signingKeys.size(),
                      libocmirror::LogLevel::DEBUG);
}

std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libocmirror::CLIArguments& args) const {
    auto optionsDescription = boost::program_options::options_description();
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    if(nameAndOptionArgs.argc() > 1) {
        auto message = boost::format("Command 'help' doesn't support options");
        utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }
    if(positionalArgs.argc() > 1) {
        auto message = boost::format("Too many arguments for command 'help'"
                                     "\nSee 'ocmirror help help'");
        utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }
    auto factory = cli::CommandObjectsFactory{};
    auto commandName = std::string{ positionalArgs.argv()[0] };
    return factory.makeCommandObjectHelpOfCommand(commandName);
}

} // namespace
} // namespace
