/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandMirror_hpp
#define ocmirror_cli_CommandMirror_hpp

#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "common/Config.hpp"
#include "registry/HttpRegistryClient.hpp"
#include "registry/RegistryClient.hpp"
#include "signature/SignatureStore.hpp"
#include "release/EndpointTranslator.hpp"
#include "release/MirrorEngine.hpp"
#include "release/OperatorMetadataResolver.hpp"
#include "release/ReleaseMetadataResolver.hpp"
#include "release/SignatureVerifier.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace ocmirror {
namespace cli {

class CommandMirror : public Command {
public:
    CommandMirror() = default;

    CommandMirror(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        auto client = std::make_shared<registry::HttpRegistryClient>(conf);
        auto verifier = std::make_shared<release::SignatureVerifier>(conf, signature::makeSignatureStore(conf));
        execute(client, verifier);
    }

    // one client serves both the source and the destination registries
    void execute(std::shared_ptr<registry::RegistryClient> client,
                 std::shared_ptr<const release::SignatureVerifier> verifier) const {
        const auto& command = conf->commandMirror;
        const auto& mirror = conf->mirror;

        // components are fetched from the registry of the source index, not from their upstream registries
        auto translator = release::EndpointTranslator::fromPatterns(conf->getTranslationPatterns(), command.source.getServer());
        auto engine = release::MirrorEngine{conf, client};

        utility::printLog(boost::format("Retrieving metadata for index: %s ...") % command.source.string(),
                          libocmirror::LogLevel::INFO);

        if(command.packageChannels.empty()) {
            auto resolver = release::ReleaseMetadataResolver{conf, client, verifier};
            auto metadata = resolver.resolve(command.source, translator,
                                             mirror.signatureStores, mirror.signingKeys, mirror.checkSignatures);
            utility::printLog(boost::format("Mirroring index to: %s ...") % command.destination.string(),
                              libocmirror::LogLevel::INFO);
            engine.putRelease(command.destination, metadata, mirror.dryRun);
        }
        else {
            auto resolver = release::OperatorMetadataResolver{conf, client, verifier};
            auto metadata = resolver.resolve(command.source, command.packageChannels, translator,
                                             mirror.signatureStores, mirror.signingKeys, mirror.checkSignatures);
            utility::printLog(boost::format("Mirroring index to: %s ...") % command.destination.string(),
                              libocmirror::LogLevel::INFO);
            engine.putOperators(command.destination, metadata, mirror.dryRun);
        }

        if(mirror.dryRun) {
            utility::printLog(boost::format("Dry run completed for index: %s") % command.destination.string(),
                              libocmirror::LogLevel::GENERAL);
        }
        else {
            utility::printLog(boost::format("Mirrored index to: %s") % command.destination.string(),
                              libocmirror::LogLevel::GENERAL);
        }
    }

    std::string getBriefDescription() const override {
        return "Copy a release or operator index to another registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("ocmirror [GLOBAL OPTIONS] mirror SOURCE DESTINATION [PACKAGE[:CHANNEL]...]")
            .setDescription(getBriefDescription())
            .setArgumentsDescription(
                "SOURCE is a release image, or an operator catalog index image when packages are given.\n"
                "The signature of SOURCE is verified unless '--no-check-signatures' is given.\n"
                "With '--dry-run' the copy is planned and logged, nothing is written.");
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libocmirror::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of mirror command"), libocmirror::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // SOURCE and DESTINATION followed by any number of packages
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 2, std::numeric_limits<int>::max(), "mirror");

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'mirror' doesn't support options"
                                         "\nSee 'ocmirror help mirror'");
            utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        try {
            auto& command = conf->commandMirror;
            command.source = cli::utility::parseImageReference(positionalArgs.argv()[0]);
            command.destination = cli::utility::parseImageReference(positionalArgs.argv()[1]);
            command.packageChannels = cli::utility::parsePackageChannels(positionalArgs.begin()+2, positionalArgs.end());
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'ocmirror help mirror'") % e.what();
            cli::utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libocmirror::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
