/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandDump_hpp
#define ocmirror_cli_CommandDump_hpp

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
#include "release/MetadataPrinter.hpp"
#include "release/OperatorMetadataResolver.hpp"
#include "release/ReleaseMetadataResolver.hpp"
#include "release/SignatureVerifier.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace ocmirror {
namespace cli {

class CommandDump : public Command {
public:
    CommandDump() {
        initializeOptionsDescription();
    }

    CommandDump(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto client = std::make_shared<registry::HttpRegistryClient>(conf);
        auto verifier = std::make_shared<release::SignatureVerifier>(conf, signature::makeSignatureStore(conf));
        execute(client, verifier, std::cout);
    }

    void execute(std::shared_ptr<registry::RegistryClient> client,
                 std::shared_ptr<const release::SignatureVerifier> verifier,
                 std::ostream& out) const {
        const auto& dump = conf->commandDump;
        const auto& mirror = conf->mirror;

        auto translator = release::EndpointTranslator{};
        if(dump.translate) {
            translator = release::EndpointTranslator::fromPatterns(conf->getTranslationPatterns(), dump.index.getServer());
        }

        utility::printLog(boost::format("Retrieving metadata for index: %s ...") % dump.index.string(),
                          libocmirror::LogLevel::INFO);

        auto printer = release::MetadataPrinter{dump.sortMetadata};
        if(dump.packageChannels.empty()) {
            auto resolver = release::ReleaseMetadataResolver{conf, client, verifier};
            auto metadata = resolver.resolve(dump.index, translator,
                                             mirror.signatureStores, mirror.signingKeys, mirror.checkSignatures);
            printer.print(metadata, out);
        }
        else {
            auto resolver = release::OperatorMetadataResolver{conf, client, verifier};
            auto metadata = resolver.resolve(dump.index, dump.packageChannels, translator,
                                             mirror.signatureStores, mirror.signingKeys, mirror.checkSignatures);
            printer.print(metadata, out);
        }
    }

    std::string getBriefDescription() const override {
        return "Resolve a release or operator index and print its metadata";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("ocmirror [GLOBAL OPTIONS] dump [OPTIONS] INDEX [PACKAGE[:CHANNEL]...]")
            .setDescription(getBriefDescription())
            .setArgumentsDescription(
                "INDEX is a release image, or an operator catalog index image when packages are given.\n"
                "A package without channel selects the default channel of the package.")
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("sort-metadata", "Sort signature stores, operators and related images in the output")
            ("translate", "Rewrite the well-known source registries to the registry of INDEX");
    }

    void parseCommandArguments(const libocmirror::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of dump command"), libocmirror::LogLevel::DEBUG);

        libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // INDEX followed by any number of packages
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, std::numeric_limits<int>::max(), "dump");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            auto& dump = conf->commandDump;
            dump.sortMetadata = values.count("sort-metadata") > 0;
            dump.translate = values.count("translate") > 0;
            dump.index = cli::utility::parseImageReference(positionalArgs.argv()[0]);
            dump.packageChannels = cli::utility::parsePackageChannels(positionalArgs.begin()+1, positionalArgs.end());
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'ocmirror help dump'") % e.what();
            cli::utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libocmirror::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
