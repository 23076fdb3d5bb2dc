/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "cli/CommandDump.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandMirror.hpp"
#include "cli/CommandVersion.hpp"


namespace ocmirror {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandDump>("dump");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandMirror>("mirror");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    checkCommandName(commandName);
    return map.find(commandName)->second();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libocmirror::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    checkCommandName(commandName);
    return mapWithArguments.find(commandName)->second(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    return std::unique_ptr<cli::Command>{new cli::CommandHelpOfCommand{std::move(commandObject)}};
}

void CommandObjectsFactory::checkCommandName(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        auto message = boost::format("'%s' is not an ocmirror command\nSee 'ocmirror help'") % commandName;
        libocmirror::Logger::getInstance().log(message, "CommandObjectsFactory", libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::DEBUG);
    }
}

}
}
