/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HelpMessage.hpp"


namespace ocmirror {
namespace cli {

HelpMessage::HelpMessage()
    : optionsDescription{new boost::program_options::options_description}
{}

HelpMessage::HelpMessage(const HelpMessage& rhs)
    : usage{rhs.usage}
    , description{rhs.description}
    , argumentsDescription{rhs.argumentsDescription}
    , optionsDescription{new boost::program_options::options_description{*rhs.optionsDescription}}
{}

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setArgumentsDescription(const std::string& argumentsDescription) {
    this->argumentsDescription = argumentsDescription;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    // options_description has no copy assignment operator
    this->optionsDescription.reset(new boost::program_options::options_description{optionsDescription});
    return *this;
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& printer) {
    os  << "Usage: " << printer.usage << "\n"
        << "\n"
        << printer.description << "\n";
    if(!printer.argumentsDescription.empty()) {
        os << "\n" << printer.argumentsDescription << "\n";
    }
    if(!printer.optionsDescription->options().empty()) {
        os << "\n" << *printer.optionsDescription;
    }
    return os;
}

}
}
