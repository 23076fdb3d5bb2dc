/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/EndpointTranslator.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"


namespace ocmirror {
namespace release {

EndpointTranslator::Rule::Rule(const std::string& pattern, std::string replacement)
    : pattern{pattern}
    , replacement{std::move(replacement)}
{
    try {
        regex = boost::regex{pattern};
    }
    catch(const boost::regex_error& e) {
        auto message = boost::format("Invalid endpoint translation pattern \"%s\"") % pattern;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

EndpointTranslator::EndpointTranslator(std::vector<Rule> rules)
    : rules{std::move(rules)}
{}

EndpointTranslator EndpointTranslator::fromPatterns(const std::vector<std::string>& patterns, const std::string& replacement) {
    auto rules = std::vector<Rule>{};
    for(const auto& pattern : patterns) {
        rules.emplace_back(pattern, replacement);
    }
    return EndpointTranslator{std::move(rules)};
}

std::string EndpointTranslator::translate(const std::string& endpoint) const {
    for(const auto& rule : rules) {
        if(boost::regex_search(endpoint, rule.regex)) {
            // an endpoint that already is the replacement of its matching rule stays as is
            if(endpoint == rule.replacement) {
                return endpoint;
            }
            auto translated = boost::regex_replace(endpoint, rule.regex, rule.replacement,
                                                   boost::format_first_only | boost::regex_constants::format_literal);
            libocmirror::logMessage(boost::format("Translated endpoint %s -> %s (%s)") % endpoint % translated % rule.pattern,
                                    libocmirror::LogLevel::DEBUG);
            return translated;
        }
    }
    return endpoint;
}

common::ImageReference EndpointTranslator::translate(const common::ImageReference& reference) const {
    return reference.withServer(translate(reference.getServer()));
}

}
}
