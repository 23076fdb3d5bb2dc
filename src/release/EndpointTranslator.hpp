/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_EndpointTranslator_hpp
#define ocmirror_release_EndpointTranslator_hpp

#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "common/ImageReference.hpp"


namespace ocmirror {
namespace release {

/**
 * Rewrites the registry endpoint (server) of image references with an
 * ordered list of regex rules. The first matching rule is applied once;
 * later rules are not tried. Endpoints equal to a rule's replacement are
 * left untouched, so translating twice yields the result of translating once.
 */
class EndpointTranslator {
public:
    struct Rule {
        Rule(const std::string& pattern, std::string replacement);
        std::string pattern;
        boost::regex regex;
        std::string replacement;
    };

public:
    EndpointTranslator() = default;
    EndpointTranslator(std::vector<Rule> rules);

    // every pattern maps to the same replacement endpoint
    static EndpointTranslator fromPatterns(const std::vector<std::string>& patterns, const std::string& replacement);

    std::string translate(const std::string& endpoint) const;
    common::ImageReference translate(const common::ImageReference& reference) const;

    const std::vector<Rule>& getRules() const { return rules; }
    bool empty() const { return rules.empty(); }

private:
    std::vector<Rule> rules;
};

}
}

#endif
