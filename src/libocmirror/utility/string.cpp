/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <random>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libocmirror/Error.hpp"

namespace libocmirror {
namespace string {

std::string replace(std::string buf, const std::string& from, const std::string& to) {
    if(from.empty()) {
        return buf;
    }
    std::string::size_type pos = buf.find(from);
    while(pos != std::string::npos){
        buf.replace(pos, from.size(), to);
        pos = buf.find(from, pos + to.size());
    }
    return buf;
}

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        OCMIRROR_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

std::vector<std::string> splitWhitespaceSeparated(const std::string& input) {
    auto tokens = std::vector<std::string>{};
    auto trimmed = boost::algorithm::trim_copy(input);
    if(trimmed.empty()) {
        return tokens;
    }
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return tokens;
}

std::string generateRandom(size_t size) {
    thread_local auto generator = std::mt19937{std::random_device{}()};
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');

    auto string = std::string(size, '.');
    for(auto& c : string) {
        c = 'a' + dist(generator);
    }
    return string;
}

}}
