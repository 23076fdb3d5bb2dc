/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <cstdlib>
#include <cstring>
#include <algorithm>

#include <boost/algorithm/string/join.hpp>

namespace libocmirror {

CLIArguments::CLIArguments() {
    args.push_back(nullptr); // argv is null-terminated
}

CLIArguments::CLIArguments(const CLIArguments& rhs) : CLIArguments() {
    *this += rhs;
}

CLIArguments::CLIArguments(int argc, char* argv[]) : CLIArguments() {
    for(int i=0; i<argc; ++i) {
        push_back(argv[i]);
    }
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args) : CLIArguments(args.begin(), args.end())
{}

CLIArguments::~CLIArguments() {
    clear();
}

CLIArguments& CLIArguments::operator=(const CLIArguments& rhs) {
    if(this != &rhs) {
        clear();
        *this += rhs;
    }
    return *this;
}

void CLIArguments::push_back(const std::string& arg) {
    args.back() = strdup(arg.c_str());
    args.push_back(nullptr);
}

int CLIArguments::argc() const {
    return args.size() - 1;
}

char** CLIArguments::argv() const {
    return const_cast<char**>(args.data());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend() - 1;
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    auto copy = std::vector<std::string>(rhs.begin(), rhs.end()); // rhs may alias *this
    for(const auto& arg : copy) {
        push_back(arg);
    }
    return *this;
}

bool CLIArguments::empty() const {
    return begin() == end();
}

void CLIArguments::clear() {
    for(auto* ptr : args) {
        free(ptr);
    }
    args = { nullptr };
}

std::string CLIArguments::string() const {
    auto stringArgs = std::vector<std::string>{begin(), end()};
    return boost::algorithm::join(stringArgs, " ");
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    return lhs.argc() == rhs.argc()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](const char* l, const char* r) { return strcmp(l, r) == 0; });
}

const CLIArguments operator+(const CLIArguments& lhs, const CLIArguments& rhs) {
    auto result = lhs;
    result += rhs;
    return result;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    auto separator = "";
    for(const auto* arg : args) {
        os << separator << "\"" << arg << "\"";
        separator = ", ";
    }
    os << "]";
    return os;
}

}
