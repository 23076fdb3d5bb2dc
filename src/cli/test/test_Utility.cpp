/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <tuple>
#include <vector>

#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "cli/CLI.hpp"
#include "cli/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace cli {
namespace test {

using GroupedArguments = std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments>;

static GroupedArguments groupGlobalArguments(const libocmirror::CLIArguments& args) {
    return utility::groupOptionsAndPositionalArguments(args, cli::CLI{}.getOptionsDescription());
}

TEST_GROUP(CLIUtilityTestGroup) {
};

TEST(CLIUtilityTestGroup, groupProgramNameOnly) {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments({"ocmirror"});
    CHECK(nameAndOptionArgs == libocmirror::CLIArguments{"ocmirror"});
    CHECK_TRUE(positionalArgs.empty());
}

TEST(CLIUtilityTestGroup, groupFlagsBeforeCommand) {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments(
        {"ocmirror", "--verbose", "--no-check-signatures", "dump", "--translate", "quay.io/a/b:1"});
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"ocmirror", "--verbose", "--no-check-signatures"}));
    CHECK(positionalArgs == (libocmirror::CLIArguments{"dump", "--translate", "quay.io/a/b:1"}));
}

TEST(CLIUtilityTestGroup, groupOptionsWithSeparatedValues) {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments(
        {"ocmirror", "-s", "https://sigs.example.com", "--signing-key", "key.asc", "mirror", "src", "dst"});
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"ocmirror", "-s", "https://sigs.example.com", "--signing-key", "key.asc"}));
    CHECK(positionalArgs == (libocmirror::CLIArguments{"mirror", "src", "dst"}));
}

TEST(CLIUtilityTestGroup, groupOptionsWithAdjacentValues) {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments(
        {"ocmirror", "--signature-store=file:///srv/sigs", "-kkey.asc", "dump", "index"});
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"ocmirror", "--signature-store=file:///srv/sigs", "-kkey.asc"}));
    CHECK(positionalArgs == (libocmirror::CLIArguments{"dump", "index"}));
}

TEST(CLIUtilityTestGroup, groupOptionMissingItsValue) {
    // the value is missing: Boost reports the error when parsing the first group
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments({"ocmirror", "--dry-run", "-s"});
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"ocmirror", "--dry-run", "-s"}));
    CHECK_TRUE(positionalArgs.empty());
}

TEST(CLIUtilityTestGroup, groupUnknownOptions) {
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = groupGlobalArguments({"ocmirror", "--unknown", "-x", "dump"});
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"ocmirror", "--unknown", "-x"}));
    CHECK(positionalArgs == libocmirror::CLIArguments{"dump"});
}

TEST(CLIUtilityTestGroup, groupCommandOptions) {
    auto optionsDescription = boost::program_options::options_description();
    optionsDescription.add_options()
        ("sort-metadata", "Sort")
        ("translate", "Translate");
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = utility::groupOptionsAndPositionalArguments(
        {"dump", "--sort-metadata", "--translate", "index", "ocs-operator:stable-4.8"}, optionsDescription);
    CHECK(nameAndOptionArgs == (libocmirror::CLIArguments{"dump", "--sort-metadata", "--translate"}));
    CHECK(positionalArgs == (libocmirror::CLIArguments{"index", "ocs-operator:stable-4.8"}));
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    utility::validateNumberOfPositionalArguments({"src", "dst"}, 2, 3, "mirror");
    utility::validateNumberOfPositionalArguments({"src", "dst", "pkg"}, 2, 3, "mirror");
    CHECK_THROWS(libocmirror::Error, utility::validateNumberOfPositionalArguments({"src"}, 2, 3, "mirror"));
    CHECK_THROWS(libocmirror::Error, utility::validateNumberOfPositionalArguments({"a", "b", "c", "d"}, 2, 3, "mirror"));
}

TEST(CLIUtilityTestGroup, parseImageReference) {
    auto reference = utility::parseImageReference("quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64");
    CHECK_EQUAL(std::string{"quay.io"}, reference.getServer());
    CHECK_EQUAL(std::string{"openshift-release-dev/ocp-release"}, reference.getRepository());
    CHECK_EQUAL(std::string{"4.4.6-x86_64"}, reference.getTag());

    CHECK_THROWS(libocmirror::Error, utility::parseImageReference("quay.io/ocp-release:"));
    CHECK_THROWS(libocmirror::Error, utility::parseImageReference(""));
}

TEST(CLIUtilityTestGroup, readSigningKeys) {
    auto directory = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "ocmirror-test-keys")};
    auto first = directory.getPath() / "first.asc";
    auto second = directory.getPath() / "second.asc";
    libocmirror::filesystem::writeFile("first key", first);
    libocmirror::filesystem::writeFile("second key", second);

    auto keys = utility::readSigningKeys({second.string(), first.string()});
    CHECK((keys == std::vector<std::string>{"second key", "first key"}));

    CHECK(utility::readSigningKeys({}).empty());
    CHECK_THROWS(libocmirror::Error, utility::readSigningKeys({(directory.getPath() / "missing.asc").string()}));
    CHECK_THROWS(libocmirror::Error, utility::readSigningKeys({directory.getPath().string()}));
}

}}} // namespace

OCMIRROR_UNITTEST_MAIN_FUNCTION();
