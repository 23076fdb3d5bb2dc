/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libocmirror/Error.hpp"
#include "common/PackageChannel.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace common {
namespace test {

TEST_GROUP(PackageChannelTestGroup) {
};

TEST(PackageChannelTestGroup, parseWithoutChannel) {
    auto entry = parsePackageChannel("ocs-operator");
    CHECK_EQUAL(std::string{"ocs-operator"}, entry.first);
    CHECK(isDefaultChannel(entry.second));
    CHECK_EQUAL(std::string{"<default>"}, toString(entry.second));
}

TEST(PackageChannelTestGroup, parseWithChannel) {
    auto entry = parsePackageChannel("ocs-operator:stable-4.8");
    CHECK_EQUAL(std::string{"ocs-operator"}, entry.first);
    CHECK(!isDefaultChannel(entry.second));
    CHECK(boost::get<ExplicitChannel>(entry.second) == ExplicitChannel{"stable-4.8"});
}

TEST(PackageChannelTestGroup, parseInvalid) {
    CHECK_THROWS(libocmirror::Error, parsePackageChannel(""));
    CHECK_THROWS(libocmirror::Error, parsePackageChannel(":stable"));
    CHECK_THROWS(libocmirror::Error, parsePackageChannel("ocs-operator:"));
    CHECK_THROWS(libocmirror::Error, parsePackageChannel("ocs-operator:a:b"));
}

TEST(PackageChannelTestGroup, parseMany) {
    auto channels = parsePackageChannels({"ocs-operator", "local-storage-operator:4.8"});
    CHECK_EQUAL(2, channels.size());
    CHECK(isDefaultChannel(channels.at("ocs-operator")));
    CHECK_EQUAL(std::string{"4.8"}, toString(channels.at("local-storage-operator")));

    CHECK_THROWS(libocmirror::Error, parsePackageChannels({"ocs-operator", "ocs-operator:stable"}));
    CHECK(parsePackageChannels({}).empty());
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
