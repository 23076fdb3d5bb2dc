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
#include "common/ImageReference.hpp"
#include "registry/HttpRegistryClient.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace registry {
namespace test {

TEST_GROUP(HttpRegistryClientTestGroup) {
};

// nothing listens on port 1 of the loopback interface
TEST(HttpRegistryClientTestGroup, unreachableRegistryIsTransportError) {
    auto configRAII = test_utility::config::makeConfig();
    auto client = HttpRegistryClient{configRAII.config};
    auto reference = common::ImageReference::parse("127.0.0.1:1/openshift/release:4.8");

    try {
        client.fetchManifest(reference);
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::Transport);
    }

    try {
        client.blobExists(reference, "sha256:" + std::string(64, 'a'));
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::Transport);
    }
}

TEST(HttpRegistryClientTestGroup, blobDownloadRetriesAreBounded) {
    auto configRAII = test_utility::config::makeConfig();
    auto client = HttpRegistryClient{configRAII.config};
    auto reference = common::ImageReference::parse("127.0.0.1:1/openshift/release:4.8");

    try {
        client.fetchBlob(reference, "sha256:" + std::string(64, 'a'));
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::Transport);
        CHECK(e.getErrorTrace().size() >= 2);
    }
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
