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
#include "release/LayerArchive.hpp"
#include "test_utility/registry.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace release {
namespace test {

TEST_GROUP(LayerArchiveTestGroup) {
};

TEST(LayerArchiveTestGroup, normalizeEntryPath) {
    CHECK_EQUAL(std::string{"release-manifests/image-references"}, layer::normalizeEntryPath("./release-manifests/image-references"));
    CHECK_EQUAL(std::string{"release-manifests/image-references"}, layer::normalizeEntryPath("/release-manifests/image-references"));
    CHECK_EQUAL(std::string{"database/index.db"}, layer::normalizeEntryPath("database/index.db"));
}

TEST(LayerArchiveTestGroup, entryWithoutPathnameIsSkipped) {
    CHECK(!layer::getEntryPath(nullptr));
    CHECK_EQUAL(std::string{"database/index.db"}, *layer::getEntryPath("./database/index.db"));
}

TEST(LayerArchiveTestGroup, extractRequestedFiles) {
    auto layer = test_utility::registry::makeLayer({
        {"./release-manifests/image-references", "{\"kind\":\"ImageStream\"}"},
        {"release-manifests/release-metadata", "{\"version\":\"4.4.6\"}"},
        {"usr/bin/cluster-version-operator", std::string(4096, '\x7f')}
    });

    auto files = layer::extractFiles(layer, {"release-manifests/image-references", "release-manifests/missing"});
    CHECK_EQUAL(1, files.size());
    CHECK_EQUAL(std::string{"{\"kind\":\"ImageStream\"}"}, files["release-manifests/image-references"]);
}

TEST(LayerArchiveTestGroup, binaryContentIsPreserved) {
    auto content = std::string{"SQLite format 3\0\x01\x02\xff", 19};
    auto layer = test_utility::registry::makeLayer({{"database/index.db", content}});
    auto files = layer::extractFiles(layer, {"/database/index.db"});
    CHECK_EQUAL(1, files.size());
    CHECK(files.cbegin()->second == content);
}

TEST(LayerArchiveTestGroup, notAnArchive) {
    CHECK_THROWS(libocmirror::Error, layer::extractFiles("this is not a layer", {"database/index.db"}));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
