/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <set>

#include "libocmirror/Error.hpp"
#include "common/ImageReference.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace common {
namespace test {

TEST_GROUP(ImageReferenceTestGroup) {
};

TEST(ImageReferenceTestGroup, string) {
    auto ref = ImageReference{"quay.io", "openshift-release-dev/ocp-release", "4.4.6-x86_64", ""};
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64"}, ref.string());
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-release"}, ref.getFullName());

    ref = ImageReference{"quay.io", "a/b", "", "sha256:1234567890abcdef1234567890abcdef"};
    CHECK_EQUAL(std::string{"quay.io/a/b@sha256:1234567890abcdef1234567890abcdef"}, ref.string());

    ref = ImageReference{"quay.io", "a/b", "tag", "sha256:1234567890abcdef1234567890abcdef"};
    CHECK_EQUAL(std::string{"quay.io/a/b:tag@sha256:1234567890abcdef1234567890abcdef"}, ref.string());
    CHECK_EQUAL(std::string{"quay.io/a/b@sha256:1234567890abcdef1234567890abcdef"}, ref.normalize().string());
}

TEST(ImageReferenceTestGroup, parseQualified) {
    auto ref = ImageReference::parse("quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64");
    CHECK_EQUAL(std::string{"quay.io"}, ref.getServer());
    CHECK_EQUAL(std::string{"openshift-release-dev/ocp-release"}, ref.getRepository());
    CHECK_EQUAL(std::string{"4.4.6-x86_64"}, ref.getTag());
    CHECK(ref.getDigest().empty());

    ref = ImageReference::parse("localhost:5000/ocp4/openshift4@sha256:7613d8f7db639147b91b16b54b24cfa351c3cbde6aa7b7bf1b9c80c260efad06");
    CHECK_EQUAL(std::string{"localhost:5000"}, ref.getServer());
    CHECK_EQUAL(std::string{"ocp4/openshift4"}, ref.getRepository());
    CHECK(ref.getTag().empty());
    CHECK_EQUAL(std::string{"sha256:7613d8f7db639147b91b16b54b24cfa351c3cbde6aa7b7bf1b9c80c260efad06"}, ref.getDigest());

    ref = ImageReference::parse("registry.redhat.io/redhat/redhat-operator-index:v4.8");
    CHECK_EQUAL(std::string{"registry.redhat.io"}, ref.getServer());
    CHECK_EQUAL(std::string{"redhat/redhat-operator-index"}, ref.getRepository());
}

TEST(ImageReferenceTestGroup, parseDockerHubDefaults) {
    auto ref = ImageReference::parse("alpine");
    CHECK_EQUAL(std::string{"docker.io/library/alpine:latest"}, ref.string());

    ref = ImageReference::parse("docker.io/alpine");
    CHECK_EQUAL(std::string{"docker.io/library/alpine:latest"}, ref.string());

    ref = ImageReference::parse("ethcscs/mpich:3.1.4");
    CHECK_EQUAL(std::string{"docker.io/ethcscs/mpich:3.1.4"}, ref.string());

    ref = ImageReference::parse("localhost/image");
    CHECK_EQUAL(std::string{"localhost"}, ref.getServer());
}

TEST(ImageReferenceTestGroup, parseInvalid) {
    CHECK_THROWS(libocmirror::Error, ImageReference::parse(""));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("namespace/image/"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("image:tag:tag"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("image@sha256:short"));
    try {
        ImageReference::parse("quay.io/a/b@@");
        FAIL("expected an exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::ReferenceResolution);
    }
}

TEST(ImageReferenceTestGroup, derivationLeavesOriginalUntouched) {
    auto original = ImageReference::parse("quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64");

    auto mirrored = original.withServer("mirror.local:5000");
    CHECK_EQUAL(std::string{"mirror.local:5000/openshift-release-dev/ocp-release:4.4.6-x86_64"}, mirrored.string());
    CHECK_EQUAL(std::string{"quay.io"}, original.getServer());

    auto pinned = original.withDigest("sha256:1234567890abcdef1234567890abcdef").withTag("");
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-release@sha256:1234567890abcdef1234567890abcdef"},
                pinned.string());
    CHECK_EQUAL(std::string{"4.4.6-x86_64"}, original.getTag());

    auto moved = original.withRepository("ocp4/release");
    CHECK_EQUAL(std::string{"quay.io/ocp4/release:4.4.6-x86_64"}, moved.string());
}

TEST(ImageReferenceTestGroup, equality) {
    auto a = ImageReference::parse("quay.io/ns/image:1");
    auto b = ImageReference::parse("mirror.local/ns/image:1");
    CHECK(a != b);
    CHECK(a.equalsIgnoringServer(b));
    CHECK(!a.equalsIgnoringServer(b.withTag("2")));
    CHECK(a == ImageReference::parse("quay.io/ns/image:1"));

    auto set = std::set<ImageReference>{a, b, ImageReference::parse("quay.io/ns/image:1")};
    CHECK_EQUAL(2, set.size());
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
