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
#include "signature/AtomicPayload.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace signature {
namespace test {

static const std::string digest = "sha256:" + std::string(64, 'd');

TEST_GROUP(AtomicPayloadTestGroup) {
};

TEST(AtomicPayloadTestGroup, serialize) {
    auto payload = AtomicPayload{};
    payload.dockerReference = "quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64";
    payload.manifestDigest = digest;
    payload.creator = "ocmirror 1.0";
    payload.timestamp = 1590000000;

    auto expected = std::string{R"({"critical":{"identity":{"docker-reference":"quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64"},)"}
        + R"("image":{"docker-manifest-digest":")" + digest + R"("},"type":"atomic container signature"},)"
        + R"("optional":{"creator":"ocmirror 1.0","timestamp":1590000000}})";
    CHECK_EQUAL(expected, payload.serialize());

    payload.creator.clear();
    payload.timestamp = boost::none;
    CHECK(payload.serialize().find(R"("optional":{})") != std::string::npos);
}

TEST(AtomicPayloadTestGroup, parseAnyKeyOrder) {
    auto document = std::string{R"({
        "optional": {"timestamp": 42, "creator": "someone"},
        "critical": {
            "type": "atomic container signature",
            "image": {"docker-manifest-digest": ")"} + digest + R"("},
            "identity": {"docker-reference": "registry.example.com/a/b:1"}
        }
    })";
    auto payload = AtomicPayload::parse(document);
    CHECK_EQUAL(digest, payload.manifestDigest);
    CHECK_EQUAL(std::string{"registry.example.com/a/b:1"}, payload.dockerReference);
    CHECK_EQUAL(std::string{"someone"}, payload.creator);
    CHECK_EQUAL(42, *payload.timestamp);

    auto withoutOptional = std::string{R"({"critical":{"type":"atomic container signature",)"}
        + R"("image":{"docker-manifest-digest":")" + digest + R"("},"identity":{"docker-reference":"a/b"}}})";
    payload = AtomicPayload::parse(withoutOptional);
    CHECK(payload.creator.empty());
    CHECK(!payload.timestamp);
}

TEST(AtomicPayloadTestGroup, parseInvalid) {
    CHECK_THROWS(libocmirror::Error, AtomicPayload::parse(""));
    CHECK_THROWS(libocmirror::Error, AtomicPayload::parse("plain text, not a payload"));
    CHECK_THROWS(libocmirror::Error, AtomicPayload::parse(R"({"critical":{"type":"atomic container signature"}})"));
    auto wrongType = std::string{R"({"critical":{"type":"cosign container image signature",)"}
        + R"("image":{"docker-manifest-digest":")" + digest + R"("},"identity":{"docker-reference":"a/b"}}})";
    CHECK_THROWS(libocmirror::Error, AtomicPayload::parse(wrongType));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
