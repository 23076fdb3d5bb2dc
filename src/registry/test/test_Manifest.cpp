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
#include "libocmirror/utility/digest.hpp"
#include "registry/Manifest.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace registry {
namespace test {

static const std::string configDigest = "sha256:" + std::string(64, 'c');
static const std::string layer0Digest = "sha256:" + std::string(64, '0');
static const std::string layer1Digest = "sha256:" + std::string(64, '1');

static std::string makeImageManifest() {
    return std::string{R"({
        "schemaVersion": 2,
        "mediaType": "application/vnd.docker.distribution.manifest.v2+json",
        "config": {
            "mediaType": "application/vnd.docker.container.image.v1+json",
            "size": 1500,
            "digest": ")"} + configDigest + R"("
        },
        "layers": [
            {"mediaType": "application/vnd.docker.image.rootfs.diff.tar.gzip", "size": 100, "digest": ")" + layer0Digest + R"("},
            {"mediaType": "application/vnd.docker.image.rootfs.diff.tar.gzip", "size": 200, "digest": ")" + layer1Digest + R"("}
        ]
    })";
}

TEST_GROUP(ManifestTestGroup) {
};

TEST(ManifestTestGroup, imageManifest) {
    auto raw = makeImageManifest();
    auto manifest = ManifestDoc{raw, mediatype::DOCKER_MANIFEST_V2 + "; charset=utf-8"};

    CHECK_EQUAL(mediatype::DOCKER_MANIFEST_V2, manifest.getMediaType());
    CHECK_EQUAL(libocmirror::digest::computeSha256(raw), manifest.getDigest());
    CHECK(manifest.getRaw() == raw);
    CHECK(!manifest.isList());
    CHECK_EQUAL(configDigest, manifest.getConfig().digest);
    CHECK_EQUAL(1500, manifest.getConfig().size);
    CHECK_EQUAL(2, manifest.getLayers().size());
    CHECK_EQUAL(200, manifest.getLayers()[1].size);
    CHECK(manifest.getManifests().empty());

    auto expectedBlobs = std::vector<std::string>{configDigest, layer0Digest, layer1Digest};
    CHECK(manifest.getBlobDigests() == expectedBlobs);
}

TEST(ManifestTestGroup, mediaTypeInferredFromDocument) {
    auto manifest = ManifestDoc{makeImageManifest(), "application/json"};
    CHECK_EQUAL(mediatype::DOCKER_MANIFEST_V2, manifest.getMediaType());

    auto oci = std::string{R"({
        "schemaVersion": 2,
        "config": {"mediaType": "application/vnd.oci.image.config.v1+json", "size": 10, "digest": ")"}
        + configDigest + R"("},
        "layers": []
    })";
    CHECK_EQUAL(mediatype::OCI_MANIFEST_V1, ManifestDoc{oci}.getMediaType());
}

TEST(ManifestTestGroup, manifestList) {
    auto raw = std::string{R"({
        "schemaVersion": 2,
        "mediaType": "application/vnd.docker.distribution.manifest.list.v2+json",
        "manifests": [
            {
                "mediaType": "application/vnd.docker.distribution.manifest.v2+json",
                "size": 528,
                "digest": ")"} + layer0Digest + R"(",
                "platform": {"architecture": "amd64", "os": "linux"}
            },
            {
                "mediaType": "application/vnd.docker.distribution.manifest.v2+json",
                "size": 528,
                "digest": ")" + layer1Digest + R"(",
                "platform": {"architecture": "arm64", "os": "linux", "variant": "v8"}
            }
        ]
    })";
    auto manifest = ManifestDoc{raw};

    CHECK(manifest.isList());
    CHECK_EQUAL(mediatype::DOCKER_MANIFEST_LIST_V2, manifest.getMediaType());
    CHECK_EQUAL(2, manifest.getManifests().size());
    CHECK_EQUAL(std::string{"amd64"}, manifest.getManifests()[0].platform->architecture);
    CHECK(manifest.getManifests()[0].platform->variant.empty());
    CHECK_EQUAL(std::string{"v8"}, manifest.getManifests()[1].platform->variant);
    CHECK(manifest.getBlobDigests().empty());
    CHECK_THROWS(libocmirror::Error, manifest.getConfig());
}

TEST(ManifestTestGroup, schema1IsRejected) {
    auto raw = std::string{R"({"schemaVersion": 1, "name": "library/busybox", "tag": "latest", "fsLayers": []})"};
    try {
        ManifestDoc{raw};
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::ReferenceResolution);
    }
    CHECK_THROWS(libocmirror::Error, ManifestDoc(makeImageManifest(), mediatype::DOCKER_MANIFEST_V1_SIGNED));
}

TEST(ManifestTestGroup, invalidDocuments) {
    CHECK_THROWS(libocmirror::Error, ManifestDoc("not json"));
    CHECK_THROWS(libocmirror::Error, ManifestDoc(R"({"schemaVersion": 2, "layers": []})",
                                                 mediatype::DOCKER_MANIFEST_V2));
    CHECK_THROWS(libocmirror::Error, ManifestDoc(R"({"schemaVersion": 2, "config": {"digest": "sha256:bad"}, "layers": []})",
                                                 mediatype::OCI_MANIFEST_V1));
    CHECK_THROWS(libocmirror::Error, ManifestDoc(makeImageManifest(), "application/vnd.unknown+json"));
}

static void checkMalformed(const std::string& raw, const std::string& type) {
    try {
        ManifestDoc{raw, type};
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::ReferenceResolution);
    }
}

TEST(ManifestTestGroup, malformedStructureIsReferenceResolutionError) {
    auto config = std::string{R"({"mediaType": "application/vnd.docker.container.image.v1+json", "size": 1500, "digest": ")"}
        + configDigest + R"("})";

    checkMalformed("[]", mediatype::DOCKER_MANIFEST_V2);
    checkMalformed("[]", "");
    checkMalformed(R"({"schemaVersion": 2, "manifests": {}})", mediatype::DOCKER_MANIFEST_LIST_V2);
    checkMalformed(R"({"schemaVersion": 2, "manifests": ["sha256:abc"]})", mediatype::OCI_INDEX_V1);
    checkMalformed(R"({"schemaVersion": 2, "config": "sha256:abc", "layers": []})", mediatype::DOCKER_MANIFEST_V2);
    checkMalformed(R"({"schemaVersion": 2, "layers": []})", mediatype::OCI_MANIFEST_V1);
    checkMalformed(R"({"schemaVersion": 2, "config": )" + config + R"(, "layers": {}})", mediatype::DOCKER_MANIFEST_V2);
    checkMalformed(R"({"schemaVersion": 2, "config": )" + config + R"(, "layers": [42]})", mediatype::DOCKER_MANIFEST_V2);
}

TEST(ManifestTestGroup, acceptHeader) {
    auto accepted = mediatype::acceptedManifestTypes();
    CHECK(accepted.find(mediatype::DOCKER_MANIFEST_LIST_V2) != std::string::npos);
    CHECK(accepted.find(mediatype::OCI_INDEX_V1) != std::string::npos);
    CHECK(accepted.find(mediatype::DOCKER_MANIFEST_V1) == std::string::npos);
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
