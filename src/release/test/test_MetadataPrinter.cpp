/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>

#include "common/ImageReference.hpp"
#include "registry/Manifest.hpp"
#include "release/Metadata.hpp"
#include "release/MetadataPrinter.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace release {
namespace test {

static const std::string digestA = "sha256:" + std::string(64, 'a');
static const std::string digestB = "sha256:" + std::string(64, 'b');

static ReleaseMetadata makeReleaseMetadata() {
    auto metadata = ReleaseMetadata{};
    metadata.reference = common::ImageReference::parse("quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64");
    metadata.manifestDigest = digestA;
    metadata.signatureStores = {"https://storage.example.com/signatures", "https://mirror.example.com/signatures"};
    metadata.signingKeys = {"key"};
    metadata.blobs[digestB] = {"openshift-release-dev/ocp-release", "openshift-release-dev/ocp-v4.0-art-dev"};
    metadata.manifests[metadata.reference.withDigest(digestA).normalize()] = "4.4.6-x86_64";
    return metadata;
}

static OperatorMetadata makeOperatorMetadata() {
    auto metadata = OperatorMetadata{};
    metadata.reference = common::ImageReference::parse("registry.redhat.io/redhat/redhat-operator-index:v4.8");
    metadata.manifestDigest = digestA;
    metadata.indexDatabase = std::string(2048, 'x');
    auto record = OperatorRecord{};
    record.package = "ocs-operator";
    record.channel = "stable-4.8";
    record.bundleName = "ocs-operator.v4.8.2";
    record.bundleImage = common::ImageReference::parse("registry.redhat.io/ocs4/ocs-operator-bundle@" + digestB);
    record.relatedImages = {common::ImageReference::parse("registry.redhat.io/ocs4/rook-ceph-rhel8-operator@" + digestB),
                            common::ImageReference::parse("registry.redhat.io/ocs4/cephcsi-rhel8@" + digestA)};
    metadata.operators = {record, record};
    metadata.operators[0].package = "zz-operator";
    return metadata;
}

TEST_GROUP(MetadataPrinterTestGroup) {
};

TEST(MetadataPrinterTestGroup, release) {
    auto out = std::ostringstream{};
    MetadataPrinter{}.print(makeReleaseMetadata(), out);
    auto expected =
        "reference: quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64\n"
        "manifestDigest: " + digestA + "\n"
        "signatureStores:\n"
        "  - https://storage.example.com/signatures\n"
        "  - https://mirror.example.com/signatures\n"
        "signingKeys: 1\n"
        "blobs: # 1\n"
        "  " + digestB + ":\n"
        "    - openshift-release-dev/ocp-release\n"
        "    - openshift-release-dev/ocp-v4.0-art-dev\n"
        "manifests: # 1\n"
        "  quay.io/openshift-release-dev/ocp-release@" + digestA + ": 4.4.6-x86_64\n";
    CHECK_EQUAL(expected, out.str());
}

TEST(MetadataPrinterTestGroup, sortedRelease) {
    auto out = std::ostringstream{};
    MetadataPrinter{true}.print(makeReleaseMetadata(), out);
    auto text = out.str();
    CHECK(text.find("https://mirror.example.com") < text.find("https://storage.example.com"));
}

TEST(MetadataPrinterTestGroup, operators) {
    auto unsorted = std::ostringstream{};
    MetadataPrinter{}.print(makeOperatorMetadata(), unsorted);
    auto text = unsorted.str();
    CHECK(text.find("indexDatabase: 2048 bytes\n") != std::string::npos);
    CHECK(text.find("    channel: stable-4.8\n") != std::string::npos);
    CHECK(text.find("    bundleImage: registry.redhat.io/ocs4/ocs-operator-bundle@" + digestB + "\n") != std::string::npos);
    CHECK(text.find("zz-operator") < text.find("package: ocs-operator"));
    CHECK(text.find("rook-ceph-rhel8-operator") < text.find("cephcsi-rhel8"));

    auto sorted = std::ostringstream{};
    MetadataPrinter{true}.print(makeOperatorMetadata(), sorted);
    text = sorted.str();
    CHECK(text.find("package: ocs-operator") < text.find("zz-operator"));
    CHECK(text.find("cephcsi-rhel8") < text.find("rook-ceph-rhel8-operator"));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
