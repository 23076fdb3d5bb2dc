/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>

#include "libocmirror/Error.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/utility/digest.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "common/Config.hpp"
#include "common/PackageChannel.hpp"
#include "release/EndpointTranslator.hpp"
#include "release/OperatorMetadataResolver.hpp"
#include "release/SignatureVerifier.hpp"
#include "test_utility/config.hpp"
#include "test_utility/registry.hpp"
#include "test_utility/release.hpp"
#include "test_utility/signature.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace release {
namespace test {

static const std::string server = "registry.example.com";

struct Fixture {
    Fixture()
        : index{test_utility::release::addOperatorIndexImage(*registry, server, workDirectory.getPath())}
    {}

    OperatorMetadata resolve(const common::PackageChannels& packageChannels) {
        auto verifier = std::make_shared<SignatureVerifier>(configRAII.config, store, []() {
            return std::make_shared<test_utility::signature::FakeGpgEngine>();
        });
        auto resolver = OperatorMetadataResolver{configRAII.config, registry, verifier};
        return resolver.resolve(index.reference, packageChannels, translator, {}, {}, false);
    }

    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    libocmirror::PathRAII workDirectory{libocmirror::filesystem::makeTemporaryDirectory(configRAII.config->getTempDir(), "ocmirror-test-index")};
    std::shared_ptr<test_utility::registry::InMemoryRegistry> registry = std::make_shared<test_utility::registry::InMemoryRegistry>();
    std::shared_ptr<test_utility::signature::InMemorySignatureStore> store = std::make_shared<test_utility::signature::InMemorySignatureStore>();
    EndpointTranslator translator = EndpointTranslator::fromPatterns(common::Config::DEFAULT_TRANSLATION_PATTERNS, server);
    test_utility::release::OperatorIndexImage index;
};

template<class Function>
static libocmirror::ErrorKind getErrorKind(Function function) {
    try {
        function();
    }
    catch(const libocmirror::Error& e) {
        return e.getKind();
    }
    FAIL("Expected exception");
    return libocmirror::ErrorKind::Generic;
}

TEST_GROUP(OperatorMetadataResolverTestGroup) {
};

TEST(OperatorMetadataResolverTestGroup, parseImageLabels) {
    auto labels = OperatorMetadataResolver::parseImageLabels(R"({"config":{"Labels":{"a":"1","b":"2","c":3}}})");
    CHECK_EQUAL(2, labels.size());
    CHECK_EQUAL(std::string{"1"}, labels["a"]);
    CHECK(OperatorMetadataResolver::parseImageLabels(R"({"config":{"Labels":null}})").empty());
    CHECK(OperatorMetadataResolver::parseImageLabels(R"({"architecture":"amd64"})").empty());
}

TEST(OperatorMetadataResolverTestGroup, parseRelatedImagesLabel) {
    auto images = OperatorMetadataResolver::parseRelatedImagesLabel(
        R"([{"name":"operator","image":"quay.io/a/b:1"},"quay.io/a/c:2"])");
    CHECK_EQUAL(2, images.size());
    CHECK_EQUAL(std::string{"quay.io/a/b:1"}, images[0]);
    CHECK_EQUAL(std::string{"quay.io/a/c:2"}, images[1]);
    CHECK_THROWS(libocmirror::Error, OperatorMetadataResolver::parseRelatedImagesLabel(R"({"image":"quay.io/a/b:1"})"));
    CHECK_THROWS(libocmirror::Error, OperatorMetadataResolver::parseRelatedImagesLabel("[1]"));
}

TEST(OperatorMetadataResolverTestGroup, defaultChannel) {
    auto fixture = Fixture{};
    auto metadata = fixture.resolve({{"ocs-operator", common::DefaultChannel{}}});

    CHECK(metadata.reference == fixture.index.reference);
    CHECK_EQUAL(fixture.index.manifest.getDigest(), metadata.manifestDigest);
    CHECK(libocmirror::digest::computeSha256(metadata.indexDatabase).size() > 0);
    CHECK_EQUAL(std::string{"SQLite format 3"}, metadata.indexDatabase.substr(0, 15));

    CHECK_EQUAL(1, metadata.operators.size());
    const auto& record = metadata.operators[0];
    CHECK_EQUAL(std::string{"ocs-operator"}, record.package);
    CHECK_EQUAL(std::string{"stable-4.8"}, record.channel);
    CHECK_EQUAL(std::string{"ocs-operator.v4.8.2"}, record.bundleName);
    CHECK_EQUAL(server, record.bundleImage.getServer());
    CHECK(record.bundleImage.equalsIgnoringServer(fixture.index.bundle));

    CHECK_EQUAL(fixture.index.relatedImages.size(), record.relatedImages.size());
    for(size_t i = 0; i < record.relatedImages.size(); ++i) {
        CHECK(record.relatedImages[i].equalsIgnoringServer(fixture.index.relatedImages[i]));
        CHECK_EQUAL(server, record.relatedImages[i].getServer());
    }

    // index, bundle and two related images
    CHECK_EQUAL(4, metadata.manifests.size());
    CHECK_EQUAL(std::string{"v4.8"}, metadata.manifests.at(fixture.index.reference.withDigest(metadata.manifestDigest).normalize()));
    CHECK_EQUAL(std::string{"ocs-operator.v4.8.2"}, metadata.manifests.at(record.bundleImage));
    for(const auto& blob : metadata.blobs) {
        CHECK(!blob.second.empty());
    }
}

TEST(OperatorMetadataResolverTestGroup, explicitChannel) {
    auto fixture = Fixture{};
    auto metadata = fixture.resolve({{"ocs-operator", common::ExplicitChannel{"eus-4.6"}}});
    CHECK_EQUAL(1, metadata.operators.size());
    CHECK_EQUAL(std::string{"eus-4.6"}, metadata.operators[0].channel);
    CHECK_EQUAL(std::string{"ocs-operator.v4.6.9"}, metadata.operators[0].bundleName);
    CHECK(metadata.operators[0].relatedImages.empty());
    CHECK_EQUAL(2, metadata.manifests.size());
}

TEST(OperatorMetadataResolverTestGroup, indexOnly) {
    auto fixture = Fixture{};
    auto metadata = fixture.resolve({});
    CHECK(metadata.operators.empty());
    CHECK_EQUAL(1, metadata.manifests.size());
    CHECK(!metadata.indexDatabase.empty());
}

TEST(OperatorMetadataResolverTestGroup, missingPackageOrChannel) {
    auto fixture = Fixture{};
    CHECK(libocmirror::ErrorKind::PackageNotFound == getErrorKind([&]() {
        fixture.resolve({{"missing-operator", common::DefaultChannel{}}});
    }));
    CHECK(libocmirror::ErrorKind::PackageNotFound == getErrorKind([&]() {
        fixture.resolve({{"missing-operator", common::ExplicitChannel{"stable"}}});
    }));
    CHECK(libocmirror::ErrorKind::ChannelNotFound == getErrorKind([&]() {
        fixture.resolve({{"ocs-operator", common::ExplicitChannel{"fast"}}});
    }));
    CHECK(libocmirror::ErrorKind::ChannelNotFound == getErrorKind([&]() {
        fixture.resolve({{"orphan-operator", common::DefaultChannel{}}});
    }));
}

TEST(OperatorMetadataResolverTestGroup, notAnIndexImage) {
    auto fixture = Fixture{};
    auto reference = common::ImageReference::parse(server + "/redhat/ubi8:latest");
    test_utility::registry::addImage(*fixture.registry, reference, {test_utility::registry::makeLayer({{"etc/os-release", "ID=rhel"}})});
    auto verifier = std::make_shared<SignatureVerifier>(fixture.configRAII.config, fixture.store);
    auto resolver = OperatorMetadataResolver{fixture.configRAII.config, fixture.registry, verifier};
    CHECK(libocmirror::ErrorKind::ReferenceResolution == getErrorKind([&]() {
        resolver.resolve(reference, {}, fixture.translator, {}, {}, false);
    }));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
