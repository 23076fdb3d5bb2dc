/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <algorithm>
#include <cstddef>
#include <memory>

#include "libocmirror/Error.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "common/Config.hpp"
#include "release/EndpointTranslator.hpp"
#include "release/MirrorEngine.hpp"
#include "release/OperatorMetadataResolver.hpp"
#include "release/ReleaseMetadataResolver.hpp"
#include "release/SignatureVerifier.hpp"
#include "test_utility/config.hpp"
#include "test_utility/registry.hpp"
#include "test_utility/release.hpp"
#include "test_utility/signature.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace release {
namespace test {

static const std::string destinationServer = "registry.local:5000";

struct Fixture {
    Fixture()
        : release{test_utility::release::addReleaseImage(*registry, "quay.io")}
    {}

    ReleaseMetadata resolveRelease(const common::ImageReference& reference, const EndpointTranslator& translator = {}) {
        auto resolver = ReleaseMetadataResolver{configRAII.config, registry, verifier};
        return resolver.resolve(reference, translator, {}, {}, false);
    }

    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    std::shared_ptr<test_utility::registry::InMemoryRegistry> registry = std::make_shared<test_utility::registry::InMemoryRegistry>();
    std::shared_ptr<SignatureVerifier> verifier = std::make_shared<SignatureVerifier>(
        configRAII.config,
        std::make_shared<test_utility::signature::InMemorySignatureStore>(),
        []() { return std::make_shared<test_utility::signature::FakeGpgEngine>(); });
    MirrorEngine engine{configRAII.config, registry};
    test_utility::release::ReleaseImage release;
    common::ImageReference destination = common::ImageReference::parse(destinationServer + "/mirror/ocp-release:4.4.6");
};

static size_t countBlobCopies(const ImageGraph& graph) {
    auto count = size_t{0};
    for(const auto& blob : graph.blobs) {
        count += blob.second.size();
    }
    return count;
}

static std::ptrdiff_t findPush(const std::vector<common::ImageReference>& pushes, const std::string& digest) {
    auto push = std::find_if(pushes.cbegin(), pushes.cend(), [&digest](const common::ImageReference& reference) {
        return reference.getDigest() == digest;
    });
    return push - pushes.cbegin();
}

TEST_GROUP(MirrorEngineTestGroup) {
};

TEST(MirrorEngineTestGroup, mirroredReleaseResolvesToTheSameContent) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);

    fixture.engine.putRelease(fixture.destination, source, false);

    CHECK(fixture.registry->hasManifest(fixture.destination));
    auto translator = EndpointTranslator::fromPatterns(common::Config::DEFAULT_TRANSLATION_PATTERNS, destinationServer);
    auto mirrored = fixture.resolveRelease(fixture.destination, translator);

    CHECK_EQUAL(source.manifestDigest, mirrored.manifestDigest);
    CHECK_EQUAL(source.blobs.size(), mirrored.blobs.size());
    for(const auto& blob : source.blobs) {
        CHECK_EQUAL(1, mirrored.blobs.count(blob.first));
        CHECK_EQUAL(blob.second.size(), mirrored.blobs.at(blob.first).size());
    }
    CHECK_EQUAL(source.documents.size(), mirrored.documents.size());
    for(const auto& document : source.documents) {
        CHECK_EQUAL(document.second.getRaw(), mirrored.documents.at(document.first).getRaw());
    }

    CHECK_EQUAL(source.manifests.size(), mirrored.manifests.size());
    for(const auto& manifest : source.manifests) {
        auto mirroredReference = mapToDestination(manifest.first, source.reference, fixture.destination);
        CHECK_EQUAL(manifest.second == "4.4.6-x86_64" ? std::string{"4.4.6"} : manifest.second,
                    mirrored.manifests.at(mirroredReference));
    }

    // the root repository is the destination's, the components keep their path
    auto base = mirrored.blobs.at(fixture.release.baseLayerDigest);
    CHECK(base.count("mirror/ocp-release") == 1);
    CHECK(base.count("openshift-release-dev/ocp-v4.0-art-dev") == 1);
}

TEST(MirrorEngineTestGroup, blobsArePushedOncePerRepository) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);

    fixture.engine.putRelease(fixture.destination, source, false);
    CHECK_EQUAL(countBlobCopies(source), fixture.registry->getNumberOfBlobPushes());
    CHECK_EQUAL(12, fixture.registry->getNumberOfBlobPushes());

    // nothing left to copy on a second run
    auto fetches = fixture.registry->getNumberOfBlobFetches();
    fixture.engine.putRelease(fixture.destination, source, false);
    CHECK_EQUAL(12, fixture.registry->getNumberOfBlobPushes());
    CHECK_EQUAL(fetches, fixture.registry->getNumberOfBlobFetches());
}

TEST(MirrorEngineTestGroup, rootIsPushedLastAndListsAfterTheirManifests) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);
    fixture.engine.putRelease(fixture.destination, source, false);

    auto pushes = fixture.registry->getPushedManifests();
    CHECK_EQUAL(source.manifests.size(), pushes.size());
    CHECK(pushes.back() == fixture.destination);

    for(const auto& document : source.documents) {
        if(!document.second.isList()) {
            continue;
        }
        auto listPosition = findPush(pushes, document.first);
        for(const auto& child : document.second.getManifests()) {
            CHECK(findPush(pushes, child.digest) < listPosition);
        }
    }
}

TEST(MirrorEngineTestGroup, dryRunWritesNothing) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);

    fixture.engine.putRelease(fixture.destination, source, true);

    CHECK_EQUAL(0, fixture.registry->getNumberOfBlobPushes());
    CHECK(fixture.registry->getPushedManifests().empty());
    CHECK(!fixture.registry->hasManifest(fixture.destination));
    CHECK(fixture.registry->getBlobDigests(fixture.destination).empty());
}

TEST(MirrorEngineTestGroup, failedPushAbortsTheMirror) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);
    fixture.registry->failPushesAfter(3);

    try {
        fixture.engine.putRelease(fixture.destination, source, false);
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::PartialMirror);
    }
    CHECK(fixture.registry->getNumberOfBlobPushes() <= 3);
    CHECK(fixture.registry->getPushedManifests().empty());
    CHECK(!fixture.registry->hasManifest(fixture.destination));
}

TEST(MirrorEngineTestGroup, destinationDigestMustMatch) {
    auto fixture = Fixture{};
    auto source = fixture.resolveRelease(fixture.release.reference);

    auto byDigest = fixture.destination.withTag("").withDigest(source.manifestDigest);
    fixture.engine.putRelease(byDigest, source, false);
    CHECK(fixture.registry->hasManifest(byDigest));

    auto otherDigest = fixture.destination.withTag("").withDigest("sha256:" + std::string(64, 'f'));
    try {
        fixture.engine.putRelease(otherDigest, source, false);
        FAIL("Expected exception");
    }
    catch(const libocmirror::Error& e) {
        CHECK(e.getKind() == libocmirror::ErrorKind::ReferenceResolution);
    }
}

TEST(MirrorEngineTestGroup, mirrorOperators) {
    auto fixture = Fixture{};
    auto workDirectory = libocmirror::PathRAII{libocmirror::filesystem::makeTemporaryDirectory(fixture.configRAII.config->getTempDir(), "ocmirror-test")};
    auto index = test_utility::release::addOperatorIndexImage(*fixture.registry, "registry.example.com", workDirectory.getPath());
    auto resolver = OperatorMetadataResolver{fixture.configRAII.config, fixture.registry, fixture.verifier};
    auto translator = EndpointTranslator::fromPatterns(common::Config::DEFAULT_TRANSLATION_PATTERNS, "registry.example.com");
    auto source = resolver.resolve(index.reference, {{"ocs-operator", common::DefaultChannel{}}}, translator, {}, {}, false);

    auto destination = common::ImageReference::parse(destinationServer + "/mirror/redhat-operator-index:v4.8");
    fixture.engine.putOperators(destination, source, false);

    CHECK(fixture.registry->hasManifest(destination));
    const auto& record = source.operators.at(0);
    CHECK(fixture.registry->hasManifest(record.bundleImage.withServer(destinationServer)));
    for(const auto& image : record.relatedImages) {
        CHECK(fixture.registry->hasManifest(image.withServer(destinationServer)));
    }
    CHECK_EQUAL(countBlobCopies(source), fixture.registry->getNumberOfBlobPushes());
}

TEST(MirrorEngineTestGroup, blobsAreFetchedFromTheServerReferencingThem) {
    auto fixture = Fixture{};

    // the same repository path on two servers, each with its own layer
    auto root = common::ImageReference::parse("registry.example.com/openshift-release-dev/ocp-release:4.4.6");
    auto first = common::ImageReference::parse("first.example.com/team/app:1.0");
    auto second = common::ImageReference::parse("second.example.com/team/app:1.0");
    auto rootManifest = test_utility::registry::addImage(*fixture.registry, root, {"root layer"});
    auto firstManifest = test_utility::registry::addImage(*fixture.registry, first, {"first layer"});
    auto secondManifest = test_utility::registry::addImage(*fixture.registry, second, {"second layer"});

    auto metadata = ReleaseMetadata{};
    metadata.reference = root;
    metadata.manifestDigest = rootManifest.getDigest();
    metadata.addManifest(root, "4.4.6", rootManifest);
    metadata.addManifest(first, "first", firstManifest);
    metadata.addManifest(second, "second", secondManifest);
    CHECK_EQUAL(1, metadata.blobs.at(secondManifest.getLayers()[0].digest).size());

    fixture.engine.putRelease(fixture.destination, metadata, false);

    auto mirroredBlobs = fixture.registry->getBlobDigests(common::ImageReference::parse(destinationServer + "/team/app"));
    CHECK(mirroredBlobs.count(firstManifest.getLayers()[0].digest) == 1);
    CHECK(mirroredBlobs.count(secondManifest.getLayers()[0].digest) == 1);
    CHECK(fixture.registry->hasManifest(common::ImageReference::parse(destinationServer + "/team/app")
        .withDigest(secondManifest.getDigest())));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
