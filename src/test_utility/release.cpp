/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release.hpp"

#include <sstream>

#include <boost/format.hpp>

#include "release/IndexDatabase.hpp"
#include "release/OperatorMetadataResolver.hpp"

using namespace ocmirror;

namespace test_utility {
namespace release {

static const std::string releaseRepository = "openshift-release-dev/ocp-release";
static const std::string componentRepository = "openshift-release-dev/ocp-v4.0-art-dev";

static std::string makeImageStream(const std::map<std::string, common::ImageReference>& components) {
    auto tags = std::string{};
    for(const auto& component : components) {
        if(!tags.empty()) {
            tags += ",";
        }
        tags += (boost::format(R"({"name":"%s","annotations":{"io.openshift.build.source-location":""},)"
                               R"("from":{"kind":"DockerImage","name":"%s"}})")
                 % component.first % component.second).str();
    }
    return (boost::format(R"({"kind":"ImageStream","apiVersion":"image.openshift.io/v1",)"
                          R"("metadata":{"name":"4.4.6","creationTimestamp":null},"spec":{"lookupPolicy":{"local":false},"tags":[%s]}})")
            % tags).str();
}

ReleaseImage addReleaseImage(registry::InMemoryRegistry& registry,
                             const std::string& server,
                             const std::string& configMap) {
    auto release = ReleaseImage{};
    auto components = common::ImageReference{server, componentRepository, "", ""};
    auto baseLayer = registry::makeLayer({{"etc/redhat-release", "Red Hat Enterprise Linux CoreOS release 4.4"}});

    auto machineControllers = registry::addImage(registry, components,
        {baseLayer, registry::makeLayer({{"usr/bin/machine-controller-manager", "aws"}})},
        registry::makeImageConfig({{"io.openshift.release.operator", "false"}, {"name", "aws-machine-controllers"}}));
    auto clusterVersionOperator = registry::addImage(registry, components,
        {baseLayer, registry::makeLayer({{"usr/bin/cluster-version-operator", "cvo"}})},
        registry::makeImageConfig({{"io.openshift.release.operator", "true"}, {"name", "cluster-version-operator"}}));
    auto cliAmd64 = registry::addImage(registry, components,
        {baseLayer, registry::makeLayer({{"usr/bin/oc", "amd64"}})},
        registry::makeImageConfig({{"name", "cli"}}, "linux", "amd64"));
    auto cliArm64 = registry::addImage(registry, components,
        {registry::makeLayer({{"usr/bin/oc", "arm64"}})},
        registry::makeImageConfig({{"name", "cli"}}, "linux", "arm64"));
    auto cli = registry::addManifestList(registry, components, {
        {ocmirror::registry::Platform{"linux", "amd64", ""}, cliAmd64},
        {ocmirror::registry::Platform{"linux", "arm64", "v8"}, cliArm64}
    });

    auto quay = common::ImageReference{"quay.io", componentRepository, "", ""};
    release.components["aws-machine-controllers"] = quay.withDigest(machineControllers.getDigest());
    release.components["cluster-version-operator"] = quay.withDigest(clusterVersionOperator.getDigest());
    release.components["cli"] = quay.withDigest(cli.getDigest());

    release.imageReferences = makeImageStream(release.components);
    release.releaseMetadata = R"({"kind":"cincinnati-metadata-v0","version":"4.4.6","previous":["4.3.25","4.4.5"]})";
    auto files = std::map<std::string, std::string>{
        {"release-manifests/image-references", release.imageReferences},
        {"release-manifests/release-metadata", release.releaseMetadata},
        {"release-manifests/0000_50_cluster-svcat_00_namespace.yaml", "apiVersion: v1\nkind: Namespace\n"}
    };
    if(!configMap.empty()) {
        files["release-manifests/0000_90_cluster-update-keys_configmap.yaml"] = configMap;
    }

    release.reference = common::ImageReference{server, releaseRepository, "4.4.6-x86_64", ""};
    release.manifest = registry::addImage(registry, release.reference,
        {baseLayer, registry::makeLayer(files)},
        registry::makeImageConfig({{"io.openshift.release", "4.4.6"}}));
    release.baseLayerDigest = release.manifest.getLayers().front().digest;
    return release;
}

std::string makeVerificationConfigMap(const std::string& store, const std::string& armoredKey) {
    auto key = std::string{};
    auto stream = std::istringstream{armoredKey};
    auto line = std::string{};
    while(std::getline(stream, line)) {
        key += "    " + line + "\n";
    }
    return (boost::format("apiVersion: v1\n"
                          "kind: ConfigMap\n"
                          "metadata:\n"
                          "  name: release-verification\n"
                          "  namespace: openshift-config-managed\n"
                          "data:\n"
                          "  store-openshift-official-release: %s\n"
                          "  verifier-public-key-redhat: |\n"
                          "%s") % store % key).str();
}

OperatorIndexImage addOperatorIndexImage(registry::InMemoryRegistry& registry,
                                         const std::string& server,
                                         const boost::filesystem::path& workDirectory) {
    auto index = OperatorIndexImage{};
    auto baseLayer = registry::makeLayer({{"etc/redhat-release", "Red Hat Enterprise Linux release 8.4"}});

    auto rookCeph = registry::addImage(registry, common::ImageReference{server, "ocs4/rook-ceph-rhel8-operator", "", ""},
        {baseLayer, registry::makeLayer({{"usr/local/bin/rook", "rook"}})});
    auto cephCsi = registry::addImage(registry, common::ImageReference{server, "ocs4/cephcsi-rhel8", "", ""},
        {baseLayer, registry::makeLayer({{"usr/local/bin/cephcsi", "csi"}})});
    auto rookCephReference = common::ImageReference{"registry.redhat.io", "ocs4/rook-ceph-rhel8-operator", "", rookCeph.getDigest()};
    auto cephCsiReference = common::ImageReference{"registry.redhat.io", "ocs4/cephcsi-rhel8", "", cephCsi.getDigest()};

    auto relatedImagesLabel = (boost::format(R"([{"name":"rook-ceph-operator","image":"%s"},"%s"])")
                               % rookCephReference % cephCsiReference).str();
    auto bundles = common::ImageReference{server, "ocs4/ocs-operator-bundle", "", ""};
    auto stableBundle = registry::addImage(registry, bundles,
        {registry::makeLayer({{"manifests/ocs-operator.clusterserviceversion.yaml", "kind: ClusterServiceVersion\n"}})},
        registry::makeImageConfig({{ocmirror::release::OperatorMetadataResolver::RELATED_IMAGES_LABEL, relatedImagesLabel}}));
    auto eusBundle = registry::addImage(registry, bundles,
        {registry::makeLayer({{"manifests/ocs-operator.clusterserviceversion.yaml", "kind: ClusterServiceVersion\nversion: 4.6.9\n"}})});
    index.bundle = common::ImageReference{"registry.redhat.io", "ocs4/ocs-operator-bundle", "", stableBundle.getDigest()};
    auto eusBundleReference = index.bundle.withDigest(eusBundle.getDigest());
    // database rows first, then the label entries missing from the database
    index.relatedImages = {cephCsiReference, index.bundle, rookCephReference};

    auto rows = boost::format(
        "INSERT INTO package VALUES ('ocs-operator', 'stable-4.8');"
        "INSERT INTO package VALUES ('orphan-operator', NULL);"
        "INSERT INTO channel VALUES ('stable-4.8', 'ocs-operator', 'ocs-operator.v4.8.2');"
        "INSERT INTO channel VALUES ('eus-4.6', 'ocs-operator', 'ocs-operator.v4.6.9');"
        "INSERT INTO channel_entry VALUES (1, 'stable-4.8', 'ocs-operator', 'ocs-operator.v4.8.2', NULL, 0);"
        "INSERT INTO channel_entry VALUES (2, 'eus-4.6', 'ocs-operator', 'ocs-operator.v4.6.9', NULL, 0);"
        "INSERT INTO operatorbundle (name, bundlepath) VALUES ('ocs-operator.v4.8.2', '%s');"
        "INSERT INTO operatorbundle (name, bundlepath) VALUES ('ocs-operator.v4.6.9', '%s');"
        "INSERT INTO related_image VALUES ('%s', 'ocs-operator.v4.8.2');"
        "INSERT INTO related_image VALUES ('%s', 'ocs-operator.v4.8.2');")
        % index.bundle % eusBundleReference % cephCsiReference % index.bundle;
    auto database = registry::makeIndexDatabase(workDirectory / "index.db", registry::INDEX_DATABASE_SCHEMA + rows.str());

    index.reference = common::ImageReference{server, "redhat/redhat-operator-index", "v4.8", ""};
    index.manifest = registry::addImage(registry, index.reference,
        {baseLayer, registry::makeLayer({{"database/index.db", database}})},
        registry::makeImageConfig({{ocmirror::release::IndexDatabase::LABEL, "/database/index.db"}}));
    return index;
}

}
}
