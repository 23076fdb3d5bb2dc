/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/MetadataPrinter.hpp"

#include <algorithm>

#include <boost/format.hpp>


namespace ocmirror {
namespace release {

MetadataPrinter::MetadataPrinter(bool sortMetadata)
    : sortMetadata{sortMetadata}
{}

void MetadataPrinter::print(const ReleaseMetadata& metadata, std::ostream& out) const {
    printHeader(metadata.reference, metadata.manifestDigest, metadata.signatureStores, metadata.signingKeys, out);
    printGraph(metadata, out);
}

void MetadataPrinter::print(const OperatorMetadata& metadata, std::ostream& out) const {
    printHeader(metadata.reference, metadata.manifestDigest, metadata.signatureStores, metadata.signingKeys, out);
    out << "indexDatabase: " << metadata.indexDatabase.size() << " bytes" << std::endl;

    auto operators = metadata.operators;
    if(sortMetadata) {
        std::sort(operators.begin(), operators.end(), [](const OperatorRecord& lhs, const OperatorRecord& rhs) {
            return lhs.package < rhs.package;
        });
    }
    out << "operators:" << std::endl;
    for(auto& record : operators) {
        out << "  - package: " << record.package << std::endl
            << "    channel: " << record.channel << std::endl
            << "    bundleName: " << record.bundleName << std::endl
            << "    bundleImage: " << record.bundleImage << std::endl
            << "    relatedImages:" << std::endl;
        if(sortMetadata) {
            std::sort(record.relatedImages.begin(), record.relatedImages.end());
        }
        for(const auto& image : record.relatedImages) {
            out << "      - " << image << std::endl;
        }
    }

    printGraph(metadata, out);
}

void MetadataPrinter::printHeader(const common::ImageReference& reference,
                                  const std::string& manifestDigest,
                                  std::vector<std::string> signatureStores,
                                  const std::vector<std::string>& signingKeys,
                                  std::ostream& out) const {
    out << "reference: " << reference << std::endl
        << "manifestDigest: " << manifestDigest << std::endl;

    if(sortMetadata) {
        std::sort(signatureStores.begin(), signatureStores.end());
    }
    out << "signatureStores:" << std::endl;
    for(const auto& store : signatureStores) {
        out << "  - " << store << std::endl;
    }
    out << "signingKeys: " << signingKeys.size() << std::endl;
}

void MetadataPrinter::printGraph(const ImageGraph& graph, std::ostream& out) const {
    out << boost::format("blobs: # %d") % graph.blobs.size() << std::endl;
    for(const auto& blob : graph.blobs) {
        out << "  " << blob.first << ":" << std::endl;
        for(const auto& repository : blob.second) {
            out << "    - " << repository << std::endl;
        }
    }
    out << boost::format("manifests: # %d") % graph.manifests.size() << std::endl;
    for(const auto& manifest : graph.manifests) {
        out << "  " << manifest.first << ": " << manifest.second << std::endl;
    }
}

}
}
