/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include "libocmirror/Utility.hpp"

using namespace ocmirror;

namespace test_utility {
namespace config {

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "ocmirror-test-prefix")
    };
    const auto& prefixDir = raii.prefixDir.getPath();

    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    libocmirror::filesystem::writeFile(libocmirror::filesystem::readFile(repoRootDir / "etc/ocmirror.schema.json"),
                                       prefixDir / "etc/ocmirror.schema.json");

    auto tempDir = prefixDir / "tmp";
    libocmirror::filesystem::createFoldersIfNecessary(tempDir);

    auto configJSON = boost::format(R"({
        "gpgPath": "gpg",
        "tempDir": "%s",
        "concurrency": 4,
        "trustThreshold": "FULLY",
        "os": "linux",
        "architecture": "amd64",
        "enforceSecureRegistry": true,
        "registryRetries": 2,
        "maxSignatureOrdinal": 8
    })") % tempDir.string();
    libocmirror::filesystem::writeFile(configJSON.str(), prefixDir / "etc/ocmirror.json");

    raii.config = std::make_shared<common::Config>(prefixDir);
    return raii;
}

}
}
