/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_VerificationConfigMap_hpp
#define ocmirror_release_VerificationConfigMap_hpp

#include <string>
#include <vector>


namespace ocmirror {
namespace release {

/**
 * Signature stores and public keys a release declares for its own
 * verification, in the ConfigMap shipped as
 * release-manifests/0000_90_cluster-update-keys_configmap.yaml:
 * "store-*" entries hold store URLs and "verifier-public-key-*" entries
 * hold armored keys as YAML block scalars.
 */
struct VerificationConfigMap {
    std::vector<std::string> signatureStores;
    std::vector<std::string> signingKeys;

    static const std::string PATH;

    static VerificationConfigMap parse(const std::string& yaml);
};

}
}

#endif
