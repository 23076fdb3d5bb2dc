/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "digest.hpp"

#include <memory>

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <openssl/evp.h>

#include "libocmirror/Error.hpp"

namespace libocmirror {
namespace digest {

std::string computeSha256(const std::string& content) {
    auto context = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if(!context) {
        OCMIRROR_THROW_ERROR("Failed to allocate OpenSSL digest context");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if(EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1
       || EVP_DigestUpdate(context.get(), content.data(), content.size()) != 1
       || EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1) {
        OCMIRROR_THROW_ERROR("Failed to compute sha256 digest with OpenSSL");
    }

    static const char hexDigits[] = "0123456789abcdef";
    auto hex = std::string{};
    hex.reserve(2*hashLength);
    for(unsigned int i=0; i<hashLength; ++i) {
        hex.push_back(hexDigits[hash[i] >> 4]);
        hex.push_back(hexDigits[hash[i] & 0x0f]);
    }
    return "sha256:" + hex;
}

bool isValid(const std::string& digest) {
    static const boost::regex re{"[a-z0-9]+(?:[.+_-][a-z0-9]+)*:[a-fA-F0-9]{32,}"};
    return boost::regex_match(digest, re);
}

std::string getAlgorithm(const std::string& digest) {
    if(!isValid(digest)) {
        auto message = boost::format("Invalid digest \"%s\"") % digest;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return digest.substr(0, digest.find(':'));
}

std::string getHex(const std::string& digest) {
    if(!isValid(digest)) {
        auto message = boost::format("Invalid digest \"%s\"") % digest;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return digest.substr(digest.find(':') + 1);
}

void verifyContent(const std::string& content, const std::string& expectedDigest) {
    if(getAlgorithm(expectedDigest) != "sha256") {
        auto message = boost::format("Cannot verify content against digest %s: unsupported algorithm")
            % expectedDigest;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto actualDigest = computeSha256(content);
    if(actualDigest != expectedDigest) {
        auto message = boost::format("Content digest mismatch: expected %s, computed %s")
            % expectedDigest % actualDigest;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), ErrorKind::Transport);
    }
}

}}
