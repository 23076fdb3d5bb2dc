/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/FileSignatureStore.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "libocmirror/utility/logging.hpp"


namespace ocmirror {
namespace signature {

boost::filesystem::path FileSignatureStore::getPath(const std::string& url) {
    static const std::string scheme{"file://"};
    if(!boost::algorithm::starts_with(url, scheme) || url.size() == scheme.size() || url[scheme.size()] != '/') {
        auto message = boost::format("Invalid signature store URL \"%s\": expected file:///<absolute path>") % url;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return boost::filesystem::path{url.substr(scheme.size())};
}

boost::optional<std::string> FileSignatureStore::fetch(const std::string& url) {
    auto path = getPath(url);
    if(!boost::filesystem::is_regular_file(path)) {
        libocmirror::logMessage(boost::format("No signature at %s") % path, libocmirror::LogLevel::DEBUG);
        return boost::none;
    }
    return libocmirror::filesystem::readFile(path);
}

void FileSignatureStore::publish(const std::string& url, const std::string& content) {
    auto path = getPath(url);
    libocmirror::filesystem::writeFile(content, path);
    libocmirror::logMessage(boost::format("Published signature to %s") % path, libocmirror::LogLevel::INFO);
}

}
}
