/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <sys/stat.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"
#include "libocmirror/utility/string.hpp"

namespace libocmirror {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    if(path.empty() || boost::filesystem::is_directory(path)) {
        return;
    }

    logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);

    auto currentPath = boost::filesystem::path{};
    for(const auto& element : path) {
        currentPath /= element;
        if(boost::filesystem::exists(currentPath)) {
            continue;
        }
        bool created = false;
        try {
            created = boost::filesystem::create_directory(currentPath);
        } catch(const std::exception& e) {
            auto message = boost::format("Failed to create directory %s") % currentPath;
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }
        // another worker may have created the same directory concurrently
        if(!created && !boost::filesystem::is_directory(currentPath)) {
            auto message = boost::format("Failed to create directory %s") % currentPath;
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string(), std::ios_base::in | std::ios_base::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& content, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    try {
        createFoldersIfNecessary(filename.parent_path());
        auto ofs = std::ofstream{filename.string(), mode};
        if(!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            OCMIRROR_THROW_ERROR(message.str());
        }
        ofs.write(content.data(), content.size());
        if(!ofs) {
            auto message = boost::format("Failed to write %d bytes to %s") % content.size() % filename;
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write file %s") % filename;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Appends a random suffix to the given path, retrying until the result does not exist.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality but throws when the
 * locale configuration is invalid (e.g. LC_CTYPE set to a locale that is not installed).
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

/**
 * Creates a fresh directory readable only by the owner (gpg refuses
 * homedirs with looser permissions).
 */
boost::filesystem::path makeTemporaryDirectory(const boost::filesystem::path& parent, const std::string& prefix) {
    createFoldersIfNecessary(parent);
    while(true) {
        auto path = makeUniquePathWithRandomSuffix(parent / prefix);
        if(mkdir(path.c_str(), S_IRWXU) == 0) {
            logMessage(boost::format{"Created temporary directory %s"} % path, LogLevel::DEBUG);
            return path;
        }
        if(errno != EEXIST) {
            auto message = boost::format("Failed to create temporary directory %s: %s") % path % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
}

}}
