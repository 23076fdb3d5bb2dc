/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/LayerArchive.hpp"

#include <memory>

#include <archive.h> // libarchive
#include <archive_entry.h>
#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"


namespace ocmirror {
namespace release {
namespace layer {

std::string normalizeEntryPath(const std::string& path) {
    auto normalized = path;
    while(normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    while(!normalized.empty() && normalized.front() == '/') {
        normalized.erase(0, 1);
    }
    return normalized;
}

boost::optional<std::string> getEntryPath(const char* pathname) {
    if(pathname == nullptr) {
        return {};
    }
    return normalizeEntryPath(pathname);
}

static std::string readEntryData(::archive* arc, const std::string& entryPath) {
    auto content = std::string{};
    const void* buffer;
    size_t size;
    la_int64_t offset;

    while(true) {
        auto r = archive_read_data_block(arc, &buffer, &size, &offset);
        if(r == ARCHIVE_EOF) {
            break;
        }
        if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive: error while reading data of entry %s (%s)")
                % entryPath % archive_error_string(arc);
            OCMIRROR_THROW_ERROR(message.str());
        }
        // sparse entries leave holes between blocks
        if(static_cast<size_t>(offset) > content.size()) {
            content.resize(offset, '\0');
        }
        content.replace(offset, size, static_cast<const char*>(buffer), size);
    }
    return content;
}

std::map<std::string, std::string> extractFiles(const std::string& layer, const std::set<std::string>& paths) {
    auto files = std::map<std::string, std::string>{};
    auto wanted = std::set<std::string>{};
    for(const auto& path : paths) {
        wanted.insert(normalizeEntryPath(path));
    }

    auto arc = std::unique_ptr<::archive, int(*)(::archive*)>{archive_read_new(), archive_read_free};
    archive_read_support_format_all(arc.get());
    archive_read_support_filter_all(arc.get());

    if(archive_read_open_memory(arc.get(), layer.data(), layer.size()) != ARCHIVE_OK) {
        auto message = boost::format("failed to open layer archive (%s)") % archive_error_string(arc.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    while(files.size() < wanted.size()) {
        ::archive_entry* entry;
        auto r = archive_read_next_header(arc.get(), &entry);
        if(r == ARCHIVE_EOF) {
            break;
        }
        else if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive: error while reading header of next entry (%s)")
                % archive_error_string(arc.get());
            OCMIRROR_THROW_ERROR(message.str());
        }

        auto entryPath = getEntryPath(archive_entry_pathname(entry));
        if(!entryPath) {
            libocmirror::logMessage(std::string{"archive: skipping entry without pathname"}, libocmirror::LogLevel::DEBUG);
            continue;
        }
        if(archive_entry_filetype(entry) != AE_IFREG || wanted.count(*entryPath) == 0) {
            continue;
        }

        libocmirror::logMessage(boost::format("archive: reading entry %s") % *entryPath, libocmirror::LogLevel::DEBUG);
        files[*entryPath] = readEntryData(arc.get(), *entryPath);
    }

    return files;
}

}
}
}
