/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "release/IndexDatabase.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"


namespace ocmirror {
namespace release {

const std::string IndexDatabase::LABEL{"operators.operatorframework.io.index.database.v1"};
const std::string IndexDatabase::DEFAULT_PATH{"database/index.db"};

IndexDatabase::IndexDatabase(const boost::filesystem::path& file)
    : file{file}
    , db{nullptr, sqlite3_close}
{
    if(!boost::filesystem::is_regular_file(file)) {
        auto message = boost::format("Index database %s is not a regular file") % file;
        OCMIRROR_THROW_ERROR(message.str());
    }

    sqlite3* handle = nullptr;
    auto rc = sqlite3_open_v2(file.string().c_str(), &handle, SQLITE_OPEN_READONLY, nullptr);
    db.reset(handle);
    if(rc != SQLITE_OK) {
        auto message = boost::format("Failed to open index database %s: %s")
            % file % (handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc));
        OCMIRROR_THROW_ERROR(message.str());
    }
    libocmirror::logMessage(boost::format("Opened index database %s") % file, libocmirror::LogLevel::DEBUG);
}

std::vector<IndexDatabase::Row> IndexDatabase::query(const std::string& sql, const std::vector<std::string>& parameters) const {
    sqlite3_stmt* handle = nullptr;
    if(sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &handle, nullptr) != SQLITE_OK) {
        auto message = boost::format("Failed to prepare query \"%s\" on index database %s: %s")
            % sql % file % sqlite3_errmsg(db.get());
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto statement = std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)>{handle, sqlite3_finalize};

    for(size_t i = 0; i < parameters.size(); ++i) {
        if(sqlite3_bind_text(statement.get(), static_cast<int>(i + 1), parameters[i].c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
            auto message = boost::format("Failed to bind parameter %d of query \"%s\": %s")
                % (i + 1) % sql % sqlite3_errmsg(db.get());
            OCMIRROR_THROW_ERROR(message.str());
        }
    }

    auto rows = std::vector<Row>{};
    while(true) {
        auto rc = sqlite3_step(statement.get());
        if(rc == SQLITE_DONE) {
            break;
        }
        if(rc != SQLITE_ROW) {
            auto message = boost::format("Failed to execute query \"%s\" on index database %s: %s")
                % sql % file % sqlite3_errmsg(db.get());
            OCMIRROR_THROW_ERROR(message.str());
        }
        auto row = Row{};
        auto columns = sqlite3_column_count(statement.get());
        for(int column = 0; column < columns; ++column) {
            const auto* text = sqlite3_column_text(statement.get(), column);
            if(text) {
                row.emplace_back(std::string{reinterpret_cast<const char*>(text)});
            }
            else {
                row.emplace_back(boost::none);
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

bool IndexDatabase::hasPackage(const std::string& package) const {
    return !query("SELECT name FROM package WHERE name = ?", {package}).empty();
}

boost::optional<std::string> IndexDatabase::getDefaultChannel(const std::string& package) const {
    auto rows = query("SELECT default_channel FROM package WHERE name = ?", {package});
    if(rows.empty() || !rows[0][0] || rows[0][0]->empty()) {
        return boost::none;
    }
    return rows[0][0];
}

std::vector<std::string> IndexDatabase::getChannels(const std::string& package) const {
    auto channels = std::vector<std::string>{};
    auto sql = "SELECT DISTINCT channel_name FROM channel_entry WHERE package_name = ? ORDER BY channel_name";
    for(const auto& row : query(sql, {package})) {
        if(row[0]) {
            channels.push_back(*row[0]);
        }
    }
    return channels;
}

boost::optional<std::string> IndexDatabase::getChannelHead(const std::string& package, const std::string& channel) const {
    auto rows = query("SELECT head_operatorbundle_name FROM channel WHERE package_name = ? AND name = ?", {package, channel});
    if(rows.empty() || !rows[0][0]) {
        return boost::none;
    }
    return rows[0][0];
}

std::string IndexDatabase::getBundlePath(const std::string& bundleName) const {
    auto rows = query("SELECT bundlepath FROM operatorbundle WHERE name = ?", {bundleName});
    if(rows.empty() || !rows[0][0] || rows[0][0]->empty()) {
        auto message = boost::format("Index database %s has no bundle image for bundle %s") % file % bundleName;
        OCMIRROR_THROW_ERROR_OF_KIND(message.str(), libocmirror::ErrorKind::ReferenceResolution);
    }
    return *rows[0][0];
}

std::vector<std::string> IndexDatabase::getRelatedImages(const std::string& bundleName) const {
    auto images = std::vector<std::string>{};
    for(const auto& row : query("SELECT image FROM related_image WHERE operatorbundle_name = ?", {bundleName})) {
        if(row[0] && !row[0]->empty()) {
            images.push_back(*row[0]);
        }
    }
    return images;
}

}
}
