/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_release_IndexDatabase_hpp
#define ocmirror_release_IndexDatabase_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <sqlite3.h>


namespace ocmirror {
namespace release {

/**
 * Read-only view of the SQLite database of an operator catalog index.
 * Only the tables describing packages, channels, bundles and related
 * images are queried.
 */
class IndexDatabase {
public:
    IndexDatabase(const boost::filesystem::path& file);

    bool hasPackage(const std::string& package) const;
    // empty if the package has no default channel
    boost::optional<std::string> getDefaultChannel(const std::string& package) const;
    std::vector<std::string> getChannels(const std::string& package) const;
    boost::optional<std::string> getChannelHead(const std::string& package, const std::string& channel) const;
    std::string getBundlePath(const std::string& bundleName) const;
    std::vector<std::string> getRelatedImages(const std::string& bundleName) const;

    // image label naming the database path, and the path used when it is absent
    static const std::string LABEL;
    static const std::string DEFAULT_PATH;

private:
    using Row = std::vector<boost::optional<std::string>>;
    std::vector<Row> query(const std::string& sql, const std::vector<std::string>& parameters) const;

private:
    boost::filesystem::path file;
    std::unique_ptr<sqlite3, int(*)(sqlite3*)> db;
};

}
}

#endif
