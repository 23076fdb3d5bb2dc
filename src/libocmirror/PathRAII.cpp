/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/system/error_code.hpp>

#include "libocmirror/Error.hpp"

namespace libocmirror {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(path && path != rhs.path) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(*path, ec);
    }
    path = std::move(rhs.path);
    rhs.release();
    return *this;
}

PathRAII::~PathRAII() {
    if(path) {
        // removal errors are ignored here
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(*path, ec);
    }
}

const boost::filesystem::path& PathRAII::getPath() const {
    if(!path) {
        OCMIRROR_THROW_ERROR("Attempted to access the path of a released PathRAII");
    }
    return *path;
}

void PathRAII::release() {
    path.reset();
}

}
