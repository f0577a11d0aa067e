/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/logging.hpp"

namespace libebpfoci {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(this != &rhs) {
        remove();
        path = std::move(rhs.path);
        rhs.release();
    }
    return *this;
}

PathRAII::~PathRAII() {
    remove();
}

const boost::filesystem::path& PathRAII::getPath() const {
    if(!path) {
        EBPFOCI_THROW_ERROR("Attempted to access the path of a released PathRAII");
    }
    return *path;
}

void PathRAII::release() {
    path.reset();
}

// Destructors must not throw: a failed removal only leaves a stale
// temporary directory behind, so it is reported and otherwise ignored.
void PathRAII::remove() noexcept {
    if(!path) {
        return;
    }
    auto ec = boost::system::error_code{};
    boost::filesystem::remove_all(*path, ec);
    if(ec) {
        try {
            logMessage(boost::format("Failed to remove %s: %s") % *path % ec.message(), LogLevel::WARN);
        }
        catch(const std::exception&) {}
    }
    path.reset();
}

}
