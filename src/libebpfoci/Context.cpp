/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Context.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"

namespace libebpfoci {

Context::Context()
    : cancelled{std::make_shared<std::atomic<bool>>(false)}
{}

Context Context::withTimeout(const std::chrono::milliseconds& timeout) {
    return withDeadline(clock::now() + timeout);
}

Context Context::withDeadline(const clock::time_point& deadline) {
    auto context = Context{};
    context.deadline = deadline;
    return context;
}

void Context::cancel() {
    cancelled->store(true);
}

bool Context::isCancelled() const {
    return cancelled->load() || isDeadlineExceeded();
}

bool Context::isDeadlineExceeded() const {
    return deadline && clock::now() >= *deadline;
}

std::string Context::getCancellationReason() const {
    if(cancelled->load()) {
        return "context cancelled";
    }
    if(isDeadlineExceeded()) {
        return "context deadline exceeded";
    }
    return "";
}

void Context::throwIfCancelled(const std::string& operation) const {
    if(isCancelled()) {
        auto message = boost::format("%s aborted: %s") % operation % getCancellationReason();
        EBPFOCI_THROW_ERROR(message.str());
    }
}

const boost::optional<Context::clock::time_point>& Context::getDeadline() const {
    return deadline;
}

}
