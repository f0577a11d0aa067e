/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_Context_hpp
#define libebpfoci_Context_hpp

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/optional.hpp>

namespace libebpfoci {

/**
 * Cancellation handle passed down to blocking operations (registry copies,
 * subprocesses). Copies of a Context share the same cancellation state, so
 * cancelling any copy is observed by every operation holding one.
 *
 * A Context is cancelled either explicitly through cancel() or implicitly
 * once its deadline (if any) has passed.
 */
class Context {
public:
    using clock = std::chrono::steady_clock;

public:
    Context();
    static Context withTimeout(const std::chrono::milliseconds& timeout);
    static Context withDeadline(const clock::time_point& deadline);

    void cancel();
    bool isCancelled() const;
    bool isDeadlineExceeded() const;
    std::string getCancellationReason() const;
    void throwIfCancelled(const std::string& operation) const;
    const boost::optional<clock::time_point>& getDeadline() const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled;
    boost::optional<clock::time_point> deadline;
};

}

#endif
