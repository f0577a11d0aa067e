/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_Flock_hpp
#define libebpfoci_Flock_hpp

#include <chrono>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libebpfoci/Context.hpp"

namespace libebpfoci {

using milliseconds = std::chrono::milliseconds;

class Logger;

/**
 * Advisory flock(2) lock held for the lifetime of the object.
 * The lock file is created if it does not exist yet.
 *
 * The wait for the lock ends either at the timeout or, when a Context is
 * given, as soon as the Context is cancelled or its deadline expires.
 */
class Flock {
public:
    static const milliseconds noTimeout;
    enum Type {readLock, writeLock};

public:
    Flock();
    Flock(const boost::filesystem::path& file, const Type type=readLock,
          const milliseconds& timeoutTime=noTimeout, const milliseconds& warningTime=milliseconds{1000});
    Flock(const boost::filesystem::path& file, const Type type, const Context& context,
          const milliseconds& warningTime=milliseconds{1000});
    Flock(const Flock&) = delete;
    Flock(Flock&&);
    ~Flock();

    Flock& operator=(const Flock&) = delete;
    Flock& operator=(Flock&&);

private:
    void timedLockAcquisition();
    bool acquireLockAtomically();
    void release();

private:
    libebpfoci::Logger* logger;
    std::string loggerSubsystemName = "Flock";
    boost::optional<boost::filesystem::path> lockfile;
    Type lockType;
    int fileFd = -1;
    milliseconds timeoutTime;
    milliseconds warningTime;
    boost::optional<Context> context;
};

}

#endif
