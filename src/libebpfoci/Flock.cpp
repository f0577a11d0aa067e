/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Flock.hpp"

#include <limits>
#include <thread>
#include <sys/file.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"

namespace libebpfoci {

const milliseconds Flock::noTimeout = milliseconds{std::numeric_limits<milliseconds::rep>::max()};

Flock::Flock()
    : logger{&libebpfoci::Logger::getInstance()}
    , lockType{Type::readLock}
    , timeoutTime{noTimeout}
    , warningTime{milliseconds{1000}}
{}

Flock::Flock(const boost::filesystem::path& file, const Type type, const milliseconds& timeoutMs, const milliseconds& warningMs)
    : logger{&libebpfoci::Logger::getInstance()}
    , lockfile{file}
    , lockType{type}
    , timeoutTime{timeoutMs}
    , warningTime{warningMs}
{
    auto message = boost::format("Acquiring %s lock on file %s")
                   % (lockType==Type::readLock ? "read" : "write") % file;
    logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::DEBUG);
    timedLockAcquisition();
    logger->log("Successfully acquired lock", loggerSubsystemName, libebpfoci::LogLevel::DEBUG);
}

Flock::Flock(const boost::filesystem::path& file, const Type type, const Context& boundingContext, const milliseconds& warningMs)
    : logger{&libebpfoci::Logger::getInstance()}
    , lockfile{file}
    , lockType{type}
    , timeoutTime{noTimeout}
    , warningTime{warningMs}
    , context{boundingContext}
{
    auto message = boost::format("Acquiring %s lock on file %s (bounded by context)")
                   % (lockType==Type::readLock ? "read" : "write") % file;
    logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::DEBUG);
    timedLockAcquisition();
    logger->log("Successfully acquired lock", loggerSubsystemName, libebpfoci::LogLevel::DEBUG);
}

Flock::Flock(Flock&& rhs)
    : logger{rhs.logger}
    , lockfile{std::move(rhs.lockfile)}
    , lockType{rhs.lockType}
    , fileFd{rhs.fileFd}
    , timeoutTime{rhs.timeoutTime}
    , warningTime{rhs.warningTime}
    , context{std::move(rhs.context)}
{
    rhs.lockfile.reset();
    rhs.fileFd = -1;
}

Flock& Flock::operator=(Flock&& rhs) {
    if(this == &rhs) {
        return *this;
    }
    // release the current lock first, otherwise this process would silently hold both
    release();
    lockType = rhs.lockType;
    lockfile = std::move(rhs.lockfile);
    fileFd = rhs.fileFd;
    timeoutTime = rhs.timeoutTime;
    warningTime = rhs.warningTime;
    context = std::move(rhs.context);
    rhs.lockfile.reset();
    rhs.fileFd = -1;
    return *this;
}

Flock::~Flock() {
    release();
}

void Flock::timedLockAcquisition() {
    milliseconds elapsedTime{0};
    milliseconds backoffTime{100};
    while(!acquireLockAtomically()) {
        // the destructor doesn't run if the constructor throws
        if(context && context->isCancelled()) {
            release();
            auto operation = boost::format("Acquisition of lock on file %s") % *lockfile;
            context->throwIfCancelled(operation.str());
        }
        if(timeoutTime != noTimeout && elapsedTime >= timeoutTime) {
            release();
            auto message = boost::format("Failed to acquire lock on file %s (expired timeout of %d milliseconds)")
                % *lockfile % timeoutTime.count();
            EBPFOCI_THROW_ERROR(message.str());
        }
        std::this_thread::sleep_for(backoffTime);
        elapsedTime += backoffTime;
        if(elapsedTime.count() % warningTime.count() == 0) {
            auto message = boost::format("Still attempting to acquire lock on file %s after %d ms...")
                % *lockfile % elapsedTime.count();
            logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::WARN);
        }
    }
}

bool Flock::acquireLockAtomically() {
    if (fileFd < 0) {
        auto fd = open(lockfile->string().c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if(fd == -1) {
            auto message = boost::format("Failed to open %s for locking: %s") % *lockfile % strerror(errno);
            EBPFOCI_THROW_ERROR(message.str());
        }
        fileFd = fd;
    }

    auto flockOperation = lockType == Type::writeLock ? LOCK_EX : LOCK_SH;
    if (flock(fileFd, flockOperation | LOCK_NB) == -1) {
        auto message = boost::format("flock() on %s (fd %d) not acquired: %s") % *lockfile % fileFd % strerror(errno);
        logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::DEBUG);
        return false;
    }

    return true;
}

void Flock::release() {
    if (fileFd < 0) {
        return;
    }
    if (flock(fileFd, LOCK_UN | LOCK_NB) == -1) {
        auto message = boost::format("Failed to release lock on %s (fd %d): %s") % *lockfile % fileFd % strerror(errno);
        logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::WARN);
    }
    if(close(fileFd) != 0) {
        auto message = boost::format("Failed to close file descriptor %d of file %s") % fileFd % *lockfile;
        logger->log(message.str(), loggerSubsystemName, libebpfoci::LogLevel::WARN);
    }
    fileFd = -1;
}

}
