/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <type_traits>

#include <boost/filesystem.hpp>

#include "aux/unitTestMain.hpp"
#include "test_utility/error.hpp"
#include "libebpfoci/Context.hpp"
#include "libebpfoci/Error.hpp"
#include "libebpfoci/Flock.hpp"
#include "libebpfoci/Utility.hpp"


namespace libebpfoci {
namespace test {

constexpr std::chrono::milliseconds operator""_ms(unsigned long long ms) {
    return std::chrono::milliseconds(ms);
}

static bool lockAcquisitionDoesntThrow(const boost::filesystem::path &fileToLock, const libebpfoci::Flock::Type &lockType) {
    try {
        libebpfoci::Flock{fileToLock, lockType, 10_ms};
    } catch (const libebpfoci::Error &) {
        return false;
    }
    return true;
}

TEST_GROUP(FlockTestGroup) {
    boost::filesystem::path fileToLock = libebpfoci::filesystem::makeUniquePathWithRandomSuffix("/tmp/ebpfoci-file-to-lock");

    void teardown() {
        boost::filesystem::remove(fileToLock);
    }
};

TEST(FlockTestGroup, lockFileIsCreated) {
    CHECK(!boost::filesystem::exists(fileToLock));
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
    CHECK(boost::filesystem::exists(fileToLock));
}

TEST(FlockTestGroup, lockIsReleasedWhenTheObjectIsDestroyed) {
    {
        libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
    }
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libebpfoci::Flock::Type::writeLock));
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libebpfoci::Flock::Type::writeLock));
}

TEST(FlockTestGroup, moveConstructorMovesResources) {
    libebpfoci::Flock original{fileToLock, libebpfoci::Flock::Type::writeLock};
    {
        libebpfoci::Flock moveConstructed{std::move(original)};
        CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
    }
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libebpfoci::Flock::Type::writeLock));
}

TEST(FlockTestGroup, moveAssignmentMovesResources) {
    libebpfoci::Flock original{fileToLock, libebpfoci::Flock::Type::writeLock};
    {
        libebpfoci::Flock moveAssigned;
        moveAssigned = std::move(original);
        CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
    }
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libebpfoci::Flock::Type::writeLock));
}

TEST(FlockTestGroup, writeFailsIfResourceIsInUse) {
    {
        libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
        CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
    }
    {
        libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::readLock};
        CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
    }
}

TEST(FlockTestGroup, concurrentReadsAreAllowed) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::readLock};
    CHECK(lockAcquisitionDoesntThrow(fileToLock, libebpfoci::Flock::Type::readLock));
}

TEST(FlockTestGroup, readFailsIfResourceIsBeingWritten) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
    CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::readLock, 10_ms));
}

TEST(FlockTestGroup, selfMoveAssignmentKeepsTheLock) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
    auto& alias = lock;
    lock = std::move(alias);
    CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
}

TEST(FlockTestGroup, waitEndsAtContextDeadline) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};

    auto start = std::chrono::steady_clock::now();
    try {
        libebpfoci::Flock{fileToLock, libebpfoci::Flock::Type::writeLock, libebpfoci::Context::withTimeout(300_ms)};
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context deadline exceeded"));
    }
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{2});
}

TEST(FlockTestGroup, waitEndsWhenContextIsCancelled) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock};
    auto context = libebpfoci::Context{};
    context.cancel();

    try {
        libebpfoci::Flock{fileToLock, libebpfoci::Flock::Type::readLock, context};
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context cancelled"));
    }
}

TEST(FlockTestGroup, freeLockIsAcquiredWithContext) {
    libebpfoci::Flock lock{fileToLock, libebpfoci::Flock::Type::writeLock, libebpfoci::Context::withTimeout(300_ms)};
    CHECK_THROWS(libebpfoci::Error, libebpfoci::Flock(fileToLock, libebpfoci::Flock::Type::writeLock, 10_ms));
}

static_assert(!std::is_copy_constructible<libebpfoci::Flock>::value, "");
static_assert(!std::is_copy_assignable<libebpfoci::Flock>::value, "");
static_assert(std::is_move_constructible<libebpfoci::Flock>::value, "");
static_assert(std::is_move_assignable<libebpfoci::Flock>::value, "");

}}

EBPFOCI_UNITTEST_MAIN_FUNCTION();
