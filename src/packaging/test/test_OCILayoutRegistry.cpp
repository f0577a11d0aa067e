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
#include <string>

#include <boost/filesystem.hpp>

#include "libebpfoci/Context.hpp"
#include "libebpfoci/Flock.hpp"
#include "libebpfoci/PathRAII.hpp"
#include "libebpfoci/Utility.hpp"
#include "packaging/Manifest.hpp"
#include "packaging/MediaTypes.hpp"
#include "packaging/MemoryStore.hpp"
#include "packaging/OCILayoutRegistry.hpp"
#include "test_utility/error.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ebpfoci {
namespace packaging {
namespace test {

TEST_GROUP(OCILayoutRegistryTestGroup) {
};

static const std::string reference = "localhost:5000/probe:v1";

static libebpfoci::PathRAII makeLayoutDir() {
    return libebpfoci::PathRAII{libebpfoci::filesystem::makeUniquePathWithRandomSuffix("/tmp/ebpfoci-test-layout")};
}

static Descriptor stageArtifact(MemoryStore& store,
                                const std::string& reference,
                                const std::string& program,
                                const std::string& config) {
    auto programDescriptor = store.add(programEntryName, mediaType::ebpfProgram, program);
    auto configDescriptor = store.add(configEntryName, mediaType::ebpfConfig, config);
    auto manifestBytes = Manifest::generate(configDescriptor, {programDescriptor}).serialize();
    auto manifestDescriptor = makeDescriptor(mediaType::ociManifest, manifestBytes);
    store.storeManifest(reference, manifestDescriptor, manifestBytes);
    return manifestDescriptor;
}

TEST(OCILayoutRegistryTestGroup, pushAndPull) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    auto manifestDescriptor = stageArtifact(source, reference, "program", R"({"info":"test"})");
    registry.push(context, source, reference);

    // layout structure
    const auto& layoutDir = layoutRAII.getPath();
    CHECK(boost::filesystem::is_regular_file(layoutDir / "oci-layout"));
    CHECK(boost::filesystem::is_regular_file(layoutDir / "blobs/sha256" / manifestDescriptor.digest.encoded));
    CHECK(boost::filesystem::is_regular_file(layoutDir / "blobs/sha256" / Digest::fromBytes("program").encoded));

    auto index = libebpfoci::json::read(layoutDir / "index.json");
    CHECK_EQUAL(1u, index["manifests"].Size());
    CHECK_EQUAL(manifestDescriptor.digest.string(), std::string{index["manifests"][0]["digest"].GetString()});
    CHECK_EQUAL(reference, std::string{index["manifests"][0]["annotations"][annotation::refName].GetString()});

    auto destination = MemoryStore{};
    registry.pull(context, reference, destination);
    CHECK(destination.resolve(reference) == manifestDescriptor);
    CHECK_EQUAL(std::string{"program"}, destination.getByName(programEntryName)->second);
    CHECK_EQUAL(std::string{R"({"info":"test"})"}, destination.getByName(configEntryName)->second);
}

TEST(OCILayoutRegistryTestGroup, pushOverwritesReference) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto first = MemoryStore{};
    stageArtifact(first, reference, "first", "{}");
    registry.push(context, first, reference);

    auto second = MemoryStore{};
    auto secondManifest = stageArtifact(second, reference, "second", "{}");
    registry.push(context, second, reference);

    auto index = libebpfoci::json::read(layoutRAII.getPath() / "index.json");
    CHECK_EQUAL(1u, index["manifests"].Size());

    auto destination = MemoryStore{};
    registry.pull(context, reference, destination);
    CHECK(destination.resolve(reference) == secondManifest);
    CHECK_EQUAL(std::string{"second"}, destination.getByName(programEntryName)->second);
}

TEST(OCILayoutRegistryTestGroup, multipleReferencesInOneLayout) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto other = std::string{"localhost:5000/probe:v2"};
    auto source = MemoryStore{};
    stageArtifact(source, reference, "v1", "{}");
    registry.push(context, source, reference);
    source = MemoryStore{};
    stageArtifact(source, other, "v2", "{}");
    registry.push(context, source, other);

    auto destination = MemoryStore{};
    registry.pull(context, reference, destination);
    CHECK_EQUAL(std::string{"v1"}, destination.getByName(programEntryName)->second);

    destination = MemoryStore{};
    registry.pull(context, other, destination);
    CHECK_EQUAL(std::string{"v2"}, destination.getByName(programEntryName)->second);
}

TEST(OCILayoutRegistryTestGroup, pullByManifestDigest) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    auto manifestDescriptor = stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    auto digestReference = "localhost:5000/probe@" + manifestDescriptor.digest.string();
    auto destination = MemoryStore{};
    registry.pull(context, digestReference, destination);
    CHECK(destination.resolve(digestReference) == manifestDescriptor);
    CHECK_EQUAL(std::string{"program"}, destination.getByName(programEntryName)->second);
}

TEST(OCILayoutRegistryTestGroup, pullUnknownReference) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};
    auto destination = MemoryStore{};

    // not a layout yet
    try {
        registry.pull(context, reference, destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "is not an OCI layout"));
    }

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    try {
        registry.pull(context, "localhost:5000/probe:v2", destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "not found in OCI layout"));
    }
}

TEST(OCILayoutRegistryTestGroup, pullRejectsTamperedBlob) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    auto blob = layoutRAII.getPath() / "blobs/sha256" / Digest::fromBytes("program").encoded;
    libebpfoci::filesystem::writeFile("PROGRAM", blob);

    auto destination = MemoryStore{};
    try {
        registry.pull(context, reference, destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "Digest mismatch"));
    }
}

TEST(OCILayoutRegistryTestGroup, pullWithMissingBlob) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    boost::filesystem::remove(layoutRAII.getPath() / "blobs/sha256" / Digest::fromBytes("program").encoded);

    auto destination = MemoryStore{};
    try {
        registry.pull(context, reference, destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "is missing from OCI layout"));
    }
}

TEST(OCILayoutRegistryTestGroup, pushOfUnknownReference) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto source = MemoryStore{};
    CHECK_THROWS(libebpfoci::Error, registry.push(libebpfoci::Context{}, source, reference));
}

TEST(OCILayoutRegistryTestGroup, cancelledContext) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};
    context.cancel();

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    try {
        registry.push(context, source, reference);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context cancelled"));
    }
    CHECK(!boost::filesystem::exists(layoutRAII.getPath() / "index.json"));

    auto destination = MemoryStore{};
    CHECK_THROWS(libebpfoci::Error, registry.pull(context, reference, destination));
}

TEST(OCILayoutRegistryTestGroup, pushToDigestReference) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    // digest of a different manifest
    {
        auto wrongReference = "localhost:5000/probe@sha256:" + std::string(64, 'a');
        auto source = MemoryStore{};
        stageArtifact(source, wrongReference, "program", "{}");
        try {
            registry.push(context, source, wrongReference);
            FAIL("expected exception");
        }
        catch(const libebpfoci::Error& e) {
            CHECK(test_utility::error::traceContains(e, "does not match the digest"));
        }
        CHECK(!boost::filesystem::exists(layoutRAII.getPath() / "index.json"));
    }
    // digest of the pushed manifest
    {
        auto expected = MemoryStore{};
        auto manifestDescriptor = stageArtifact(expected, reference, "program", "{}");
        auto digestReference = "localhost:5000/probe@" + manifestDescriptor.digest.string();

        auto source = MemoryStore{};
        stageArtifact(source, digestReference, "program", "{}");
        registry.push(context, source, digestReference);

        auto destination = MemoryStore{};
        registry.pull(context, digestReference, destination);
        CHECK(destination.resolve(digestReference) == manifestDescriptor);
    }
}

TEST(OCILayoutRegistryTestGroup, pullByDigestOfAnotherRepository) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    auto manifestDescriptor = stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    auto destination = MemoryStore{};
    try {
        registry.pull(context, "localhost:5000/other@" + manifestDescriptor.digest.string(), destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "not found in OCI layout"));
    }
}

TEST(OCILayoutRegistryTestGroup, pullRejectsIndexEntryWithWrongDigest) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    registry.push(context, source, reference);

    // name the existing entry after a digest it doesn't have
    auto digestReference = "localhost:5000/probe@sha256:" + std::string(64, 'a');
    auto indexFile = layoutRAII.getPath() / "index.json";
    auto index = libebpfoci::json::read(indexFile);
    index["manifests"][0]["annotations"][annotation::refName].SetString(digestReference.c_str(), index.GetAllocator());
    libebpfoci::json::write(index, indexFile);

    auto destination = MemoryStore{};
    try {
        registry.pull(context, digestReference, destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "does not match the digest"));
    }
}

TEST(OCILayoutRegistryTestGroup, lockWaitIsBoundedByContext) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};

    auto source = MemoryStore{};
    stageArtifact(source, reference, "program", "{}");
    registry.push(libebpfoci::Context{}, source, reference);

    auto lock = libebpfoci::Flock{layoutRAII.getPath() / "index.json.lock", libebpfoci::Flock::Type::writeLock};

    auto start = std::chrono::steady_clock::now();
    try {
        registry.push(libebpfoci::Context::withTimeout(std::chrono::milliseconds{300}), source, reference);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context deadline exceeded"));
    }
    try {
        auto destination = MemoryStore{};
        registry.pull(libebpfoci::Context::withTimeout(std::chrono::milliseconds{300}), reference, destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context deadline exceeded"));
    }
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{3});
}

TEST(OCILayoutRegistryTestGroup, copyWithDifferentLayoutReference) {
    auto layoutRAII = makeLayoutDir();
    auto registry = OCILayoutRegistry{layoutRAII.getPath()};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    auto manifestDescriptor = stageArtifact(source, reference, "program", "{}");
    registry.copyFrom(context, source, reference, "staged");

    auto index = libebpfoci::json::read(layoutRAII.getPath() / "index.json");
    CHECK_EQUAL(std::string{"staged"}, std::string{index["manifests"][0]["annotations"][annotation::refName].GetString()});

    auto destination = MemoryStore{};
    registry.copyTo(context, "staged", destination, reference);
    CHECK(destination.resolve(reference) == manifestDescriptor);
}

}}}

EBPFOCI_UNITTEST_MAIN_FUNCTION();
