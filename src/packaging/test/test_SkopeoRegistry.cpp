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
#include <rapidjson/document.h>

#include "libebpfoci/Context.hpp"
#include "libebpfoci/Logger.hpp"
#include "libebpfoci/Utility.hpp"
#include "packaging/Manifest.hpp"
#include "packaging/MediaTypes.hpp"
#include "packaging/MemoryStore.hpp"
#include "packaging/SkopeoRegistry.hpp"
#include "test_utility/config.hpp"
#include "test_utility/error.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {
namespace test {

TEST_GROUP(SkopeoRegistryTestGroup) {
    void teardown() {
        libebpfoci::environment::unsetVariable("FAKE_SKOPEO_ARGS_LOG");
        libebpfoci::environment::unsetVariable("FAKE_SKOPEO_SLEEP");
        libebpfoci::environment::unsetVariable("FAKE_SKOPEO_DENY");
        libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::WARN);
    }
};

static const std::string reference = "localhost:5000/probe:v1";

static Descriptor stageArtifact(MemoryStore& store, const std::string& program) {
    auto programDescriptor = store.add(programEntryName, mediaType::ebpfProgram, program);
    auto configDescriptor = store.add(configEntryName, mediaType::ebpfConfig, "{}");
    auto manifestBytes = Manifest::generate(configDescriptor, {programDescriptor}).serialize();
    auto manifestDescriptor = makeDescriptor(mediaType::ociManifest, manifestBytes);
    store.storeManifest(reference, manifestDescriptor, manifestBytes);
    return manifestDescriptor;
}

TEST(SkopeoRegistryTestGroup, generateBaseArgs_verbosity) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = configRAII.config;
    auto skopeoPath = std::string{config->json["skopeoPath"].GetString()};
    auto policyPath = std::string{config->json["containersPolicy"]["path"].GetString()};

    auto registry = SkopeoRegistry{config};
    auto& logger = libebpfoci::Logger::getInstance();

    logger.setLevel(libebpfoci::LogLevel::DEBUG);
    auto expectedArgs = libebpfoci::CLIArguments{skopeoPath, "--debug", "--policy", policyPath};
    CHECK(registry.generateBaseArgs() == expectedArgs);

    logger.setLevel(libebpfoci::LogLevel::INFO);
    expectedArgs = libebpfoci::CLIArguments{skopeoPath, "--policy", policyPath};
    CHECK(registry.generateBaseArgs() == expectedArgs);
}

TEST(SkopeoRegistryTestGroup, generateBaseArgs_registriesD) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = configRAII.config;
    auto registriesD = configRAII.prefixDir / "etc/registries.d";
    libebpfoci::filesystem::createFoldersIfNecessary(registriesD);
    config->json.AddMember("containersRegistries.dPath",
                           rj::Value{registriesD.c_str(), config->json.GetAllocator()},
                           config->json.GetAllocator());

    auto args = SkopeoRegistry{config}.generateBaseArgs();
    auto expectedTail = libebpfoci::CLIArguments{"--registries.d", registriesD.string()};
    CHECK(args.argc() >= 2);
    CHECK_EQUAL(std::string{expectedTail.argv()[0]}, std::string{args.argv()[args.argc()-2]});
    CHECK_EQUAL(std::string{expectedTail.argv()[1]}, std::string{args.argv()[args.argc()-1]});
}

TEST(SkopeoRegistryTestGroup, invalidConfiguration) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = configRAII.config;
    auto& allocator = config->json.GetAllocator();

    config->json["skopeoPath"].SetString("/ebpfoci/missing/skopeo", allocator);
    CHECK_THROWS(libebpfoci::Error, SkopeoRegistry{config});

    auto otherConfigRAII = test_utility::config::makeConfig();
    auto& otherConfig = otherConfigRAII.config;
    otherConfig->json.AddMember("authFile", rj::Value{"/ebpfoci/missing/auth.json"}, otherConfig->json.GetAllocator());
    CHECK_THROWS(libebpfoci::Error, SkopeoRegistry{otherConfig});
}

TEST(SkopeoRegistryTestGroup, pushAndPull) {
    auto configRAII = test_utility::config::makeConfig();
    auto registry = SkopeoRegistry{configRAII.config};
    auto context = libebpfoci::Context{};

    auto source = MemoryStore{};
    auto manifestDescriptor = stageArtifact(source, "program");
    registry.push(context, source, reference);

    // the remote side received the staged layout
    auto remoteLayout = configRAII.registryDir / "localhost_5000_probe_v1";
    auto index = libebpfoci::json::read(remoteLayout / "index.json");
    CHECK_EQUAL(SkopeoRegistry::stagingTag,
                std::string{index["manifests"][0]["annotations"][annotation::refName].GetString()});

    auto destination = MemoryStore{};
    registry.pull(context, reference, destination);
    CHECK(destination.resolve(reference) == manifestDescriptor);
    CHECK_EQUAL(std::string{"program"}, destination.getByName(programEntryName)->second);

    // staging layouts are removed
    CHECK(boost::filesystem::is_empty(configRAII.config->directories.temp));
}

TEST(SkopeoRegistryTestGroup, copyArguments) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = configRAII.config;
    auto& allocator = config->json.GetAllocator();
    auto authFile = configRAII.prefixDir / "etc/auth.json";
    libebpfoci::filesystem::writeFile("{}", authFile);
    config->json.AddMember("authFile", rj::Value{authFile.c_str(), allocator}, allocator);
    config->json.AddMember("tlsVerify", false, allocator);

    auto argsLog = configRAII.prefixDir / "skopeo-args.log";
    libebpfoci::environment::setVariable("FAKE_SKOPEO_ARGS_LOG", argsLog.string());

    auto registry = SkopeoRegistry{config};
    auto context = libebpfoci::Context{};
    auto source = MemoryStore{};
    stageArtifact(source, "program");
    registry.push(context, source, reference);
    auto destination = MemoryStore{};
    registry.pull(context, reference, destination);

    auto log = libebpfoci::filesystem::readFile(argsLog);
    auto newline = log.find('\n');
    auto pushLine = log.substr(0, newline);
    auto pullLine = log.substr(newline + 1);

    CHECK(pushLine.find("copy --dest-authfile " + authFile.string() + " --dest-tls-verify=false oci:") != std::string::npos);
    CHECK(pushLine.find(":" + SkopeoRegistry::stagingTag + " docker://" + reference) != std::string::npos);
    CHECK(pullLine.find("copy --src-authfile " + authFile.string() + " --src-tls-verify=false docker://" + reference + " oci:")
          != std::string::npos);
}

TEST(SkopeoRegistryTestGroup, pullNotFound) {
    auto configRAII = test_utility::config::makeConfig();
    auto registry = SkopeoRegistry{configRAII.config};
    auto destination = MemoryStore{};

    try {
        registry.pull(libebpfoci::Context{}, "localhost:5000/missing:v1", destination);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "not found in the remote registry"));
        CHECK(test_utility::error::traceContains(e, "manifest unknown"));
    }
}

TEST(SkopeoRegistryTestGroup, accessDenied) {
    auto configRAII = test_utility::config::makeConfig();
    auto registry = SkopeoRegistry{configRAII.config};
    libebpfoci::environment::setVariable("FAKE_SKOPEO_DENY", "1");

    auto source = MemoryStore{};
    stageArtifact(source, "program");
    try {
        registry.push(libebpfoci::Context{}, source, reference);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "denied by the remote registry"));
    }
}

TEST(SkopeoRegistryTestGroup, slowCopyIsAbortedByDeadline) {
    auto configRAII = test_utility::config::makeConfig();
    auto registry = SkopeoRegistry{configRAII.config};
    libebpfoci::environment::setVariable("FAKE_SKOPEO_SLEEP", "5");

    auto source = MemoryStore{};
    stageArtifact(source, "program");
    auto context = libebpfoci::Context::withTimeout(std::chrono::milliseconds{300});

    auto start = std::chrono::steady_clock::now();
    try {
        registry.push(context, source, reference);
        FAIL("expected exception");
    }
    catch(const libebpfoci::Error& e) {
        CHECK(test_utility::error::traceContains(e, "context deadline exceeded"));
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed < std::chrono::seconds{4});
    CHECK(!boost::filesystem::exists(configRAII.registryDir / "localhost_5000_probe_v1"));
}

TEST(SkopeoRegistryTestGroup, cancelledContextDoesNotRunSkopeo) {
    auto configRAII = test_utility::config::makeConfig();
    auto registry = SkopeoRegistry{configRAII.config};
    auto argsLog = configRAII.prefixDir / "skopeo-args.log";
    libebpfoci::environment::setVariable("FAKE_SKOPEO_ARGS_LOG", argsLog.string());

    auto context = libebpfoci::Context{};
    context.cancel();
    auto destination = MemoryStore{};
    CHECK_THROWS(libebpfoci::Error, registry.pull(context, reference, destination));
    CHECK(!boost::filesystem::exists(argsLog));
}

}}}

EBPFOCI_UNITTEST_MAIN_FUNCTION();
