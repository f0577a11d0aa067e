/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <memory>

#include <rapidjson/document.h>

#include "libebpfoci/Utility.hpp"

namespace rj = rapidjson;
using namespace ebpfoci;

namespace test_utility {
namespace config {

ConfigRAII::ConfigRAII(ConfigRAII&& rhs)
    : config{std::move(rhs.config)}
    , prefixDir{std::move(rhs.prefixDir)}
    , registryDir{std::move(rhs.registryDir)}
{
    rhs.prefixDir.clear();
}

ConfigRAII::~ConfigRAII() {
    if(prefixDir.empty()) {
        return;
    }
    auto ec = boost::system::error_code{};
    boost::filesystem::remove_all(prefixDir, ec);
}

static void populateJSON(rj::Document& document, const boost::filesystem::path& prefixDir) {
    auto& allocator = document.GetAllocator();

    document.AddMember( "skopeoPath",
                        rj::Value{(prefixDir / "bin/skopeo").c_str(), allocator},
                        allocator);
    document.AddMember( "tempDir",
                        rj::Value{(prefixDir / "tmp").c_str(), allocator},
                        allocator);

    rj::Value policyValue(rj::kObjectType);
    policyValue.AddMember(  "path",
                            rj::Value{(prefixDir / "etc/policy.json").c_str(), allocator},
                            allocator);
    policyValue.AddMember("enforce", true, allocator);
    document.AddMember("containersPolicy", policyValue, allocator);
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = libebpfoci::filesystem::makeUniquePathWithRandomSuffix("/tmp/ebpfoci-test-prefix-dir");
    raii.registryDir = raii.prefixDir / "registry";

    libebpfoci::filesystem::createFoldersIfNecessary(raii.prefixDir / "bin");
    libebpfoci::filesystem::createFoldersIfNecessary(raii.prefixDir / "etc");
    libebpfoci::filesystem::createFoldersIfNecessary(raii.prefixDir / "tmp");
    libebpfoci::filesystem::createFoldersIfNecessary(raii.registryDir);

    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();

    // fake skopeo, copied so that it is executable regardless of the checkout's permissions
    auto skopeo = raii.prefixDir / "bin/skopeo";
    boost::filesystem::copy_file(repoRootDir / "src/packaging/test/fake_skopeo.sh", skopeo);
    boost::filesystem::permissions(skopeo, boost::filesystem::owner_all);

    boost::filesystem::copy_file(repoRootDir / "etc/ebpfoci.schema.json", raii.prefixDir / "etc/ebpfoci.schema.json");
    libebpfoci::filesystem::writeFile("{\"default\":[{\"type\":\"insecureAcceptAnything\"}]}",
                                      raii.prefixDir / "etc/policy.json");

    raii.config = std::make_shared<common::Config>();
    raii.config->installationPrefixDir = raii.prefixDir;
    populateJSON(raii.config->json, raii.prefixDir);
    libebpfoci::json::write(raii.config->json, raii.prefixDir / "etc/ebpfoci.json");
    raii.config->directories.initialize(*raii.config);

    libebpfoci::environment::setVariable("FAKE_SKOPEO_REGISTRY_DIR", raii.registryDir.string());

    return raii;
}

}
}
