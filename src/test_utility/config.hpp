/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef ebpfoci_test_utility_config_hpp
#define ebpfoci_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * Configuration of a throw-away installation prefix:
 *
 *   <prefix>/bin/skopeo                  fake skopeo (see src/packaging/test/fake_skopeo.sh)
 *   <prefix>/etc/ebpfoci.json            the configuration below, as loaded by Config::load()
 *   <prefix>/etc/ebpfoci.schema.json
 *   <prefix>/etc/policy.json
 *   <prefix>/registry                    storage of the fake remote registry
 *   <prefix>/tmp                         tempDir
 *
 * The destructor removes the whole prefix.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(const ConfigRAII&) = delete;
    ConfigRAII(ConfigRAII&&);
    ~ConfigRAII();
    std::shared_ptr<ebpfoci::common::Config> config;
    boost::filesystem::path prefixDir;
    boost::filesystem::path registryDir;
};

ConfigRAII makeConfig();

}
}

#endif
