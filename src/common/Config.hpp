/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_common_Config_hpp
#define ebpfoci_common_Config_hpp

#include <string>
#include <chrono>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace ebpfoci {
namespace common {

/**
 * Program configuration. The JSON part is read from <prefix>/etc/ebpfoci.json
 * (or from the file given with --config) and validated against
 * <prefix>/etc/ebpfoci.schema.json. It is only needed by the commands that
 * drive skopeo, so it is loaded on demand.
 */
class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct Directories {
            void initialize(const common::Config& config);
            boost::filesystem::path temp;
        };

        void load();
        bool isLoaded() const;
        boost::filesystem::path getConfigFile() const;
        boost::filesystem::path getConfigSchemaFile() const;

        BuildTime buildTime;
        Directories directories;
        rapidjson::Document json{ rapidjson::kObjectType };

        boost::filesystem::path installationPrefixDir;
        boost::optional<boost::filesystem::path> configFileFromCLI;

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement
};

}
}

#endif
