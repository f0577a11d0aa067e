/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_SkopeoRegistry_hpp
#define ebpfoci_packaging_SkopeoRegistry_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/LogLevel.hpp"
#include "packaging/Registry.hpp"


namespace ebpfoci {
namespace packaging {

/**
 * Registry reached through the skopeo executable.
 *
 * Push stages the artifact in a temporary OCI layout and copies it with
 * "skopeo copy oci:<layout>:<tag> docker://<reference>"; pull runs the
 * reverse copy and reads the layout back.
 */
class SkopeoRegistry : public Registry {
public:
    SkopeoRegistry(std::shared_ptr<const common::Config> config);

    void push(const libebpfoci::Context& context,
              const MemoryStore& source,
              const std::string& reference) const override;
    void pull(const libebpfoci::Context& context,
              const std::string& reference,
              MemoryStore& destination) const override;

    libebpfoci::CLIArguments generateBaseArgs() const;

    static const std::string stagingTag;

private:
    enum class Direction {push, pull};

    void copy(const libebpfoci::Context& context, Direction direction,
              const boost::filesystem::path& layoutDir, const std::string& reference) const;
    void throwCopyError(Direction direction, const std::string& reference,
                        int status, const std::string& output) const;
    boost::filesystem::path makeStagingLayoutPath() const;
    std::string getVerbosityOption() const;
    libebpfoci::CLIArguments getPolicyOption() const;
    libebpfoci::CLIArguments getRegistriesDOption() const;
    void printLog(const boost::format& message, libebpfoci::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void printLog(const std::string& message, libebpfoci::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    boost::filesystem::path skopeoPath;
    boost::filesystem::path tempDir;
    boost::filesystem::path customPolicyPath;
    boost::filesystem::path customRegistriesDPath;
    boost::filesystem::path authFilePath;
    bool enforceCustomPolicy = false;
    bool tlsVerify = true;
    const std::string sysname = "SkopeoRegistry";
};

}
}

#endif
