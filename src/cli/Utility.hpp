/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_Utility_hpp
#define ebpfoci_cli_Utility_hpp

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <tuple>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/Context.hpp"
#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"
#include "common/Config.hpp"
#include "packaging/Registry.hpp"

namespace ebpfoci {
namespace cli {
namespace utility {

std::tuple<libebpfoci::CLIArguments, libebpfoci::CLIArguments> groupOptionsAndPositionalArguments(
        const libebpfoci::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libebpfoci::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

std::string parseArtifactReference(const std::string& input);

std::shared_ptr<const packaging::Registry> makeRegistry(std::shared_ptr<common::Config> conf,
                                                        const boost::optional<boost::filesystem::path>& ociLayoutDir);

libebpfoci::Context makeContext(const boost::optional<std::chrono::seconds>& timeout);

void printLog(  const std::string& message, libebpfoci::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libebpfoci::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
