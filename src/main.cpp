/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <memory>
#include <chrono>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"
#include "cli/CLI.hpp"

using namespace ebpfoci;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    // pulled artifacts and OCI layouts are readable by everybody
    umask(022);

    auto& logger = libebpfoci::Logger::getInstance();

    try {
        auto program_start = std::chrono::high_resolution_clock::now();

        // the configuration itself is loaded by the commands that need it
        auto config = std::make_shared<common::Config>();
        config->installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        config->program_start = program_start;

        auto args = libebpfoci::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libebpfoci::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libebpfoci::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
