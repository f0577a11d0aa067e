/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_CommandPull_hpp
#define ebpfoci_cli_CommandPull_hpp

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/Utility.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"
#include "packaging/EbpfRegistry.hpp"
#include "packaging/MediaTypes.hpp"


namespace ebpfoci {
namespace cli {

class CommandPull : public Command {
public:
    CommandPull() {
        initializeOptionsDescription();
    }

    CommandPull(const libebpfoci::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto registry = packaging::makeEbpfRegistry(cli::utility::makeRegistry(conf, ociLayoutDir));
        auto package = registry->pull(cli::utility::makeContext(timeout), reference);

        libebpfoci::filesystem::createFoldersIfNecessary(outputDir);
        libebpfoci::filesystem::writeFilesAtomically({
            {package.programFileBytes, outputDir / packaging::programEntryName},
            {package.ebpfConfig.encode(), outputDir / packaging::configEntryName}});

        cli::utility::printLog(boost::format("Pulled %s into %s") % reference % outputDir.string(),
                               libebpfoci::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Pull an eBPF program from a registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("ebpfoci pull [OPTIONS] REGISTRY/REPOSITORY[:TAG][@DIGEST]")
            .setDescription(getBriefDescription() + ".\n"
                            "The program and its config are written to "
                            + packaging::programEntryName + " and " + packaging::configEntryName
                            + " in the output directory")
            .setOptionsDescription(optionsDescription)
            .addExample("ebpfoci pull -o ./tcpconnect ghcr.io/probes/tcpconnect:v1")
            .addExample("ebpfoci pull --oci-layout ./layout localhost:5000/tcpconnect");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("output,o",
                boost::program_options::value<std::string>()->default_value("."),
                "Directory where the program and its config are written")
            ("oci-layout",
                boost::program_options::value<std::string>(),
                "Pull from the OCI layout in this directory instead of a remote registry")
            ("timeout",
                boost::program_options::value<unsigned int>(),
                "Abort the operation after this number of seconds");
    }

    void parseCommandArguments(const libebpfoci::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of pull command"), libebpfoci::LogLevel::DEBUG);

        libebpfoci::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the pull command expects exactly one positional argument
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "pull");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            outputDir = boost::filesystem::absolute(values["output"].as<std::string>());

            if(values.count("oci-layout")) {
                ociLayoutDir = boost::filesystem::absolute(values["oci-layout"].as<std::string>());
            }

            if(values.count("timeout")) {
                timeout = std::chrono::seconds{values["timeout"].as<unsigned int>()};
            }

            reference = cli::utility::parseArtifactReference(positionalArgs.argv()[0]);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'ebpfoci help pull'") % e.what();
            cli::utility::printLog(message, libebpfoci::LogLevel::GENERAL, std::cerr);
            EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libebpfoci::LogLevel::DEBUG);
    }

// these members are public for test purpose
public:
    std::string reference;
    boost::filesystem::path outputDir;
    boost::optional<boost::filesystem::path> ociLayoutDir;
    boost::optional<std::chrono::seconds> timeout;

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
