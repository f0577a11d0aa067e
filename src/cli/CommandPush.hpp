/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_CommandPush_hpp
#define ebpfoci_cli_CommandPush_hpp

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

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


namespace ebpfoci {
namespace cli {

class CommandPush : public Command {
public:
    CommandPush() {
        initializeOptionsDescription();
    }

    CommandPush(const libebpfoci::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto package = packaging::EbpfPackage{};
        package.programFileBytes = libebpfoci::filesystem::readFile(programFile);
        package.ebpfConfig.info = info;

        auto registry = packaging::makeEbpfRegistry(cli::utility::makeRegistry(conf, ociLayoutDir));
        registry->push(cli::utility::makeContext(timeout), reference, package, annotations);

        cli::utility::printLog(boost::format("Pushed %s to %s") % programFile.filename().string() % reference,
                               libebpfoci::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Push an eBPF program to a registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("ebpfoci push [OPTIONS] PROGRAM REGISTRY/REPOSITORY[:TAG]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addExample("ebpfoci push --info \"trace tcp connects\" tcpconnect.o ghcr.io/probes/tcpconnect:v1")
            .addExample("ebpfoci push --oci-layout ./layout tcpconnect.o localhost:5000/tcpconnect");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("info",
                boost::program_options::value<std::string>(&info),
                "Free-form description stored in the artifact's config")
            ("annotation",
                boost::program_options::value<std::vector<std::string>>(&annotationArgs)->composing(),
                "Annotation of the config entry in the form KEY=VALUE (can be repeated)")
            ("oci-layout",
                boost::program_options::value<std::string>(),
                "Push to the OCI layout in this directory instead of a remote registry")
            ("timeout",
                boost::program_options::value<unsigned int>(),
                "Abort the operation after this number of seconds");
    }

    void parseCommandArguments(const libebpfoci::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of push command"), libebpfoci::LogLevel::DEBUG);

        libebpfoci::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the push command expects exactly two positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 2, 2, "push");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            for(const auto& annotation : annotationArgs) {
                auto kv = libebpfoci::string::parseKeyValuePair(annotation);
                annotations[kv.first] = kv.second;
            }

            if(values.count("oci-layout")) {
                ociLayoutDir = boost::filesystem::absolute(values["oci-layout"].as<std::string>());
            }

            if(values.count("timeout")) {
                timeout = std::chrono::seconds{values["timeout"].as<unsigned int>()};
            }

            programFile = boost::filesystem::absolute(positionalArgs.argv()[0]);
            if(!boost::filesystem::is_regular_file(programFile)) {
                auto message = boost::format("Program file %s is not a regular file") % programFile;
                EBPFOCI_THROW_ERROR(message.str());
            }

            reference = cli::utility::parseArtifactReference(positionalArgs.argv()[1]);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'ebpfoci help push'") % e.what();
            cli::utility::printLog(message, libebpfoci::LogLevel::GENERAL, std::cerr);
            EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libebpfoci::LogLevel::DEBUG);
    }

// these members are public for test purpose
public:
    boost::filesystem::path programFile;
    std::string reference;
    std::string info;
    packaging::Annotations annotations;
    boost::optional<boost::filesystem::path> ociLayoutDir;
    boost::optional<std::chrono::seconds> timeout;

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::vector<std::string> annotationArgs;
};

}
}

#endif
