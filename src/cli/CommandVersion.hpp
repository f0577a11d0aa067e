/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_CommandVersion_hpp
#define ebpfoci_cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/Logger.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"
#include "packaging/MediaTypes.hpp"


namespace ebpfoci {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libebpfoci::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        libebpfoci::Logger::getInstance().log(getVersionMessage(), "CommandVersion", libebpfoci::LogLevel::GENERAL);
    }

    std::string getVersionMessage() const {
        auto message = boost::format("ebpfoci %s
"
                                     "Program media type: %s
"
                                     "Config media type:  %s")
            % conf->buildTime.version
            % packaging::mediaType::ebpfProgram
            % packaging::mediaType::ebpfConfig;
        return message.str();
    }

    std::string getBriefDescription() const override {
        return "Show the ebpfoci version information";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("ebpfoci version")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libebpfoci::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libebpfoci::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libebpfoci::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the version command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        // the version command doesn't support options
        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'version' doesn't support options"
                                         "\nSee 'ebpfoci help version'");
            utility::printLog(message, libebpfoci::LogLevel::GENERAL, std::cerr);
            EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libebpfoci::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
