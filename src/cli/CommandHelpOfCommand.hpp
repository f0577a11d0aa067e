/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_CommandHelpOfCommand_hpp
#define ebpfoci_cli_CommandHelpOfCommand_hpp

#include <memory>
#include <string>

#include "cli/Command.hpp"

namespace ebpfoci {
namespace cli {

// "ebpfoci help COMMAND": prints the help message of the wrapped command
class CommandHelpOfCommand : public Command {
public:
    explicit CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        printHelpMessage();
    }

    std::string getBriefDescription() const override {
        return command->getBriefDescription();
    }

    void printHelpMessage() const override {
        command->printHelpMessage();
    }

    const cli::Command& getCommand() const {
        return *command;
    }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
