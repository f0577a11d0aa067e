/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandPull.hpp"
#include "cli/CommandPush.hpp"
#include "cli/CommandVersion.hpp"


namespace ebpfoci {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandPull>("pull");
    addCommand<cli::CommandPush>("push");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        throwInvalidCommandName(commandName);
    }
    auto it = map.find(commandName);
    return it->second();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libebpfoci::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    if(!isValidCommandName(commandName)) {
        throwInvalidCommandName(commandName);
    }
    auto it = mapWithArguments.find(commandName);
    return it->second(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    auto ptr = new cli::CommandHelpOfCommand{std::move(commandObject)};
    return std::unique_ptr<cli::Command>{ptr};
}

void CommandObjectsFactory::throwInvalidCommandName(const std::string& commandName) const {
    auto message = boost::format("'%s' is not an ebpfoci command\nSee 'ebpfoci help'") % commandName;
    libebpfoci::Logger::getInstance().log(message, "CommandObjectsFactory", libebpfoci::LogLevel::GENERAL, std::cerr);
    EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::DEBUG);
}

}
}
