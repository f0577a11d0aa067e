/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cstring>

#include "packaging/ArtifactReference.hpp"
#include "packaging/OCILayoutRegistry.hpp"
#include "packaging/SkopeoRegistry.hpp"


namespace ebpfoci {
namespace cli {
namespace utility {

static bool hasDashPrefix(const char* s) {
    bool result = strlen(s) > 1 && s[0]=='-' && s[1]!='-';
    return result;
}

static bool hasDashDashPrefix(const char* s) {
    bool result = strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
    return result;
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    bool result = option->semantic()->max_tokens() > 0;
    return result;
}

static libebpfoci::CLIArguments::const_iterator processPossibleValueInNextToken(libebpfoci::CLIArguments::const_iterator arg,
        libebpfoci::CLIArguments::const_iterator argsEnd, libebpfoci::CLIArguments& argsGroup) {
    // always include the current token (the option)
    argsGroup.push_back(*arg);

    // if next arg token exists and does not start with dash it's the value: include it and skip over
    auto nextArg = arg+1;
    if (nextArg != argsEnd) {
        if(!hasDashPrefix(*nextArg)){
            argsGroup.push_back(*nextArg);
            ++arg;
        }
    }

    return arg;
}

static libebpfoci::CLIArguments::const_iterator processDashDashOption(libebpfoci::CLIArguments::const_iterator arg,
        libebpfoci::CLIArguments::const_iterator argsEnd, libebpfoci::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // if token contains '=' then it's using adjacent style and already provides a value
    if(argString.find('=') != std::string::npos) {
        argsGroup.push_back(argString);
    }
    else {
        // extract name by removing "--" prefix
        auto argName = argString.substr(2);

        // find if this is an option for the current command
        auto argOption = optionsDescription.find_nothrow(argName, false);

        // not an option: include and continue to next token (Boost will detect error about wrong option)
        if(!argOption) {
            argsGroup.push_back(*arg);
            return arg;
        }

        // check if option might take a value
        if(optionTakesValue(argOption)) {
            arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
        }
        else {
            argsGroup.push_back(*arg);
        }
    }

    return arg;
}

static libebpfoci::CLIArguments::const_iterator processDashOption(libebpfoci::CLIArguments::const_iterator arg,
        libebpfoci::CLIArguments::const_iterator argsEnd, libebpfoci::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // remove '-' prefix
    auto argSubstring = argString.substr(1);

    for(auto it = argSubstring.cbegin(); it != argSubstring.cend(); ++it) {
        // find if this is an option for the current command
        auto findArg = std::string{"-"} + *it;
        auto argOption = optionsDescription.find_nothrow(findArg, false);

        // not an option: include and continue to next token (Boost will detect error about wrong option)
        if(!argOption) {
            argsGroup.push_back(*arg);
            break;
        }

        // check if option might take a value
        if(optionTakesValue(argOption)) {
            // is token finished?
            if(it+1 == argSubstring.end()) {
                arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
            }
            else {
                argsGroup.push_back(*arg);
                break;
            }
        }
        else {
            // current option takes no value. If token continues it could contain "sticky" short options
            // is token finished?
            if(it+1 == argSubstring.end()) {
                argsGroup.push_back(*arg);
            }
            else {
                // analyze next character
                continue;
            }
        }
    }

    return arg;
}

/**
 * Group option arguments and positional arguments into two individual CLIArguments objects.
 *
 * The first group contains the program/command name, its options and their values, if present;
 * it is meant to be further processed by boost::program_option functions.
 * The second group contains all the arguments from the first detected positional argument
 * (not an option or a value) onwards.
 * The second group may contain options for subcommands; such options are not parsed by this function.
 * The second group can be passed around to access subcommand arguments and parse them appropriately.
 *
 * If there are no positional arguments, the second CLIArguments object is empty.
 *
 * The style used for identifying options and the terminology (e.g. "short", "long", "sticky") takes
 * as reference the UNIX style of boost::program_options:
 * https://www.boost.org/doc/libs/1_65_0/doc/html/boost/program_options/command_line_style/style_t.html
 * The same style is also used in the Command classes for parsing the command line with Boost.
 *
 * E.g. the CLI arguments "ebpfoci --verbose push --info text probe.o localhost/probe:v1" are grouped
 * into two CLIArguments objects ("ebpfoci --verbose", "push --info text probe.o localhost/probe:v1").
 */
std::tuple<libebpfoci::CLIArguments, libebpfoci::CLIArguments> groupOptionsAndPositionalArguments(
        const libebpfoci::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libebpfoci::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libebpfoci::CLIArguments, libebpfoci::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    // Initialize the first arguments group with the first input argument (the name of the program or command)
    if(isOption(args.argv()[0])) {
        auto message = boost::format("Expected a program or command name, got option '%s'") % args.argv()[0];
        EBPFOCI_THROW_ERROR(message.str());
    }
    nameAndOptionArgs.push_back(args.argv()[0]);

    // Start analysis from second argument
    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libebpfoci::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processDashDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else if(hasDashPrefix(*arg)) {
            arg = processDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libebpfoci::CLIArguments, libebpfoci::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libebpfoci::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'ebpfoci help %s'") % quantity % command % command;
        printLog(message, libebpfoci::LogLevel::GENERAL, std::cerr);
        EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
    }
}

/**
 * Validates an artifact reference given on the command line, so that a malformed
 * reference is reported before any file is read or any registry is contacted.
 * The reference is returned as typed: the registry canonicalizes it again.
 */
std::string parseArtifactReference(const std::string& input) {
    packaging::ArtifactReference::parse(input);
    return input;
}

/**
 * A local OCI layout is used when one is given, otherwise the remote registry
 * is reached through skopeo as set up in the configuration file, which is loaded
 * here on first use.
 */
std::shared_ptr<const packaging::Registry> makeRegistry(std::shared_ptr<common::Config> conf,
                                                        const boost::optional<boost::filesystem::path>& ociLayoutDir) {
    if(ociLayoutDir) {
        printLog(boost::format("Using OCI layout %s") % *ociLayoutDir, libebpfoci::LogLevel::DEBUG);
        return std::make_shared<packaging::OCILayoutRegistry>(*ociLayoutDir);
    }

    if(!conf->isLoaded()) {
        conf->load();
    }
    return std::make_shared<packaging::SkopeoRegistry>(std::move(conf));
}

libebpfoci::Context makeContext(const boost::optional<std::chrono::seconds>& timeout) {
    if(timeout) {
        printLog(boost::format("Operation timeout: %d seconds") % timeout->count(), libebpfoci::LogLevel::DEBUG);
        return libebpfoci::Context::withTimeout(*timeout);
    }
    return libebpfoci::Context{};
}

void printLog(const std::string& message, libebpfoci::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libebpfoci::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libebpfoci::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
