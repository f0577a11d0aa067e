/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "packaging/SkopeoRegistry.hpp"

#include <chrono>
#include <sstream>

#include <rapidjson/pointer.h>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"
#include "libebpfoci/PathRAII.hpp"
#include "libebpfoci/Utility.hpp"
#include "packaging/OCILayoutRegistry.hpp"


namespace ebpfoci {
namespace packaging {

const std::string SkopeoRegistry::stagingTag{"ebpfoci-artifact"};

SkopeoRegistry::SkopeoRegistry(std::shared_ptr<const common::Config> config)
    : skopeoPath{config->json["skopeoPath"].GetString()},
      tempDir{config->directories.temp}
{
    if (!boost::filesystem::is_regular_file(skopeoPath)) {
        auto message = boost::format("The path to the skopeo executable '%s' configured in ebpfoci.json does not "
                                     "lead to a regular file") % skopeoPath;
        EBPFOCI_THROW_ERROR(message.str());
    }

    if (const rapidjson::Value* configPolicy = rapidjson::Pointer("/containersPolicy/path").Get(config->json)) {
        if (!boost::filesystem::is_regular_file(configPolicy->GetString())) {
            auto message = boost::format("Custom containers policy file '%s' configured in ebpfoci.json"
                                         " is not a regular file") % configPolicy->GetString();
            EBPFOCI_THROW_ERROR(message.str());
        }
        customPolicyPath = boost::filesystem::path(configPolicy->GetString());
    }

    if (const rapidjson::Value* configEnforcePolicy = rapidjson::Pointer("/containersPolicy/enforce").Get(config->json)) {
        enforceCustomPolicy = configEnforcePolicy->GetBool();
    }

    // the member name contains a dot, which JSON pointers take literally
    if (const rapidjson::Value* configRegistriesD = rapidjson::Pointer("/containersRegistries.dPath").Get(config->json)) {
        if (!boost::filesystem::is_directory(configRegistriesD->GetString())) {
            auto message = boost::format("Custom containers registries.d path '%s' configured in ebpfoci.json"
                                         " is not a directory") % configRegistriesD->GetString();
            EBPFOCI_THROW_ERROR(message.str());
        }
        customRegistriesDPath = boost::filesystem::path(configRegistriesD->GetString());
    }

    if (const rapidjson::Value* configAuthFile = rapidjson::Pointer("/authFile").Get(config->json)) {
        if (!boost::filesystem::is_regular_file(configAuthFile->GetString())) {
            auto message = boost::format("Auth file '%s' configured in ebpfoci.json is not a regular file")
                % configAuthFile->GetString();
            EBPFOCI_THROW_ERROR(message.str());
        }
        authFilePath = boost::filesystem::path(configAuthFile->GetString());
    }

    if (const rapidjson::Value* configTlsVerify = rapidjson::Pointer("/tlsVerify").Get(config->json)) {
        tlsVerify = configTlsVerify->GetBool();
    }
}

void SkopeoRegistry::push(const libebpfoci::Context& context,
                          const MemoryStore& source,
                          const std::string& reference) const {
    printLog(boost::format("Pushing '%s'") % reference, libebpfoci::LogLevel::INFO);

    auto layoutRAII = libebpfoci::PathRAII{makeStagingLayoutPath()};
    try {
        OCILayoutRegistry{layoutRAII.getPath()}.copyFrom(context, source, reference, stagingTag);
        copy(context, Direction::push, layoutRAII.getPath(), reference);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to push '%s'") % reference;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Successfully pushed '%s'") % reference, libebpfoci::LogLevel::INFO);
}

void SkopeoRegistry::pull(const libebpfoci::Context& context,
                          const std::string& reference,
                          MemoryStore& destination) const {
    printLog(boost::format("Pulling '%s'") % reference, libebpfoci::LogLevel::INFO);

    auto layoutRAII = libebpfoci::PathRAII{makeStagingLayoutPath()};
    try {
        libebpfoci::filesystem::createFoldersIfNecessary(layoutRAII.getPath());
        copy(context, Direction::pull, layoutRAII.getPath(), reference);
        OCILayoutRegistry{layoutRAII.getPath()}.copyTo(context, stagingTag, destination, reference);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to pull '%s'") % reference;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Successfully pulled '%s'") % reference, libebpfoci::LogLevel::INFO);
}

void SkopeoRegistry::copy(const libebpfoci::Context& context, Direction direction,
                          const boost::filesystem::path& layoutDir, const std::string& reference) const {
    auto layoutString = "oci:" + layoutDir.string() + ":" + stagingTag;
    auto remoteString = "docker://" + reference;

    auto args = generateBaseArgs();
    args.push_back("copy");
    if (direction == Direction::push) {
        if (!authFilePath.empty()) {
            args += libebpfoci::CLIArguments{"--dest-authfile", authFilePath.string()};
        }
        if (!tlsVerify) {
            args.push_back("--dest-tls-verify=false");
        }
        args += libebpfoci::CLIArguments{layoutString, remoteString};
    }
    else {
        if (!authFilePath.empty()) {
            args += libebpfoci::CLIArguments{"--src-authfile", authFilePath.string()};
        }
        if (!tlsVerify) {
            args.push_back("--src-tls-verify=false");
        }
        args += libebpfoci::CLIArguments{remoteString, layoutString};
    }

    auto start = std::chrono::steady_clock::now();
    auto output = std::stringstream{};
    auto status = libebpfoci::process::forkExecWait(args, context, &output);
    printLog(boost::format("skopeo output:\n%s") % output.str(), libebpfoci::LogLevel::DEBUG);

    if(status != 0) {
        throwCopyError(direction, reference, status, output.str());
    }

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / double(1000);
    printLog(boost::format("Elapsed time on copy operation: %s [sec]") % elapsed, libebpfoci::LogLevel::INFO);
}

/**
 * Registries answer inconsistently to requests for missing or private content
 * (e.g. "denied" or "unauthorized" for both), so the skopeo output is only used
 * to give the user a hint; the full output is kept in the error message.
 */
void SkopeoRegistry::throwCopyError(Direction direction, const std::string& reference,
                                    int status, const std::string& output) const {
    auto operation = direction == Direction::push ? "push" : "pull";
    auto messageHeader = boost::format{"Failed to %s '%s'"} % operation % reference;
    printLog(messageHeader, libebpfoci::LogLevel::GENERAL, std::cerr);

    auto isDenied = output.find("denied") != std::string::npos
                 || output.find("unauthorized") != std::string::npos
                 || output.find("invalid username/password") != std::string::npos;
    auto isNotFound = output.find("manifest unknown") != std::string::npos
                   || output.find("name unknown") != std::string::npos
                   || output.find("not found") != std::string::npos;

    if (isNotFound && direction == Direction::pull) {
        auto message = boost::format("artifact '%s' not found in the remote registry\n%s") % reference % output;
        EBPFOCI_THROW_ERROR(message.str());
    }
    if (isDenied) {
        printLog("Access denied by the remote registry. The artifact may be private or not present,"
                 " or the configured credentials may be missing or wrong.",
                 libebpfoci::LogLevel::GENERAL, std::cerr);
        auto message = boost::format("access to '%s' denied by the remote registry\n%s") % reference % output;
        EBPFOCI_THROW_ERROR(message.str());
    }

    auto message = boost::format("skopeo exited with status %d while trying to %s '%s'\n%s")
        % status % operation % reference % output;
    EBPFOCI_THROW_ERROR(message.str());
}

boost::filesystem::path SkopeoRegistry::makeStagingLayoutPath() const {
    auto path = libebpfoci::filesystem::makeUniquePathWithRandomSuffix(tempDir / "ebpfoci-layout");
    printLog(boost::format("Staging OCI layout in: %s") % path, libebpfoci::LogLevel::DEBUG);
    return path;
}

libebpfoci::CLIArguments SkopeoRegistry::generateBaseArgs() const {
    auto args = libebpfoci::CLIArguments{skopeoPath.string()};

    auto verbosity = getVerbosityOption();
    if (!verbosity.empty()) {
        args.push_back(verbosity);
    }

    args += getPolicyOption();
    args += getRegistriesDOption();

    return args;
}

std::string SkopeoRegistry::getVerbosityOption() const {
    auto logLevel = libebpfoci::Logger::getInstance().getLevel();
    if (logLevel == libebpfoci::LogLevel::DEBUG) {
        return std::string{"--debug"};
    }
    return std::string{};
}

libebpfoci::CLIArguments SkopeoRegistry::getPolicyOption() const {
    auto systemPolicyPath = boost::filesystem::path("/etc/containers/policy.json");
    auto userPolicyExists = false;
    if (auto home = libebpfoci::environment::findVariable("HOME")) {
        userPolicyExists = boost::filesystem::exists(boost::filesystem::path{*home} / ".config/containers/policy.json");
    }

    if (enforceCustomPolicy) {
        return libebpfoci::CLIArguments{"--policy", customPolicyPath.string()};
    }
    else if (userPolicyExists || boost::filesystem::exists(systemPolicyPath)) {
        return libebpfoci::CLIArguments{};
    }
    else if (!customPolicyPath.empty()) {
        return libebpfoci::CLIArguments{"--policy", customPolicyPath.string()};
    }
    else {
        EBPFOCI_THROW_ERROR("Failed to detect default containers policy files and "
                            "no fallback policy file defined in ebpfoci.json");
    }
}

libebpfoci::CLIArguments SkopeoRegistry::getRegistriesDOption() const {
    if (!customRegistriesDPath.empty()) {
        return libebpfoci::CLIArguments{"--registries.d", customRegistriesDPath.string()};
    }
    return libebpfoci::CLIArguments{};
}

void SkopeoRegistry::printLog(const boost::format &message, libebpfoci::LogLevel level,
                              std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), level, outStream, errStream);
}

void SkopeoRegistry::printLog(const std::string& message, libebpfoci::LogLevel level,
                              std::ostream& outStream, std::ostream& errStream) const {
    libebpfoci::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}} // namespace
