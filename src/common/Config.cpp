/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/Utility.hpp"


namespace ebpfoci {
namespace common {

Config::BuildTime::BuildTime()
    : version{EBPFOCI_VERSION}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libebpfoci::json::readAndValidate(configFilename, configSchemaFilename) }
{
    directories.initialize(*this);
}

void Config::load() {
    auto configFile = getConfigFile();
    auto schemaFile = getConfigSchemaFile();
    libebpfoci::logMessage(boost::format("Loading configuration %s (schema %s)") % configFile % schemaFile,
                           libebpfoci::LogLevel::DEBUG);

    if(!boost::filesystem::exists(configFile)) {
        auto message = boost::format("Configuration file %s not found.\n"
                                     "Use --config to select a configuration file, or --oci-layout"
                                     " to work with a local OCI layout") % configFile;
        libebpfoci::logMessage(message, libebpfoci::LogLevel::GENERAL, std::cerr);
        EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
    }

    try {
        json = libebpfoci::json::readAndValidate(configFile, schemaFile);
        directories.initialize(*this);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to load configuration %s") % configFile;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }
}

bool Config::isLoaded() const {
    return json.IsObject() && json.MemberCount() > 0;
}

boost::filesystem::path Config::getConfigFile() const {
    if(configFileFromCLI) {
        return *configFileFromCLI;
    }
    return installationPrefixDir / "etc/ebpfoci.json";
}

boost::filesystem::path Config::getConfigSchemaFile() const {
    return installationPrefixDir / "etc/ebpfoci.schema.json";
}

void Config::Directories::initialize(const common::Config& config) {
    temp = boost::filesystem::path(config.json["tempDir"].GetString());
    if (!boost::filesystem::is_directory(temp)) {
        auto message = boost::format("Invalid temporary directory %s") % temp;
        libebpfoci::logMessage(message, libebpfoci::LogLevel::GENERAL, std::cerr);
        EBPFOCI_THROW_ERROR(message.str(), libebpfoci::LogLevel::INFO);
    }
}

}} // namespaces
