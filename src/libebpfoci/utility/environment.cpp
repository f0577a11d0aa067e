/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <cstdlib>
#include <cstring>

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/logging.hpp"

/**
 * Utility functions for environment variables
 */

namespace libebpfoci {
namespace environment {

std::string getVariable(const std::string& key) {
    auto value = findVariable(key);
    if(!value) {
        auto message = boost::format("Environment doesn't contain variable with key %s") % key;
        EBPFOCI_THROW_ERROR(message.str());
    }
    return *value;
}

boost::optional<std::string> findVariable(const std::string& key) {
    char* p = getenv(key.c_str());
    if(p == nullptr) {
        return {};
    }
    logMessage(boost::format("Got environment variable %s=%s") % key % p, libebpfoci::LogLevel::DEBUG);
    return std::string{p};
}

void setVariable(const std::string& key, const std::string& value) {
    int overwrite = 1;
    if(setenv(key.c_str(), value.c_str(), overwrite) != 0) {
        auto message = boost::format("Failed to setenv(%s, %s, %d): %s")
            % key % value % overwrite % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
    logMessage(boost::format("Set environment variable %s=%s") % key % value, libebpfoci::LogLevel::DEBUG);
}

void unsetVariable(const std::string& key) {
    if(unsetenv(key.c_str()) != 0) {
        auto message = boost::format("Failed to unsetenv(%s): %s") % key % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
}

}}
