/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_Logger_hpp
#define libebpfoci_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libebpfoci/LogLevel.hpp"
#include "libebpfoci/Error.hpp"

namespace libebpfoci {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libebpfoci::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libebpfoci::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libebpfoci::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libebpfoci::LogLevel logLevel) { level = logLevel; };
    libebpfoci::LogLevel getLevel() { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libebpfoci::LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(libebpfoci::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(libebpfoci::LogLevel logLevel,
                                             const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libebpfoci::LogLevel logLevel) const;

private:
    libebpfoci::LogLevel level;
    std::mutex streamMutex;
};

}

#endif
