/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_LogLevel_hpp
#define libebpfoci_LogLevel_hpp

namespace libebpfoci {

// ordered by severity; GENERAL messages are user-facing output and are always printed
enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

inline const char* getLogLevelString(LogLevel logLevel) {
    switch(logLevel) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::GENERAL: return "GENERAL";
    }
    return "UNKNOWN";
}

}

#endif
