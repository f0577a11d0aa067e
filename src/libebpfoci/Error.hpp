/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_Error_hpp
#define libebpfoci_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cassert>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libebpfoci/LogLevel.hpp"

namespace libebpfoci {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro EBPFOCI_THROW_ERROR.
 * Additional error trace entries are created by the macro EBPFOCI_RETHROW_ERROR.
 *
 * what() always returns the message of the first entry, so an error raised deep
 * inside a registry copy reaches the caller with its original message even after
 * intermediate layers have appended their own context.
 *
 * Note: this class should be instantiated and thrown through the EBPFOCI_THROW_ERROR macro.
 * Caught instances of this class should be rethrown through the EBPFOCI_RETHROW_ERROR macro.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


// EBPFOCI_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define EBPFOCI_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define EBPFOCI_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libebpfoci::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libebpfoci::Error{logLevel, stackTraceEntry}; \
}

#define EBPFOCI_THROW_ERROR_1(errorMessage) EBPFOCI_THROW_ERROR_2(errorMessage, libebpfoci::LogLevel::ERROR)

#define EBPFOCI_THROW_ERROR(...) EBPFOCI_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, EBPFOCI_THROW_ERROR_2, EBPFOCI_THROW_ERROR_1)(__VA_ARGS__)


// EBPFOCI_RETHROW_ERROR macros
#define EBPFOCI_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define EBPFOCI_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libebpfoci::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libebpfoci::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libebpfoci::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libebpfoci::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libebpfoci::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libebpfoci::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                          libebpfoci::getExceptionTypeString(exception)}; \
        auto error = libebpfoci::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define EBPFOCI_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libebpfoci::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libebpfoci::Error */ \
        EBPFOCI_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        EBPFOCI_RETHROW_ERROR_3(exception, errorMessage, libebpfoci::LogLevel::ERROR) \
    } \
}

#define EBPFOCI_RETHROW_ERROR(...) EBPFOCI_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, EBPFOCI_RETHROW_ERROR_3, EBPFOCI_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
