/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include "aux/unitTestMain.hpp"
#include "libebpfoci/Error.hpp"
#include "libebpfoci/Logger.hpp"


namespace libebpfoci {
namespace test {

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& logAllLevels() {
        auto& logger = libebpfoci::Logger::getInstance();
        logger.log("GENERAL message", "registry", libebpfoci::LogLevel::GENERAL, stdoutStream, stderrStream);
        logger.log("DEBUG message", "registry", libebpfoci::LogLevel::DEBUG, stdoutStream, stderrStream);
        logger.log("INFO message", "registry", libebpfoci::LogLevel::INFO, stdoutStream, stderrStream);
        logger.log("WARN message", "registry", libebpfoci::LogLevel::WARN, stdoutStream, stderrStream);
        logger.log("ERROR message", "registry", libebpfoci::LogLevel::ERROR, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectInStdout(const std::string& levels) {
        expectedStdout = levels;
        return *this;
    }

    LoggerChecker& expectInStderr(const std::string& levels) {
        expectedStderr = levels;
        return *this;
    }

    ~LoggerChecker() {
        CHECK_EQUAL(expectedStdout, levelsIn(stdoutStream.str()));
        CHECK_EQUAL(expectedStderr, levelsIn(stderrStream.str()));
    }

private:
    // e.g. "GENERAL DEBUG INFO" for the messages found in the given output, in order
    static std::string levelsIn(const std::string& output) {
        auto levels = std::string{};
        auto regex = boost::regex{"^(?:\\[[0-9]+\\.[0-9]+\\] \\[[^]]*\\] \\[registry\\] \\[([A-Z]+)\\] )?([A-Z]+) message$"};
        auto stream = std::istringstream{output};
        auto line = std::string{};
        while(std::getline(stream, line)) {
            boost::smatch matches;
            CHECK(boost::regex_match(line, matches, regex));
            if(matches[1].matched) {
                CHECK_EQUAL(matches[1].str(), matches[2].str());
            }
            levels += (levels.empty() ? "" : " ") + matches[2].str();
        }
        return levels;
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;
    std::string expectedStdout;
    std::string expectedStderr;
};

TEST(LoggerTestGroup, messagesAreFilteredByLevel) {
    libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::DEBUG);
    LoggerChecker{}.logAllLevels()
        .expectInStdout("GENERAL DEBUG INFO")
        .expectInStderr("WARN ERROR");

    libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::INFO);
    LoggerChecker{}.logAllLevels()
        .expectInStdout("GENERAL INFO")
        .expectInStderr("WARN ERROR");

    libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::WARN);
    LoggerChecker{}.logAllLevels()
        .expectInStdout("GENERAL")
        .expectInStderr("WARN ERROR");

    libebpfoci::Logger::getInstance().setLevel(libebpfoci::LogLevel::ERROR);
    LoggerChecker{}.logAllLevels()
        .expectInStdout("GENERAL")
        .expectInStderr("ERROR");
}

TEST(LoggerTestGroup, errorTraceIsPrintedMostNestedLast) {
    auto error = libebpfoci::Error{libebpfoci::LogLevel::ERROR, {"blob not found", "OCILayoutRegistry.cpp", 10, "fetchBlob"}};
    error.appendErrorTraceEntry({"failed to pull", "EbpfRegistry.cpp", 20, "pull"});

    std::ostringstream errStream;
    libebpfoci::Logger::getInstance().logErrorTrace(error, "test", errStream);

    auto output = errStream.str();
    auto outer = output.find("failed to pull");
    auto inner = output.find("blob not found");
    CHECK(outer != std::string::npos);
    CHECK(inner != std::string::npos);
    CHECK(outer < inner);
    CHECK(output.find("OCILayoutRegistry.cpp:10") != std::string::npos);
}

TEST(LoggerTestGroup, errorTraceBelowLevelIsNotPrinted) {
    auto error = libebpfoci::Error{libebpfoci::LogLevel::INFO, {"cancelled", "Context.cpp", 1, "throwIfCancelled"}};

    std::ostringstream errStream;
    libebpfoci::Logger::getInstance().logErrorTrace(error, "test", errStream);

    CHECK(errStream.str().empty());
}

TEST(LoggerTestGroup, logLevelStrings) {
    CHECK_EQUAL(std::string{"DEBUG"}, std::string{libebpfoci::getLogLevelString(libebpfoci::LogLevel::DEBUG)});
    CHECK_EQUAL(std::string{"WARN"}, std::string{libebpfoci::getLogLevelString(libebpfoci::LogLevel::WARN)});
    CHECK(libebpfoci::LogLevel::ERROR > libebpfoci::LogLevel::WARN);
}

}}

EBPFOCI_UNITTEST_MAIN_FUNCTION();
