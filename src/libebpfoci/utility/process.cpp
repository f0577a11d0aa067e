/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/logging.hpp"

/**
 * Utility functions for process operations
 */

namespace libebpfoci {
namespace process {

namespace {

const int pollIntervalMs = 50;

// Returns false once the read end reached EOF.
bool readAvailable(int fd, std::iostream* const out) {
    char buffer[4096];
    while(true) {
        auto n = read(fd, buffer, sizeof(buffer));
        if(n > 0) {
            if(out) {
                out->write(buffer, n);
            }
            continue;
        }
        if(n == 0) {
            return false;
        }
        if(errno == EINTR) {
            continue;
        }
        if(errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        auto message = boost::format("Failed to read output of subprocess: %s") % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
}

bool tryReap(pid_t pid, int& status) {
    auto ret = waitpid(pid, &status, WNOHANG);
    if(ret == -1) {
        if(errno == EINTR) {
            return false;
        }
        auto message = boost::format("Failed to waitpid subprocess (pid %d): %s") % pid % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
    return ret == pid && (WIFEXITED(status) || WIFSIGNALED(status));
}

void terminate(pid_t pid, const std::chrono::milliseconds& gracePeriod) {
    logMessage(boost::format("Terminating subprocess (pid %d)") % pid, LogLevel::DEBUG);

    int status;
    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + gracePeriod;
    while(std::chrono::steady_clock::now() < deadline) {
        if(tryReap(pid, status)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    logMessage(boost::format("Subprocess (pid %d) ignored SIGTERM, sending SIGKILL") % pid, LogLevel::DEBUG);
    kill(pid, SIGKILL);
    while(waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
}

}

/**
 * Forks and executes the given command, waiting for its completion while polling
 * the context. Stdout and stderr of the child are merged and, when a stream is given,
 * captured into it. If the context gets cancelled before the child exits, the child is
 * sent SIGTERM (then SIGKILL after the grace period) and an error is thrown.
 *
 * Returns the exit status of the child.
 */
int forkExecWait(const libebpfoci::CLIArguments& args,
                 const libebpfoci::Context& context,
                 std::iostream* const childOutputStream,
                 const std::chrono::milliseconds& terminationGracePeriod) {
    logMessage(boost::format("Forking and executing '%s'") % args, LogLevel::DEBUG);

    if(args.empty()) {
        EBPFOCI_THROW_ERROR("Failed to execute subprocess: empty command line");
    }

    context.throwIfCancelled((boost::format("Subprocess %s") % args).str());

    int pipefd[2];
    if(pipe2(pipefd, O_CLOEXEC) == -1) {
        auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
            % args % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args % strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        EBPFOCI_THROW_ERROR(message.str());
    }

    bool isChild = pid == 0;
    if(isChild) {
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(args.argv()[0], args.argv());
        dprintf(STDERR_FILENO, "Failed to execvp subprocess %s: %s\n", args.argv()[0], strerror(errno));
        _exit(127);
    }

    close(pipefd[1]);
    auto readFd = pipefd[0];
    if(fcntl(readFd, F_SETFL, fcntl(readFd, F_GETFL) | O_NONBLOCK) == -1) {
        auto message = boost::format("Failed to set output pipe of subprocess %s non-blocking: %s")
            % args % strerror(errno);
        terminate(pid, terminationGracePeriod);
        close(readFd);
        EBPFOCI_THROW_ERROR(message.str());
    }

    int status = 0;
    bool pipeOpen = true;
    try {
        while(true) {
            if(pipeOpen) {
                struct pollfd pfd = {readFd, POLLIN, 0};
                auto ret = poll(&pfd, 1, pollIntervalMs);
                if(ret == -1 && errno != EINTR) {
                    auto message = boost::format("Failed to poll output of subprocess %s: %s")
                        % args % strerror(errno);
                    EBPFOCI_THROW_ERROR(message.str());
                }
                if(ret > 0) {
                    pipeOpen = readAvailable(readFd, childOutputStream);
                }
            }
            else {
                std::this_thread::sleep_for(std::chrono::milliseconds{pollIntervalMs});
            }

            if(tryReap(pid, status)) {
                if(pipeOpen) {
                    readAvailable(readFd, childOutputStream);
                }
                break;
            }

            if(context.isCancelled()) {
                terminate(pid, terminationGracePeriod);
                auto message = boost::format("Subprocess %s aborted: %s") % args % context.getCancellationReason();
                EBPFOCI_THROW_ERROR(message.str());
            }
        }
    }
    catch(const std::exception& e) {
        close(readFd);
        auto message = boost::format("Failed to wait for subprocess %s") % args;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }
    close(readFd);

    if(!WIFEXITED(status)) {
        auto message = boost::format("Subprocess %s terminated abnormally") % args;
        EBPFOCI_THROW_ERROR(message.str());
    }

    logMessage( boost::format("%s (pid %d) exited with status %d") % args % pid % WEXITSTATUS(status),
                LogLevel::DEBUG);

    return WEXITSTATUS(status);
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}
