/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <limits.h>
#include <unistd.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"

namespace libocmirror {
namespace process {

static void readCStream(FILE* const in, std::iostream* const out) {
    char buffer[4096];
    size_t count;
    while((count = fread(buffer, 1, sizeof(buffer), in)) > 0) {
        out->write(buffer, count);
    }
    if(ferror(in)) {
        OCMIRROR_THROW_ERROR("Failed to read C stream: call to fread() failed.");
    }
}

int forkExecWait(const CLIArguments& args, std::iostream* const childStdoutStream) {
    logMessage(boost::format("Forking and executing '%s'") % args, LogLevel::DEBUG);

    int pipefd[2];
    if(childStdoutStream) {
        if(pipe(pipefd) == -1) {
            auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
                % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(pid == 0) {
        if(childStdoutStream) {
            dup2(pipefd[1], STDOUT_FILENO);
            close(pipefd[0]);
            close(pipefd[1]);
        }
        execvp(args.argv()[0], args.argv());
        // exec failed
        fprintf(stderr, "Failed to execvp subprocess %s: %s\n", args.argv()[0], strerror(errno));
        _exit(127);
    }

    if(childStdoutStream) {
        close(pipefd[1]);
        FILE* childStdoutPipe = fdopen(pipefd[0], "r");
        if(!childStdoutPipe) {
            close(pipefd[0]);
            auto message = boost::format("Failed to fdopen stdout pipe of subprocess %s: %s")
                % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
        try {
            readCStream(childStdoutPipe, childStdoutStream);
            fclose(childStdoutPipe);
        } catch(Error& e) {
            fclose(childStdoutPipe);
            auto message = boost::format("Failed to read stdout from subprocess %s") % args;
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }
    }

    int status;
    do {
        if(waitpid(pid, &status, 0) == -1) {
            auto message = boost::format("Failed to waitpid subprocess %s: %s")
                % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
    } while(!WIFEXITED(status) && !WIFSIGNALED(status));

    if(!WIFEXITED(status)) {
        auto message = boost::format("Subprocess %s terminated abnormally") % args;
        OCMIRROR_THROW_ERROR(message.str());
    }

    logMessage(boost::format("%s (pid %d) exited with status %d") % args % pid % WEXITSTATUS(status),
               LogLevel::DEBUG);

    return WEXITSTATUS(status);
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}
