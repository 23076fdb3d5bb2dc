/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Logger_hpp
#define libocmirror_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "libocmirror/Error.hpp"

namespace libocmirror {

/**
 * Process-wide diagnostic sink. The CLI sets the threshold once at startup;
 * components only emit through it. Emission is serialized, so messages from
 * concurrent registry/signature workers never interleave.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const LogLevel& logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const LogLevel& logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void logErrorTrace(const Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(LogLevel logLevel) { level = logLevel; };
    LogLevel getLevel() const { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(LogLevel logLevel, const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(LogLevel logLevel) const;

private:
    LogLevel level;
    std::mutex mutex;
};

}

#endif
