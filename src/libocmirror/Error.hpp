/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Error_hpp
#define libocmirror_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>
#include <cassert>

#include <boost/filesystem.hpp>

#include "libocmirror/LogLevel.hpp"

namespace libocmirror {

/**
 * Class of failure carried by an Error, so that callers can tell apart
 * e.g. a registry that cannot be reached from a package missing in a catalog.
 * The kind is set where the error is first thrown and survives rethrows.
 */
enum class ErrorKind {
    Generic,
    Transport,
    ReferenceResolution,
    PackageNotFound,
    ChannelNotFound,
    SignatureRequirement,
    PartialMirror
};

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro OCMIRROR_THROW_ERROR
 * (or OCMIRROR_THROW_ERROR_OF_KIND). Additional error trace entries are created
 * by the macro OCMIRROR_RETHROW_ERROR.
 *
 * Note: this class should be instantiated and thrown through the OCMIRROR_THROW_ERROR macros.
 * Caught instances of this class should be rethrown through the OCMIRROR_RETHROW_ERROR macro.
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
    Error(LogLevel logLevel, const ErrorTraceEntry& entry, ErrorKind kind = ErrorKind::Generic)
        : logLevel{ logLevel }
        , kind{ kind }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
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

    ErrorKind getKind() const {
        return kind;
    }

    void setKind(ErrorKind value) {
        kind = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    ErrorKind kind = ErrorKind::Generic;
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
std::string getErrorKindString(ErrorKind kind);

}


// OCMIRROR_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define OCMIRROR_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define OCMIRROR_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libocmirror::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libocmirror::Error{logLevel, stackTraceEntry}; \
}

#define OCMIRROR_THROW_ERROR_1(errorMessage) OCMIRROR_THROW_ERROR_2(errorMessage, libocmirror::LogLevel::ERROR)

#define OCMIRROR_THROW_ERROR(...) OCMIRROR_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, OCMIRROR_THROW_ERROR_2, OCMIRROR_THROW_ERROR_1)(__VA_ARGS__)

#define OCMIRROR_THROW_ERROR_OF_KIND(errorMessage, errorKind) { \
    auto stackTraceEntry = libocmirror::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libocmirror::Error{libocmirror::LogLevel::ERROR, stackTraceEntry, errorKind}; \
}


// OCMIRROR_RETHROW_ERROR macros
#define OCMIRROR_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libocmirror::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libocmirror::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libocmirror::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libocmirror::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libocmirror::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libocmirror::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                           libocmirror::getExceptionTypeString(exception)}; \
        auto error = libocmirror::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define OCMIRROR_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libocmirror::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libocmirror::Error */ \
        OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, libocmirror::LogLevel::ERROR) \
    } \
}

#define OCMIRROR_RETHROW_ERROR(...) OCMIRROR_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, OCMIRROR_RETHROW_ERROR_3, OCMIRROR_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
