// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include <source_location>
#include <string>

namespace LSE {

// Severity of a diagnostic, lowest first; Off disables output
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Destination for LSE diagnostics
 *
 * Logger forwards every LOG_* line here. SpdlogBackend is the default;
 * tests install a recording backend to assert on rejected transitions and
 * subscriber failures.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Formatted line, already prefixed with the calling function
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    // Lines below level are dropped
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace LSE
