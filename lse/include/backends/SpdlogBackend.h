// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace LSE {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend created by Logger::initialize(). Logs to a colored console
 * sink, plus a file sink (<logDir>/lse.log) when file logging is requested.
 * The SPDLOG_LEVEL environment variable overrides the initial debug level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace LSE
