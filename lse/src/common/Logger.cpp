// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace LSE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend creation and replacement
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    ensureBackend();
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    ensureBackend();
    backend_->flush();
}

// Caller holds backend_mutex
void Logger::ensureBackend() {
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    const std::string line = extractCleanFunctionName(loc) + "() - " + message;

    std::lock_guard<std::mutex> lock(backend_mutex);
    ensureBackend();
    backend_->log(level, line, loc);
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    // Work backwards from the opening parenthesis
    size_t name_end = paren_pos;
    while (name_end > 0 && (std::isspace(static_cast<unsigned char>(full_name[name_end - 1])) ||
                            full_name[name_end - 1] == ')')) {
        name_end--;
    }

    // Last space outside template and parameter brackets separates the return type
    size_t space_pos = std::string::npos;
    int angle_bracket_count = 0;
    int paren_count = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_bracket_count++;
        } else if (c == '>') {
            angle_bracket_count--;
        } else if (c == '(') {
            paren_count++;
        } else if (c == ')') {
            paren_count--;
        } else if (c == ' ' && angle_bracket_count == 0 && paren_count == 0) {
            space_pos = i;
        }
    }

    size_t name_start = (space_pos != std::string::npos) ? space_pos + 1 : 0;
    std::string qualified_name = full_name.substr(name_start, name_end - name_start);

    while (!qualified_name.empty() && (std::isspace(static_cast<unsigned char>(qualified_name[0])) ||
                                       qualified_name[0] == '*' || qualified_name[0] == '&')) {
        qualified_name.erase(0, 1);
    }

    // StateMachine<LSE::ServiceState>::transition -> StateMachine::transition
    std::string result;
    int angle_count = 0;
    for (char c : qualified_name) {
        if (c == '<') {
            angle_count++;
        } else if (c == '>') {
            angle_count--;
        } else if (angle_count == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace LSE
