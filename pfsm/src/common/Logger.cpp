// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-PFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PFSM (Pushdown Finite State Machine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Full terms: see LICENSE

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace PFSM {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_.reset();
}

void Logger::setLevel(LogLevel level) {
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
    ensureBackend();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    std::string enhanced_message = extractCleanFunctionName(loc) + "() - " + message;
    backend_->log(level, enhanced_message, loc);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t name_end = paren_pos;
    while (name_end > 0 && std::isspace(static_cast<unsigned char>(full_name[name_end - 1]))) {
        name_end--;
    }

    // Last space outside template arguments separates the return type from the qualified name
    size_t name_start = 0;
    int angle_bracket_count = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_bracket_count++;
        } else if (c == '>') {
            angle_bracket_count--;
        } else if (c == ' ' && angle_bracket_count == 0) {
            name_start = i + 1;
        }
    }

    std::string qualified_name = full_name.substr(name_start, name_end - name_start);
    while (!qualified_name.empty() && (qualified_name[0] == '*' || qualified_name[0] == '&')) {
        qualified_name.erase(0, 1);
    }

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

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace PFSM
