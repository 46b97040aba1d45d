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

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace PFSM {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Two usage patterns:
 *
 * 1. Default mode: spdlog backend, created lazily on first use
 * 2. Custom mode: the host injects its own ILoggerBackend implementation
 *
 * Example: Using default logger
 * @code
 * PFSM::Logger::initialize();
 * LOG_INFO("Character controller ready");
 * @endcode
 *
 * Example: Injecting custom logger
 * @code
 * PFSM::Logger::setBackend(std::make_unique<MyConsoleLogger>());
 * LOG_INFO("Character controller ready");  // Uses MyConsoleLogger
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend with user-provided implementation.
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * Creates default backend if no custom backend was injected.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    /**
     * @brief Drop the active backend
     *
     * The next log call recreates the default backend.
     */
    static void reset();

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace PFSM

// Format with the fmt copy shipped by spdlog; source_location is captured at the call site
#define LOG_TRACE(...) PFSM::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) PFSM::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) PFSM::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) PFSM::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) PFSM::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
