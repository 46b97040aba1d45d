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

#include <source_location>
#include <string>

namespace PFSM {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the engine in a game loop usually already own a logging
 * channel (editor console, on-screen overlay, crash reporter). Implementing
 * this interface routes all engine diagnostics there.
 *
 * Example: Forwarding to a game console
 * @code
 * class ConsoleLogger : public PFSM::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         gameConsole->print(level, message, loc.file_name(), loc.line());
 *     }
 *
 *     void setLevel(LogLevel level) override {
 *         gameConsole->setMinLevel(level);
 *     }
 *
 *     void flush() override {}
 * };
 *
 * // Before the first frame:
 * PFSM::Logger::setBackend(std::make_unique<ConsoleLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace PFSM
