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

#include "backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace PFSM {

namespace {
constexpr const char *LOGGER_NAME = "PFSM";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "pfsm.log";

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        file_sink->set_pattern(FILE_PATTERN);
        sinks.push_back(file_sink);
    }

    // Not registered globally: Logger::reset() followed by a new backend must not clash on the name
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::info);

    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (env_level) {
        std::string level_str(env_level);
        std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (level_str == "trace") {
            logger_->set_level(spdlog::level::trace);
        } else if (level_str == "debug") {
            logger_->set_level(spdlog::level::debug);
        } else if (level_str == "info") {
            logger_->set_level(spdlog::level::info);
        } else if (level_str == "warn" || level_str == "warning") {
            logger_->set_level(spdlog::level::warn);
        } else if (level_str == "err" || level_str == "error") {
            logger_->set_level(spdlog::level::err);
        } else if (level_str == "critical") {
            logger_->set_level(spdlog::level::critical);
        } else if (level_str == "off") {
            logger_->set_level(spdlog::level::off);
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

}  // namespace PFSM
