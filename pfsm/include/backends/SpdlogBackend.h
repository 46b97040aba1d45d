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
#include <spdlog/spdlog.h>

namespace PFSM {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend of the Logger facade:
 * - Colored console sink
 * - Optional file sink (<logDir>/pfsm.log)
 * - Minimum level taken from SPDLOG_LEVEL when set
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace PFSM
