// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SPC-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SPC (Survey Progress Controller).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE at the repository root

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace SPC {

/**
 * @brief Process-wide logging facade
 *
 * All controller components log through this class. The backend is the spdlog
 * console logger unless the host application injects its own ILoggerBackend.
 *
 * Thread-safe: backend installation is guarded, and the spdlog backend uses
 * multi-threaded sinks.
 *
 * @code
 * SPC::Logger::initialize("logs", true);
 * LOG_INFO("Survey session {} started", sessionId);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize the default console logger if no backend is installed yet
     */
    static void initialize();

    /**
     * @brief Initialize the default logger with an additional file sink
     *
     * @param logDir Directory for the log file (created if missing)
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

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

}  // namespace SPC

// std::format based macros capturing the caller's source_location
#define LOG_TRACE(...) SPC::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) SPC::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) SPC::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) SPC::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) SPC::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
