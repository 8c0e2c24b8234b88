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

#include <optional>
#include <source_location>
#include <string>

namespace SPC {

/**
 * @brief Log level enumeration
 *
 * Ordered so that a numeric comparison filters messages below the minimum level.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 *
 * Case-insensitive. "warning" and "err" are accepted as aliases.
 *
 * @return Parsed level, or nullopt for an unknown name
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this to route controller logging into an application's own logging
 * system instead of the default spdlog console sink.
 *
 * @code
 * class AppLogger : public SPC::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         appLog->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { appLog->setMinLevel(level); }
 *     void flush() override { appLog->flush(); }
 * };
 *
 * SPC::Logger::setBackend(std::make_unique<AppLogger>());
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
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace SPC
