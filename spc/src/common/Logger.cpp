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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace SPC {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

std::optional<LogLevel> parseLogLevel(const std::string &name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") {
        return LogLevel::Trace;
    } else if (level == "debug") {
        return LogLevel::Debug;
    } else if (level == "info") {
        return LogLevel::Info;
    } else if (level == "warn" || level == "warning") {
        return LogLevel::Warn;
    } else if (level == "err" || level == "error") {
        return LogLevel::Error;
    } else if (level == "critical") {
        return LogLevel::Critical;
    } else if (level == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

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

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    // "ret ns::Class<T>::method(args) const" -> "ns::Class::method"
    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0 && c != '*' && c != '&' && !std::isspace(static_cast<unsigned char>(c))) {
            result += c;
        }
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace SPC
