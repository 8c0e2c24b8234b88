#pragma once

#include "common/ILoggerBackend.h"
#include "common/JsonUtils.h"
#include <chrono>
#include <optional>
#include <string>

namespace SPC {

/**
 * @brief Runtime settings for hosts embedding the controller
 *
 * JSON form (all keys optional):
 * @code
 * { "logDirectory": "logs", "logToFile": true, "logLevel": "info", "idleWaitTimeoutMs": 2000 }
 * @endcode
 */
struct ControllerConfig {
    std::string logDirectory;
    bool logToFile = false;
    std::optional<LogLevel> logLevel;
    std::chrono::milliseconds idleWaitTimeout{2000};

    /**
     * @brief Build a config from a JSON object, defaults for missing keys
     * @param object Parsed JSON object
     * @param errorOut Optional error message output
     * @return Config, or nullopt if a present key holds an invalid value
     */
    static std::optional<ControllerConfig> fromJson(const json &object, std::string *errorOut = nullptr);

    /**
     * @brief Install the logging backend and level described by this config
     */
    void applyLogging() const;
};

}  // namespace SPC
