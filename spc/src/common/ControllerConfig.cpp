#include "common/ControllerConfig.h"
#include "common/Logger.h"

namespace SPC {

std::optional<ControllerConfig> ControllerConfig::fromJson(const json &object, std::string *errorOut) {
    if (!object.is_object()) {
        if (errorOut) {
            *errorOut = "Controller config must be a JSON object";
        }
        return std::nullopt;
    }

    ControllerConfig config;
    config.logDirectory = JsonUtils::getString(object, "logDirectory");
    config.logToFile = JsonUtils::getBool(object, "logToFile", !config.logDirectory.empty());

    if (JsonUtils::hasKey(object, "logLevel")) {
        config.logLevel = parseLogLevel(JsonUtils::getString(object, "logLevel"));
        if (!config.logLevel) {
            if (errorOut) {
                *errorOut = "Unknown logLevel: " + object["logLevel"].dump();
            }
            return std::nullopt;
        }
    }

    if (JsonUtils::hasKey(object, "idleWaitTimeoutMs")) {
        int timeoutMs = JsonUtils::getInt(object, "idleWaitTimeoutMs", -1);
        if (timeoutMs < 0) {
            if (errorOut) {
                *errorOut = "idleWaitTimeoutMs must be a non-negative integer";
            }
            return std::nullopt;
        }
        config.idleWaitTimeout = std::chrono::milliseconds(timeoutMs);
    }

    return config;
}

void ControllerConfig::applyLogging() const {
    Logger::initialize(logDirectory, logToFile);
    if (logLevel) {
        Logger::setLevel(*logLevel);
    }
}

}  // namespace SPC
