#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace SPC {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::loadJsonFile(const std::string &path, std::string *errorOut) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        if (errorOut) {
            *errorOut = "Failed to open file: " + path;
        }
        LOG_WARN("JsonUtils: Failed to open '{}'", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int JsonUtils::getInt(const json &object, const std::string &key, int defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            LOG_WARN("JsonUtils: Value of '{}' does not fit in int, using default {}", key, defaultValue);
            return defaultValue;
        }
        return static_cast<int>(value.get<uint64_t>());
    }

    int64_t number = value.get<int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        LOG_WARN("JsonUtils: Value of '{}' does not fit in int, using default {}", key, defaultValue);
        return defaultValue;
    }
    return static_cast<int>(number);
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_boolean()) {
        return defaultValue;
    }

    return value.get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

}  // namespace SPC
