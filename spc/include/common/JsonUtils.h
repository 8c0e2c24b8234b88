#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SPC {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by configuration and question-list loading
 *
 * Lookups never throw: a missing key or a value of the wrong type yields the
 * supplied default.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a JSON file
     * @param path File path
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt if the file is unreadable or malformed
     */
    static std::optional<json> loadJsonFile(const std::string &path, std::string *errorOut = nullptr);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    static int getInt(const json &object, const std::string &key, int defaultValue = 0);

    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace SPC
