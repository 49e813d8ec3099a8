#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace VCH {

using json = nlohmann::json;

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Every wire line and report line goes through these helpers so parse
 * failures are reported the same way everywhere.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Serialize json object to a single-line JSON string
     *
     * Invalid UTF-8 coming from an implementation is replaced rather than
     * aborting serialization.
     */
    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Safely get string value from JSON object
     * @return String value or default if missing or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Get an optional string member
     * @return The string, or nullopt when the key is absent, null or not a string
     */
    static std::optional<std::string> getOptionalString(const json &object, const std::string &key);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief JSON truthiness: false, null, 0, "", [] and {} are falsy
     */
    static bool isTruthy(const json &value);

    /**
     * @brief Current UTC time as an ISO-8601 string (e.g. 2025-01-31T12:00:00.123Z)
     */
    static std::string utcTimestamp();
};

}  // namespace VCH
