#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <chrono>
#include <ctime>
#include <format>

namespace VCH {

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

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    return getOptionalString(object, key).value_or(defaultValue);
}

std::optional<std::string> JsonUtils::getOptionalString(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return std::nullopt;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }

    return it->get<std::string>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return false;
    }
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

bool JsonUtils::isTruthy(const json &value) {
    switch (value.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
        return false;
    case json::value_t::boolean:
        return value.get<bool>();
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return value.get<double>() != 0.0;
    case json::value_t::string:
        return !value.get_ref<const std::string &>().empty();
    case json::value_t::array:
    case json::value_t::object:
    case json::value_t::binary:
        return !value.empty();
    }
    return false;
}

std::string JsonUtils::utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&now_time_t, &tm_buf);

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                       tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(now_ms.count()));
}

}  // namespace VCH
