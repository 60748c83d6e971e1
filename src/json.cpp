#include "json.hpp"

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

const nlohmann::json &RequireArray(const nlohmann::json &body, const char *key) {
    if (!body.is_object() || !body.contains(key) || !body.at(key).is_array()) {
        throw std::invalid_argument(std::string("expected an object with a '") + key +
                                    "' array");
    }
    return body.at(key);
}

std::string RequireString(const nlohmann::json &item, const char *key, size_t index) {
    if (!item.contains(key) || !item.at(key).is_string()) {
        throw std::invalid_argument("item " + std::to_string(index) + ": missing string '" + key +
                                    "'");
    }
    return item.at(key).get<std::string>();
}

int64_t SecondsOrZero(const nlohmann::json &item, const char *key) {
    const std::optional<double> value = GetOptionalDouble(item, key);
    if (!value || !std::isfinite(*value) || *value < 0.0) {
        return 0;
    }
    return std::llround(*value);
}

} // namespace

// ─────────────────────────────────────
int GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number()) {
        spdlog::warn("'{}' is not a number, keeping {}", key, fallback);
        return fallback;
    }
    // Fractions truncate toward zero
    return it->is_number_integer() ? it->get<int>() : static_cast<int>(it->get<double>());
}

// ─────────────────────────────────────
std::string GetString(const nlohmann::json &j, const std::string &key,
                      const std::string &fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("GetString: key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::optional<int64_t> GetOptionalInt64(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<int64_t>();
    }
    if (j.at(key).is_number()) {
        return static_cast<int64_t>(std::llround(j.at(key).get<double>()));
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<double> GetOptionalDouble(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key) || !j.at(key).is_number()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

// ─────────────────────────────────────
std::vector<std::string> JsonArray2String(const nlohmann::json &arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        spdlog::warn("JsonArray2String: expected array, got {}", arr.type_name());
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonArray2String: array element is not string, skipping");
        }
    }
    return out;
}

// ─────────────────────────────────────
std::vector<BehaviorEvent> ParseBehaviorEvents(const nlohmann::json &body) {
    const nlohmann::json &items = RequireArray(body, "events");

    std::vector<BehaviorEvent> events;
    events.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const nlohmann::json &item = items[i];
        if (!item.is_object()) {
            throw std::invalid_argument("item " + std::to_string(i) + ": not an object");
        }

        BehaviorEvent event;
        event.timestamp = RequireString(item, "timestamp", i);
        event.domain = RequireString(item, "domain", i);
        event.event_type = RequireString(item, "eventType", i);
        event.session_id = GetOptionalInt64(item, "sessionId");
        event.value_int = GetOptionalInt64(item, "valueInt");
        event.value_float = GetOptionalDouble(item, "valueFloat");
        if (item.contains("metadata") && item.at("metadata").is_object()) {
            event.metadata = item.at("metadata").dump();
        }
        events.push_back(std::move(event));
    }
    return events;
}

// ─────────────────────────────────────
std::vector<ActivityRollup> ParseActivityRollups(const nlohmann::json &body) {
    const nlohmann::json &items = RequireArray(body, "rollups");

    std::vector<ActivityRollup> rollups;
    rollups.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const nlohmann::json &item = items[i];
        if (!item.is_object()) {
            throw std::invalid_argument("item " + std::to_string(i) + ": not an object");
        }

        ActivityRollup rollup;
        rollup.device_id = RequireString(item, "deviceId", i);
        rollup.hour_start = RequireString(item, "hourStart", i);
        rollup.productive = SecondsOrZero(item, "productive");
        rollup.neutral = SecondsOrZero(item, "neutral");
        rollup.frivolity = SecondsOrZero(item, "frivolity");
        rollup.idle = SecondsOrZero(item, "idle");
        rollup.updated_at = GetString(item, "updatedAt", "");
        rollups.push_back(std::move(rollup));
    }
    return rollups;
}
