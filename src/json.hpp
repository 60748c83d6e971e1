#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"

// Lenient field readers: a missing or mistyped key yields the fallback
int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
std::string GetString(const nlohmann::json &j, const std::string &key,
                      const std::string &fallback);
std::optional<int64_t> GetOptionalInt64(const nlohmann::json &j, const std::string &key);
std::optional<double> GetOptionalDouble(const nlohmann::json &j, const std::string &key);
std::vector<std::string> JsonArray2String(const nlohmann::json &arr);

// Request bodies. Throw std::invalid_argument naming the first bad element.
std::vector<BehaviorEvent> ParseBehaviorEvents(const nlohmann::json &body);
std::vector<ActivityRollup> ParseActivityRollups(const nlohmann::json &body);
