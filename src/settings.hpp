#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common.hpp"
#include "interval_store.hpp"

// Returns the current analytics settings. May throw; the engine treats any
// exception as "no suppression, default day start".
using SettingsGetter = std::function<AnalyticsSettings()>;

constexpr size_t kMaxExcludedKeywords = 50;

// Trim, lower-case, drop empties and duplicates, keep at most 50
std::vector<std::string> NormalizeKeywords(const std::vector<std::string> &keywords);

class SettingsStore {
  public:
    SettingsStore(IntervalStore &store, int defaultDayStartHour);

    // Throws nlohmann::json::exception when a stored value is not valid JSON
    AnalyticsSettings Load() const;

    bool SaveExcludedKeywords(const std::vector<std::string> &keywords, std::string &error);
    bool SaveDayStartHour(int hour, std::string &error);

    SettingsGetter Getter() const;

  private:
    IntervalStore &m_Store;
    int m_DefaultDayStartHour;
};
