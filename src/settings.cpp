#include "settings.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

constexpr const char *kExcludedKeywordsKey = "excludedKeywords";
constexpr const char *kDayStartHourKey = "dayStartHour";

std::string Trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(begin, end - begin);
}

} // namespace

// ─────────────────────────────────────
std::vector<std::string> NormalizeKeywords(const std::vector<std::string> &keywords) {
    std::vector<std::string> out;
    for (const std::string &raw : keywords) {
        std::string keyword = Trim(raw);
        std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (keyword.empty()) {
            continue;
        }
        if (std::find(out.begin(), out.end(), keyword) != out.end()) {
            continue;
        }
        out.push_back(std::move(keyword));
        if (out.size() >= kMaxExcludedKeywords) {
            break;
        }
    }
    return out;
}

// ─────────────────────────────────────
SettingsStore::SettingsStore(IntervalStore &store, int defaultDayStartHour)
    : m_Store(store), m_DefaultDayStartHour(std::clamp(defaultDayStartHour, 0, 23)) {}

// ─────────────────────────────────────
AnalyticsSettings SettingsStore::Load() const {
    AnalyticsSettings settings;
    settings.day_start_hour = m_DefaultDayStartHour;

    if (const auto raw = m_Store.GetSetting(kExcludedKeywordsKey)) {
        const nlohmann::json parsed = nlohmann::json::parse(*raw);
        std::vector<std::string> keywords;
        if (parsed.is_array()) {
            for (const auto &item : parsed) {
                if (item.is_string()) {
                    keywords.push_back(item.get<std::string>());
                }
            }
        }
        settings.excluded_keywords = NormalizeKeywords(keywords);
    }

    if (const auto raw = m_Store.GetSetting(kDayStartHourKey)) {
        const nlohmann::json parsed = nlohmann::json::parse(*raw);
        if (parsed.is_number_integer()) {
            settings.day_start_hour = std::clamp(parsed.get<int>(), 0, 23);
        }
    }

    return settings;
}

// ─────────────────────────────────────
bool SettingsStore::SaveExcludedKeywords(const std::vector<std::string> &keywords,
                                         std::string &error) {
    const std::vector<std::string> normalized = NormalizeKeywords(keywords);
    if (!m_Store.SetSetting(kExcludedKeywordsKey, nlohmann::json(normalized).dump(), error)) {
        return false;
    }
    spdlog::info("Saved {} excluded keywords", normalized.size());
    return true;
}

// ─────────────────────────────────────
bool SettingsStore::SaveDayStartHour(int hour, std::string &error) {
    const int clamped = std::clamp(hour, 0, 23);
    if (!m_Store.SetSetting(kDayStartHourKey, std::to_string(clamped), error)) {
        return false;
    }
    spdlog::info("Saved day start hour: {}", clamped);
    return true;
}

// ─────────────────────────────────────
SettingsGetter SettingsStore::Getter() const {
    return [this]() { return Load(); };
}
