#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum Category { PRODUCTIVE = 1, NEUTRAL = 2, FRIVOLITY = 3, DRAINING = 4, EMERGENCY = 5 };

const char *CategoryName(Category category);
std::optional<Category> ParseCategory(const std::string &name);

// One tracked foreground activity, decoded from the store.
// ended_at_ms empty means the interval is still open.
struct ActivityInterval {
    int64_t id = 0;
    double started_at_ms = 0.0;
    std::optional<double> ended_at_ms;
    std::string domain;
    std::string app_name;
    std::optional<Category> category;
    double seconds_active = 0.0;
    double idle_seconds = 0.0;
    std::string url;
    std::string window_title;

    // domain, else app name, else "Unknown"
    std::string Label() const;
};

// Reading / writing hourly rollup row (only the columns the reports need)
struct AuxHourlyRollup {
    double hour_start_ms = 0.0;
    double active_seconds = 0.0;
    double focused_seconds = 0.0;
};

struct PomodoroSession {
    double started_at_ms = 0.0;
    std::optional<double> ended_at_ms;
    double planned_duration_sec = 0.0;
};

struct BehaviorEvent {
    std::string timestamp;
    std::optional<int64_t> session_id;
    std::string domain;
    std::string event_type;
    std::optional<int64_t> value_int;
    std::optional<double> value_float;
    std::string metadata; // serialized JSON object, empty when absent
};

// One paywall / library outcome from the consumption log. Empty strings are NULL.
struct ConsumptionMarker {
    std::string occurred_at;
    std::string kind;
    std::string title;
    std::string url;
    std::string domain;
    std::string meta; // serialized JSON object
};

struct ActivityRollup {
    std::string device_id;
    std::string hour_start;
    int64_t productive = 0;
    int64_t neutral = 0;
    int64_t frivolity = 0;
    int64_t idle = 0;
    std::string updated_at;
};

struct ReadingProgressDelta {
    int64_t active_seconds = 0;
    int64_t focused_seconds = 0;
    int64_t pages_read = 0;
    int64_t words_read = 0;
};

struct WritingProgressDelta {
    int64_t active_seconds = 0;
    int64_t focused_seconds = 0;
    int64_t keystrokes = 0;
    int64_t words_added = 0;
    int64_t words_deleted = 0;
    int64_t net_words = 0;
};

struct PatternContext {
    std::optional<std::string> category;
    std::optional<std::string> domain;
};

struct BehavioralPattern {
    int64_t id = 0;
    PatternContext from;
    PatternContext to;
    int frequency = 0;
    double avg_duration_before_seconds = 0.0;
    double correlation_strength = 0.0;
    int dominant_hour_of_day = 0;
    std::string computed_at;
};

struct AnalyticsSettings {
    std::vector<std::string> excluded_keywords;
    int day_start_hour = 4;
};

// Row accounting for a store read: decoded rows plus rows dropped as malformed
struct LoadStats {
    size_t rows = 0;
    size_t skipped = 0;
};
