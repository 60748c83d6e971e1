#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

// Seconds per category plus idle. Shared by every report that folds intervals.
struct CategoryBreakdown {
    double productive = 0.0;
    double neutral = 0.0;
    double frivolity = 0.0;
    double draining = 0.0;
    double emergency = 0.0;
    double idle = 0.0;

    void AddActive(Category category, double seconds);
    double Active() const;
    double Total() const {
        return Active() + idle;
    }
    // Largest bucket in the order productive, neutral, frivolity, draining,
    // emergency, idle. "idle" when everything is zero.
    std::string Dominant() const;
};

enum FocusTrend { TREND_IMPROVING, TREND_STABLE, TREND_DECLINING };
const char *FocusTrendName(FocusTrend trend);

struct AnalyticsOverview {
    int period_days = 7;
    double total_active_hours = 0.0;
    int productivity_score = 50;
    int64_t deep_work_seconds = 0;
    std::optional<std::string> top_engagement_domain;
    FocusTrend focus_trend = TREND_STABLE;
    int peak_productive_hour = 9;
    int risk_hour = 15;
    int64_t avg_session_length = 0;
    int total_sessions = 0;
    CategoryBreakdown category_breakdown;
    std::vector<std::string> insights;
    size_t skipped_intervals = 0;
};

struct TimeOfDayStats {
    int hour = 0; // wall-clock hour this bucket represents
    CategoryBreakdown totals;
    int avg_engagement = 0;
    std::string dominant_category = "idle";
    std::optional<std::string> dominant_domain;
    int sample_count = 0;
};

enum TrendGranularity { GRANULARITY_HOUR, GRANULARITY_DAY, GRANULARITY_WEEK };
const char *GranularityName(TrendGranularity granularity);
std::optional<TrendGranularity> ParseGranularity(const std::string &name);

struct TrendPoint {
    std::string timestamp;
    std::string label;
    double productive = 0.0;
    double neutral = 0.0;
    double frivolity = 0.0; // draining folds in here
    double emergency = 0.0;
    double idle = 0.0;
    int64_t deep_work = 0;
    int engagement = 0;
    int quality_score = 50;
};

enum EngagementLevel { ENGAGEMENT_LOW, ENGAGEMENT_PASSIVE, ENGAGEMENT_MODERATE, ENGAGEMENT_HIGH,
                       ENGAGEMENT_INTENSE };
const char *EngagementLevelName(EngagementLevel level);

struct EngagementMetrics {
    std::string domain;
    double total_seconds = 0.0;
    double avg_scroll_depth = 0.0;
    double avg_scroll_velocity = 0.0;
    double avg_clicks_per_minute = 0.0;
    double avg_keystrokes_per_minute = 0.0;
    int fixation_score = 0;
    EngagementLevel engagement_level = ENGAGEMENT_LOW;
    int session_count = 0;
    size_t skipped_intervals = 0;
};

struct RollupTimelineSlot {
    std::string hour_start;
    CategoryBreakdown totals;
    std::string dominant = "idle";
};

struct RollupSummary {
    std::string device_id; // empty for all devices
    int window_hours = 24;
    int sample_count = 0;
    double total_seconds = 0.0; // productive + neutral + frivolity
    CategoryBreakdown totals;
    std::vector<RollupTimelineSlot> timeline;
};

// ─────────────────────────────────────
// Behaviour episodes: runs of activity separated by less than a gap
// ─────────────────────────────────────
struct EpisodeQuery {
    std::optional<std::string> start; // ISO; defaults to end - hours
    std::optional<std::string> end;   // ISO; defaults to now
    std::optional<double> hours;
    std::optional<double> gap_minutes;
    std::optional<double> bin_seconds;
    std::optional<double> max_episodes;
};

struct EpisodeEventCounts {
    int64_t scroll = 0;
    int64_t click = 0;
    int64_t keystroke = 0;
    int64_t focus = 0;
    int64_t blur = 0;
    int64_t idle_start = 0;
    int64_t idle_end = 0;
    int64_t visibility = 0;

    // false for event types that are not counted
    bool Add(const std::string &eventType, int64_t amount);
};

struct EpisodeRates {
    double actions_per_minute = 0.0;
    double scrolls_per_minute = 0.0;
    double clicks_per_minute = 0.0;
    double keystrokes_per_minute = 0.0;
    double focus_events_per_minute = 0.0;
};

// One activity as it falls inside an episode. Suppressed slices keep only
// their time; every name is dropped.
struct EpisodeSlice {
    int64_t activity_id = 0;
    std::string start;
    std::string end;
    std::optional<std::string> app_name;
    std::optional<std::string> domain;
    std::optional<std::string> url;
    std::optional<std::string> window_title;
    std::string category = "neutral";
    double active_seconds = 0.0;
    double idle_seconds = 0.0;
};

struct ContentSnapshot {
    std::string timestamp;
    std::optional<std::string> domain;
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::string source; // "activity" or "behavior-event"
    double confidence = 0.0;
};

struct EpisodeBin {
    std::string start;
    std::string end;
    double active_seconds = 0.0;
    double idle_seconds = 0.0;
    CategoryBreakdown category_breakdown;
    EpisodeEventCounts event_counts;
    std::optional<std::string> top_domain;
    std::optional<std::string> top_title;
};

struct NamedSeconds {
    std::string name;
    int64_t active_seconds = 0;
};

struct BehaviorEpisode {
    std::string id;
    std::string start;
    std::string end;
    int64_t duration_seconds = 0;
    int64_t active_seconds = 0;
    int64_t idle_seconds = 0;
    CategoryBreakdown category_breakdown; // whole seconds
    std::string dominant_category = "idle";
    std::vector<NamedSeconds> top_domains;
    std::vector<NamedSeconds> top_apps;
    EpisodeEventCounts event_counts;
    EpisodeRates rates;
    int domain_switches = 0;
    std::vector<EpisodeSlice> context_slices;
    std::vector<ContentSnapshot> content_snapshots;
    std::vector<ConsumptionMarker> markers;
    std::vector<EpisodeBin> timeline_bins;
    bool has_behavior_events = false;
    bool has_content_titles = false;
    bool has_consumption_markers = false;
};

struct EpisodeMap {
    std::string generated_at;
    std::string range_start;
    std::string range_end;
    int hours = 24;
    int gap_minutes = 8;
    int bin_seconds = 30;
    int max_episodes = 100;

    int64_t total_duration_seconds = 0;
    int64_t total_active_seconds = 0;
    int64_t total_idle_seconds = 0;
    std::vector<NamedSeconds> top_domains;
    size_t total_markers = 0;
    size_t total_content_snapshots = 0;

    std::vector<BehaviorEpisode> episodes;
    size_t skipped_intervals = 0;
};

void to_json(nlohmann::json &j, const CategoryBreakdown &b);
void to_json(nlohmann::json &j, const AnalyticsOverview &o);
void to_json(nlohmann::json &j, const TimeOfDayStats &s);
void to_json(nlohmann::json &j, const TrendPoint &p);
void to_json(nlohmann::json &j, const EngagementMetrics &m);
void to_json(nlohmann::json &j, const RollupSummary &s);
void to_json(nlohmann::json &j, const BehavioralPattern &p);
void to_json(nlohmann::json &j, const ActivityRollup &r);
void to_json(nlohmann::json &j, const EpisodeMap &m);
