#include "reports.hpp"

namespace {

nlohmann::json OptionalString(const std::optional<std::string> &value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

nlohmann::json PatternContextJson(const PatternContext &ctx) {
    return {{"category", OptionalString(ctx.category)}, {"domain", OptionalString(ctx.domain)}};
}

nlohmann::json NullIfEmpty(const std::string &value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

nlohmann::json NamedSecondsJson(const std::vector<NamedSeconds> &items, const char *nameKey) {
    nlohmann::json out = nlohmann::json::array();
    for (const NamedSeconds &item : items) {
        out.push_back({{nameKey, item.name}, {"activeSeconds", item.active_seconds}});
    }
    return out;
}

nlohmann::json EventCountsJson(const EpisodeEventCounts &c) {
    return {{"scroll", c.scroll}, {"click", c.click},         {"keystroke", c.keystroke},
            {"focus", c.focus},   {"blur", c.blur},           {"idleStart", c.idle_start},
            {"idleEnd", c.idle_end}, {"visibility", c.visibility}};
}

nlohmann::json MetaJson(const std::string &meta) {
    if (meta.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed = nlohmann::json::parse(meta, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

nlohmann::json EpisodeJson(const BehaviorEpisode &e) {
    nlohmann::json slices = nlohmann::json::array();
    for (const EpisodeSlice &slice : e.context_slices) {
        slices.push_back({{"source", "activity"},
                          {"activityId", slice.activity_id},
                          {"start", slice.start},
                          {"end", slice.end},
                          {"appName", OptionalString(slice.app_name)},
                          {"domain", OptionalString(slice.domain)},
                          {"url", OptionalString(slice.url)},
                          {"windowTitle", OptionalString(slice.window_title)},
                          {"category", slice.category},
                          {"activeSeconds", slice.active_seconds},
                          {"idleSeconds", slice.idle_seconds}});
    }

    nlohmann::json snapshots = nlohmann::json::array();
    for (const ContentSnapshot &snap : e.content_snapshots) {
        snapshots.push_back({{"timestamp", snap.timestamp},
                             {"domain", OptionalString(snap.domain)},
                             {"url", OptionalString(snap.url)},
                             {"title", OptionalString(snap.title)},
                             {"source", snap.source},
                             {"confidence", snap.confidence}});
    }

    nlohmann::json markers = nlohmann::json::array();
    for (const ConsumptionMarker &marker : e.markers) {
        markers.push_back({{"timestamp", marker.occurred_at},
                           {"kind", marker.kind},
                           {"title", NullIfEmpty(marker.title)},
                           {"domain", NullIfEmpty(marker.domain)},
                           {"url", NullIfEmpty(marker.url)},
                           {"meta", MetaJson(marker.meta)},
                           {"source", "consumption-log"}});
    }

    nlohmann::json bins = nlohmann::json::array();
    for (const EpisodeBin &bin : e.timeline_bins) {
        bins.push_back({{"start", bin.start},
                        {"end", bin.end},
                        {"activeSeconds", bin.active_seconds},
                        {"idleSeconds", bin.idle_seconds},
                        {"categoryBreakdown", bin.category_breakdown},
                        {"eventCounts", EventCountsJson(bin.event_counts)},
                        {"topDomain", OptionalString(bin.top_domain)},
                        {"topTitle", OptionalString(bin.top_title)}});
    }

    return {{"id", e.id},
            {"start", e.start},
            {"end", e.end},
            {"durationSeconds", e.duration_seconds},
            {"activeSeconds", e.active_seconds},
            {"idleSeconds", e.idle_seconds},
            {"categoryBreakdown", e.category_breakdown},
            {"dominantCategory", e.dominant_category},
            {"topDomains", NamedSecondsJson(e.top_domains, "domain")},
            {"topApps", NamedSecondsJson(e.top_apps, "appName")},
            {"eventCounts", EventCountsJson(e.event_counts)},
            {"rates",
             {{"actionsPerMinute", e.rates.actions_per_minute},
              {"scrollsPerMinute", e.rates.scrolls_per_minute},
              {"clicksPerMinute", e.rates.clicks_per_minute},
              {"keystrokesPerMinute", e.rates.keystrokes_per_minute},
              {"focusEventsPerMinute", e.rates.focus_events_per_minute}}},
            {"domainSwitches", e.domain_switches},
            {"contextSlices", slices},
            {"contentSnapshots", snapshots},
            {"markers", markers},
            {"timelineBins", bins},
            {"sourceCoverage",
             {{"hasBehaviorEvents", e.has_behavior_events},
              {"hasContentTitles", e.has_content_titles},
              {"hasConsumptionMarkers", e.has_consumption_markers}}}};
}

} // namespace

// ─────────────────────────────────────
bool EpisodeEventCounts::Add(const std::string &eventType, int64_t amount) {
    int64_t *slot = nullptr;
    if (eventType == "scroll") {
        slot = &scroll;
    } else if (eventType == "click") {
        slot = &click;
    } else if (eventType == "keystroke") {
        slot = &keystroke;
    } else if (eventType == "focus") {
        slot = &focus;
    } else if (eventType == "blur") {
        slot = &blur;
    } else if (eventType == "idle_start") {
        slot = &idle_start;
    } else if (eventType == "idle_end") {
        slot = &idle_end;
    } else if (eventType == "visibility") {
        slot = &visibility;
    }
    if (!slot) {
        return false;
    }
    *slot += amount;
    return true;
}

// ─────────────────────────────────────
void CategoryBreakdown::AddActive(Category category, double seconds) {
    switch (category) {
    case PRODUCTIVE:
        productive += seconds;
        break;
    case NEUTRAL:
        neutral += seconds;
        break;
    case FRIVOLITY:
        frivolity += seconds;
        break;
    case DRAINING:
        draining += seconds;
        break;
    case EMERGENCY:
        emergency += seconds;
        break;
    }
}

// ─────────────────────────────────────
double CategoryBreakdown::Active() const {
    return productive + neutral + frivolity + draining + emergency;
}

// ─────────────────────────────────────
std::string CategoryBreakdown::Dominant() const {
    const std::pair<const char *, double> ordered[] = {
      {"productive", productive}, {"neutral", neutral},     {"frivolity", frivolity},
      {"draining", draining},     {"emergency", emergency}, {"idle", idle},
    };

    const char *best = "idle";
    double bestValue = 0.0;
    for (const auto &[name, value] : ordered) {
        if (value > bestValue) {
            bestValue = value;
            best = name;
        }
    }
    return best;
}

// ─────────────────────────────────────
const char *FocusTrendName(FocusTrend trend) {
    switch (trend) {
    case TREND_IMPROVING:
        return "improving";
    case TREND_DECLINING:
        return "declining";
    case TREND_STABLE:
        return "stable";
    }
    return "stable";
}

// ─────────────────────────────────────
const char *GranularityName(TrendGranularity granularity) {
    switch (granularity) {
    case GRANULARITY_HOUR:
        return "hour";
    case GRANULARITY_DAY:
        return "day";
    case GRANULARITY_WEEK:
        return "week";
    }
    return "day";
}

// ─────────────────────────────────────
std::optional<TrendGranularity> ParseGranularity(const std::string &name) {
    if (name == "hour") {
        return GRANULARITY_HOUR;
    }
    if (name == "day") {
        return GRANULARITY_DAY;
    }
    if (name == "week") {
        return GRANULARITY_WEEK;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
const char *EngagementLevelName(EngagementLevel level) {
    switch (level) {
    case ENGAGEMENT_INTENSE:
        return "intense";
    case ENGAGEMENT_HIGH:
        return "high";
    case ENGAGEMENT_MODERATE:
        return "moderate";
    case ENGAGEMENT_PASSIVE:
        return "passive";
    case ENGAGEMENT_LOW:
        return "low";
    }
    return "low";
}

// ╭─────────────────────────────────────╮
// │                JSON                 │
// ╰─────────────────────────────────────╯
void to_json(nlohmann::json &j, const CategoryBreakdown &b) {
    j = {{"productive", b.productive}, {"neutral", b.neutral},     {"frivolity", b.frivolity},
         {"draining", b.draining},     {"emergency", b.emergency}, {"idle", b.idle}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const AnalyticsOverview &o) {
    j = {{"periodDays", o.period_days},
         {"totalActiveHours", o.total_active_hours},
         {"productivityScore", o.productivity_score},
         {"deepWorkSeconds", o.deep_work_seconds},
         {"topEngagementDomain", OptionalString(o.top_engagement_domain)},
         {"focusTrend", FocusTrendName(o.focus_trend)},
         {"peakProductiveHour", o.peak_productive_hour},
         {"riskHour", o.risk_hour},
         {"avgSessionLength", o.avg_session_length},
         {"totalSessions", o.total_sessions},
         {"categoryBreakdown", o.category_breakdown},
         {"insights", o.insights},
         {"skippedIntervals", o.skipped_intervals}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const TimeOfDayStats &s) {
    j = {{"hour", s.hour},
         {"productive", s.totals.productive},
         {"neutral", s.totals.neutral},
         {"frivolity", s.totals.frivolity},
         {"draining", s.totals.draining},
         {"emergency", s.totals.emergency},
         {"idle", s.totals.idle},
         {"avgEngagement", s.avg_engagement},
         {"dominantCategory", s.dominant_category},
         {"dominantDomain", OptionalString(s.dominant_domain)},
         {"sampleCount", s.sample_count}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const TrendPoint &p) {
    j = {{"timestamp", p.timestamp},   {"label", p.label},
         {"productive", p.productive}, {"neutral", p.neutral},
         {"frivolity", p.frivolity},   {"emergency", p.emergency},
         {"idle", p.idle},             {"deepWork", p.deep_work},
         {"engagement", p.engagement}, {"qualityScore", p.quality_score}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const EngagementMetrics &m) {
    j = {{"domain", m.domain},
         {"totalSeconds", m.total_seconds},
         {"avgScrollDepth", m.avg_scroll_depth},
         {"avgScrollVelocity", m.avg_scroll_velocity},
         {"avgClicksPerMinute", m.avg_clicks_per_minute},
         {"avgKeystrokesPerMinute", m.avg_keystrokes_per_minute},
         {"fixationScore", m.fixation_score},
         {"engagementLevel", EngagementLevelName(m.engagement_level)},
         {"sessionCount", m.session_count},
         {"skippedIntervals", m.skipped_intervals}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const RollupSummary &s) {
    nlohmann::json timeline = nlohmann::json::array();
    for (const RollupTimelineSlot &slot : s.timeline) {
        timeline.push_back({{"hourStart", slot.hour_start},
                            {"productive", slot.totals.productive},
                            {"neutral", slot.totals.neutral},
                            {"frivolity", slot.totals.frivolity},
                            {"idle", slot.totals.idle},
                            {"dominant", slot.dominant}});
    }

    j = {{"deviceId", s.device_id.empty() ? nlohmann::json("all") : nlohmann::json(s.device_id)},
         {"windowHours", s.window_hours},
         {"sampleCount", s.sample_count},
         {"totalSeconds", s.total_seconds},
         {"totals",
          {{"productive", s.totals.productive},
           {"neutral", s.totals.neutral},
           {"frivolity", s.totals.frivolity},
           {"idle", s.totals.idle}}},
         {"timeline", timeline}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const BehavioralPattern &p) {
    j = {{"id", p.id},
         {"fromContext", PatternContextJson(p.from)},
         {"toContext", PatternContextJson(p.to)},
         {"frequency", p.frequency},
         {"avgTimeBefore", p.avg_duration_before_seconds},
         {"correlationStrength", p.correlation_strength},
         {"timeOfDayBucket", p.dominant_hour_of_day},
         {"computedAt", p.computed_at}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const ActivityRollup &r) {
    j = {{"deviceId", r.device_id},   {"hourStart", r.hour_start}, {"productive", r.productive},
         {"neutral", r.neutral},      {"frivolity", r.frivolity},  {"idle", r.idle},
         {"updatedAt", r.updated_at}};
}

// ─────────────────────────────────────
void to_json(nlohmann::json &j, const EpisodeMap &m) {
    nlohmann::json episodes = nlohmann::json::array();
    for (const BehaviorEpisode &episode : m.episodes) {
        episodes.push_back(EpisodeJson(episode));
    }

    j = {{"schemaVersion", 1},
         {"generatedAt", m.generated_at},
         {"range", {{"start", m.range_start}, {"end", m.range_end}}},
         {"query",
          {{"start", m.range_start},
           {"end", m.range_end},
           {"hours", m.hours},
           {"gapMinutes", m.gap_minutes},
           {"binSeconds", m.bin_seconds},
           {"maxEpisodes", m.max_episodes}}},
         {"summary",
          {{"totalEpisodes", m.episodes.size()},
           {"totalDurationSeconds", m.total_duration_seconds},
           {"totalActiveSeconds", m.total_active_seconds},
           {"totalIdleSeconds", m.total_idle_seconds},
           {"topDomains", NamedSecondsJson(m.top_domains, "domain")},
           {"totalMarkers", m.total_markers},
           {"totalContentSnapshots", m.total_content_snapshots}}},
         {"episodes", episodes},
         {"skippedIntervals", m.skipped_intervals}};
}
