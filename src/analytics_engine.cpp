#include "analytics_engine.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "suppression.hpp"

// ─────────────────────────────────────
AnalyticsEngine::AnalyticsEngine(IntervalStore &store, const Clock &clock, TimeBasis basis,
                                 SettingsGetter settings)
    : m_Settings(std::move(settings)), m_Reports(store, clock, basis),
      m_Transitions(store, clock, basis), m_Engagement(store, clock),
      m_Rollups(store, clock, basis) {}

// ─────────────────────────────────────
AnalyticsSettings AnalyticsEngine::ResolveSettings() const {
    if (!m_Settings) {
        return AnalyticsSettings{};
    }
    try {
        return m_Settings();
    } catch (const std::exception &e) {
        spdlog::warn("Settings unavailable, reporting without suppression: {}", e.what());
        return AnalyticsSettings{};
    }
}

// ─────────────────────────────────────
AnalyticsOverview AnalyticsEngine::GetOverview(int days) {
    return m_Reports.GetOverview(days, ResolveSettings());
}

// ─────────────────────────────────────
std::vector<TimeOfDayStats> AnalyticsEngine::GetTimeOfDayAnalysis(int days) {
    return m_Reports.GetTimeOfDayAnalysis(days, ResolveSettings());
}

// ─────────────────────────────────────
std::vector<TrendPoint> AnalyticsEngine::GetTrends(TrendGranularity granularity) {
    return m_Reports.GetTrends(granularity, ResolveSettings());
}

// ─────────────────────────────────────
EpisodeMap AnalyticsEngine::GetBehaviorEpisodes(const EpisodeQuery &query) {
    return m_Reports.GetBehaviorEpisodes(query, ResolveSettings());
}

// ─────────────────────────────────────
EngagementMetrics AnalyticsEngine::GetEngagementMetrics(const std::string &domain, int days) {
    return m_Engagement.GetEngagementMetrics(domain, days);
}

// ─────────────────────────────────────
std::vector<BehavioralPattern> AnalyticsEngine::GetBehavioralPatterns(int days) {
    return m_Transitions.GetBehavioralPatterns(days, ResolveSettings(), m_PatternCache);
}

// ─────────────────────────────────────
bool AnalyticsEngine::ComputeTransitionPatterns(int days, std::string &error) {
    return m_Transitions.ComputeTransitionPatterns(days, ResolveSettings(), m_PatternCache,
                                                   error);
}

// ─────────────────────────────────────
bool AnalyticsEngine::IngestBehaviorEvents(const std::vector<BehaviorEvent> &events,
                                           std::string &error) {
    return m_Engagement.IngestBehaviorEvents(events, error);
}

// ─────────────────────────────────────
std::vector<ActivityRollup> AnalyticsEngine::GenerateLocalRollups(const std::string &deviceId,
                                                                  const std::string &startIso,
                                                                  const std::string &endIso) {
    const PrivacyFilter filter(ResolveSettings().excluded_keywords);
    LoadStats stats;
    return m_Rollups.GenerateLocalRollups(deviceId, startIso, endIso, filter, stats);
}

// ─────────────────────────────────────
bool AnalyticsEngine::UpsertRollups(const std::vector<ActivityRollup> &rollups,
                                    std::string &error) {
    return m_Rollups.UpsertRollups(rollups, error);
}

// ─────────────────────────────────────
std::vector<ActivityRollup> AnalyticsEngine::ListSince(const std::string &deviceId,
                                                       const std::string &updatedAfterIso) {
    return m_Rollups.ListSince(deviceId, updatedAfterIso);
}

// ─────────────────────────────────────
RollupSummary AnalyticsEngine::GetRollupSummary(const std::string &deviceId, int windowHours) {
    return m_Rollups.GetSummary(deviceId, windowHours);
}

// ─────────────────────────────────────
bool AnalyticsEngine::RecordReadingProgress(double occurredAtMs,
                                            const ReadingProgressDelta &delta,
                                            std::string &error) {
    return m_Rollups.RecordReadingProgress(occurredAtMs, ResolveSettings().day_start_hour, delta,
                                           error);
}

// ─────────────────────────────────────
bool AnalyticsEngine::RecordWritingProgress(double occurredAtMs,
                                            const WritingProgressDelta &delta,
                                            std::string &error) {
    return m_Rollups.RecordWritingProgress(occurredAtMs, ResolveSettings().day_start_hour, delta,
                                           error);
}
