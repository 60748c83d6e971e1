#pragma once

#include <string>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "engagement.hpp"
#include "interval_store.hpp"
#include "report_builder.hpp"
#include "reports.hpp"
#include "rollups.hpp"
#include "settings.hpp"
#include "time_utils.hpp"
#include "transition_miner.hpp"

// Entry point for every report. Holds the pattern cache; everything else is
// recomputed from the store on each call.
class AnalyticsEngine {
  public:
    AnalyticsEngine(IntervalStore &store, const Clock &clock, TimeBasis basis,
                    SettingsGetter settings);

    AnalyticsOverview GetOverview(int days);
    std::vector<TimeOfDayStats> GetTimeOfDayAnalysis(int days);
    std::vector<TrendPoint> GetTrends(TrendGranularity granularity);
    EpisodeMap GetBehaviorEpisodes(const EpisodeQuery &query);
    EngagementMetrics GetEngagementMetrics(const std::string &domain, int days);

    std::vector<BehavioralPattern> GetBehavioralPatterns(int days);
    bool ComputeTransitionPatterns(int days, std::string &error);

    bool IngestBehaviorEvents(const std::vector<BehaviorEvent> &events, std::string &error);

    // Rollup sync hand-off
    std::vector<ActivityRollup> GenerateLocalRollups(const std::string &deviceId,
                                                     const std::string &startIso,
                                                     const std::string &endIso);
    bool UpsertRollups(const std::vector<ActivityRollup> &rollups, std::string &error);
    std::vector<ActivityRollup> ListSince(const std::string &deviceId,
                                          const std::string &updatedAfterIso);
    RollupSummary GetRollupSummary(const std::string &deviceId, int windowHours);

    bool RecordReadingProgress(double occurredAtMs, const ReadingProgressDelta &delta,
                               std::string &error);
    bool RecordWritingProgress(double occurredAtMs, const WritingProgressDelta &delta,
                               std::string &error);

    // Settings as the reports see them; defaults when the getter fails
    AnalyticsSettings ResolveSettings() const;

  private:
    SettingsGetter m_Settings;

    ReportBuilder m_Reports;
    TransitionMiner m_Transitions;
    EngagementScorer m_Engagement;
    RollupAccumulator m_Rollups;

    PatternCache m_PatternCache;
};
