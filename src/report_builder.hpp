#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "interval_store.hpp"
#include "reports.hpp"
#include "time_utils.hpp"

constexpr double kFocusTrendImprovingRatio = 1.1;
constexpr double kFocusTrendDecliningRatio = 0.9;
constexpr int kDefaultPeakProductiveHour = 9;
constexpr int kDefaultRiskHour = 15;
constexpr size_t kMaxInsights = 5;

// Episode explorer bounds and defaults
constexpr int kDefaultEpisodeHours = 24;
constexpr int kMaxEpisodeHours = 24 * 14;
constexpr int kDefaultEpisodeGapMinutes = 8;
constexpr int kMaxEpisodeGapMinutes = 120;
constexpr int kDefaultEpisodeBinSeconds = 30;
constexpr int kMinEpisodeBinSeconds = 5;
constexpr int kMaxEpisodeBinSeconds = 300;
constexpr int kDefaultMaxEpisodes = 100;
constexpr int kMaxEpisodes = 500;
constexpr size_t kEpisodeTopEntries = 8;
constexpr size_t kEpisodeSummaryTopDomains = 12;
constexpr size_t kMaxContentSnapshots = 120;
constexpr double kActivitySnapshotConfidence = 0.7;
constexpr double kEventSnapshotConfidence = 0.95;

// Read-only aggregation of activity intervals, reading / writing streams and
// focus sessions into overview, time-of-day and trend reports. Every call
// recomputes from the store; nothing is cached.
class ReportBuilder {
  public:
    ReportBuilder(IntervalStore &store, const Clock &clock, TimeBasis basis);

    AnalyticsOverview GetOverview(int days, const AnalyticsSettings &settings);
    std::vector<TimeOfDayStats> GetTimeOfDayAnalysis(int days, const AnalyticsSettings &settings);
    std::vector<TrendPoint> GetTrends(TrendGranularity granularity,
                                      const AnalyticsSettings &settings);

    // Groups clipped activity into episodes wherever the gap between one slice's
    // end and the next slice's start exceeds gap_minutes. Only the newest
    // max_episodes are kept. Behaviour events and consumption markers inside an
    // episode are attached to it and to its fixed-width timeline bins.
    EpisodeMap GetBehaviorEpisodes(const EpisodeQuery &query, const AnalyticsSettings &settings);

    // Whole seconds of focus sessions inside [rangeStartMs, rangeEndMs]. A session
    // counts up to the earliest of its planned end, actual end and the range end.
    int64_t ComputeDeepWork(double rangeStartMs, double rangeEndMs);

    static std::vector<std::string> GenerateInsights(const CategoryBreakdown &categories,
                                                     int peakHour, int riskHour,
                                                     FocusTrend trend);

  private:
    // Clipped [start, end) of one focus session, nullopt when nothing is left
    std::optional<std::pair<double, double>> DeepWorkSpan(const PomodoroSession &session,
                                                          double rangeStartMs,
                                                          double rangeEndMs) const;

  private:
    IntervalStore &m_Store;
    const Clock &m_Clock;
    TimeBasis m_Basis;
};
