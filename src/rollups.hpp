#pragma once

#include <string>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "interval_store.hpp"
#include "reports.hpp"
#include "suppression.hpp"
#include "time_utils.hpp"

// Per-device hourly category totals for sync hand-off, plus the additive
// reading / writing progress streams.
class RollupAccumulator {
  public:
    RollupAccumulator(IntervalStore &store, const Clock &clock, TimeBasis basis);

    // Buckets raw intervals started in [startIso, endIso) by the UTC hour of their start.
    // No clipping: an interval counts whole in the hour it began.
    std::vector<ActivityRollup> GenerateLocalRollups(const std::string &deviceId,
                                                     const std::string &startIso,
                                                     const std::string &endIso,
                                                     const PrivacyFilter &filter,
                                                     LoadStats &stats);

    bool UpsertRollups(const std::vector<ActivityRollup> &rollups, std::string &error);
    std::vector<ActivityRollup> ListSince(const std::string &deviceId,
                                          const std::string &updatedAfterIso);

    // deviceId empty reads every device
    RollupSummary GetSummary(const std::string &deviceId, int windowHours);

    // Day rows are keyed by the day (starting at dayStartHour) the progress fell in
    bool RecordReadingProgress(double occurredAtMs, int dayStartHour,
                               const ReadingProgressDelta &delta, std::string &error);
    bool RecordWritingProgress(double occurredAtMs, int dayStartHour,
                               const WritingProgressDelta &delta, std::string &error);

  private:
    IntervalStore &m_Store;
    const Clock &m_Clock;
    TimeBasis m_Basis;
};
