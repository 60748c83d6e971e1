#pragma once

#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "interval_store.hpp"
#include "time_utils.hpp"

constexpr int kCorrelationSaturationCount = 10;
constexpr double kPatternStaleAfterMs = 60.0 * 60.0 * 1000.0;
constexpr int kTopPatternLimit = 50;

// Freshness of the persisted pattern table. Owned by the engine, never global.
struct PatternCache {
    std::optional<double> computed_at_ms;
    bool seeded = false; // computed_at_ms was loaded from the store at least once
};

// count / 10 capped at 1. Monotone in count, 0 for 0.
double CorrelationStrength(int count);

// First-order "what follows what" table over consecutive activities
class TransitionMiner {
  public:
    TransitionMiner(IntervalStore &store, const Clock &clock, TimeBasis basis);

    // Rebuilds the whole pattern table from the last `days` of activity. The
    // table is swapped in one transaction; on failure the old table stays.
    bool ComputeTransitionPatterns(int days, const AnalyticsSettings &settings,
                                   PatternCache &cache, std::string &error);

    // Recomputes first when the cache is empty or older than an hour
    std::vector<BehavioralPattern> GetBehavioralPatterns(int days,
                                                         const AnalyticsSettings &settings,
                                                         PatternCache &cache);

    bool IsStale(PatternCache &cache);

  private:
    IntervalStore &m_Store;
    const Clock &m_Clock;
    TimeBasis m_Basis;
};
