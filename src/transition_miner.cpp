#include "transition_miner.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <tuple>

#include <spdlog/spdlog.h>

#include "suppression.hpp"

namespace {

struct TransitionAccumulator {
    PatternContext from;
    PatternContext to;
    int count = 0;
    double total_duration_before = 0.0;
    std::array<int, 24> hour_counts{};
    size_t first_seen = 0;
};

PatternContext ContextFor(const ActivityInterval &interval, bool suppressed) {
    PatternContext ctx;
    if (suppressed) {
        ctx.category = CategoryName(NEUTRAL);
        return ctx;
    }
    if (interval.category) {
        ctx.category = CategoryName(*interval.category);
    }
    if (!interval.domain.empty()) {
        ctx.domain = interval.domain;
    } else if (!interval.app_name.empty()) {
        ctx.domain = interval.app_name;
    }
    return ctx;
}

using TransitionKey = std::tuple<std::optional<std::string>, std::optional<std::string>,
                                 std::optional<std::string>, std::optional<std::string>>;

} // namespace

// ─────────────────────────────────────
double CorrelationStrength(int count) {
    if (count <= 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(count) / kCorrelationSaturationCount);
}

// ─────────────────────────────────────
TransitionMiner::TransitionMiner(IntervalStore &store, const Clock &clock, TimeBasis basis)
    : m_Store(store), m_Clock(clock), m_Basis(basis) {}

// ─────────────────────────────────────
bool TransitionMiner::ComputeTransitionPatterns(int days, const AnalyticsSettings &settings,
                                                PatternCache &cache, std::string &error) {
    days = ClampDays(days);
    const double now = m_Clock.NowMs();
    const PrivacyFilter filter(settings.excluded_keywords);

    LoadStats stats;
    std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesOverlapping(now - days * kDayMs, now, stats);
    // SQL orders by stored text; rows from other writers may not be canonical
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const ActivityInterval &a, const ActivityInterval &b) {
                         return a.started_at_ms < b.started_at_ms;
                     });

    std::map<TransitionKey, TransitionAccumulator> transitions;
    for (size_t i = 1; i < intervals.size(); ++i) {
        const ActivityInterval &prev = intervals[i - 1];
        const ActivityInterval &cur = intervals[i];

        const PatternContext from =
          ContextFor(prev, filter.ShouldSuppress(prev.domain, prev.app_name));
        const PatternContext to = ContextFor(cur, filter.ShouldSuppress(cur.domain, cur.app_name));
        const TransitionKey key{from.category, from.domain, to.category, to.domain};

        auto it = transitions.find(key);
        if (it == transitions.end()) {
            TransitionAccumulator acc;
            acc.from = from;
            acc.to = to;
            acc.first_seen = transitions.size();
            it = transitions.emplace(key, std::move(acc)).first;
        }

        TransitionAccumulator &acc = it->second;
        acc.count++;
        acc.total_duration_before += prev.seconds_active;
        acc.hour_counts[HourOfDay(cur.started_at_ms, m_Basis)]++;
    }

    // Insert in first-seen order so equal frequencies keep a stable order
    std::vector<const TransitionAccumulator *> ordered;
    ordered.reserve(transitions.size());
    for (const auto &[key, acc] : transitions) {
        ordered.push_back(&acc);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const TransitionAccumulator *a, const TransitionAccumulator *b) {
                  return a->first_seen < b->first_seen;
              });

    const std::string computedAt = FormatIsoMs(now);
    std::vector<BehavioralPattern> patterns;
    patterns.reserve(ordered.size());
    for (const TransitionAccumulator *acc : ordered) {
        BehavioralPattern pattern;
        pattern.from = acc->from;
        pattern.to = acc->to;
        pattern.frequency = acc->count;
        pattern.avg_duration_before_seconds =
          acc->count > 0 ? acc->total_duration_before / acc->count : 0.0;
        pattern.correlation_strength = CorrelationStrength(acc->count);

        int dominantHour = 0;
        int maxCount = 0;
        for (int h = 0; h < 24; ++h) {
            if (acc->hour_counts[h] > maxCount) {
                maxCount = acc->hour_counts[h];
                dominantHour = h;
            }
        }
        pattern.dominant_hour_of_day = dominantHour;
        pattern.computed_at = computedAt;
        patterns.push_back(std::move(pattern));
    }

    if (!m_Store.ReplacePatterns(patterns, error)) {
        spdlog::error("Failed to store behavioral patterns: {}", error);
        return false;
    }

    cache.computed_at_ms = now;
    cache.seeded = true;

    if (stats.skipped > 0) {
        spdlog::warn("ComputeTransitionPatterns skipped {} malformed intervals", stats.skipped);
    }
    spdlog::info("Computed {} behavioral patterns from {} activities", patterns.size(),
                 intervals.size());
    return true;
}

// ─────────────────────────────────────
bool TransitionMiner::IsStale(PatternCache &cache) {
    if (!cache.seeded) {
        if (const auto latest = m_Store.LatestPatternComputedAt()) {
            cache.computed_at_ms = ParseIsoMs(*latest);
        }
        cache.seeded = true;
    }
    if (!cache.computed_at_ms) {
        return true;
    }
    return m_Clock.NowMs() - *cache.computed_at_ms > kPatternStaleAfterMs;
}

// ─────────────────────────────────────
std::vector<BehavioralPattern> TransitionMiner::GetBehavioralPatterns(
  int days, const AnalyticsSettings &settings, PatternCache &cache) {
    if (IsStale(cache)) {
        std::string error;
        if (!ComputeTransitionPatterns(days, settings, cache, error)) {
            spdlog::warn("Serving previous behavioral patterns: {}", error);
        }
    }
    return m_Store.FetchTopPatterns(kTopPatternLimit);
}
