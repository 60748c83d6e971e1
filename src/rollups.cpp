#include "rollups.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
RollupAccumulator::RollupAccumulator(IntervalStore &store, const Clock &clock, TimeBasis basis)
    : m_Store(store), m_Clock(clock), m_Basis(basis) {}

// ─────────────────────────────────────
std::vector<ActivityRollup> RollupAccumulator::GenerateLocalRollups(const std::string &deviceId,
                                                                    const std::string &startIso,
                                                                    const std::string &endIso,
                                                                    const PrivacyFilter &filter,
                                                                    LoadStats &stats) {
    const std::optional<double> startMs = ParseIsoMs(startIso);
    const std::optional<double> endMs = ParseIsoMs(endIso);
    if (!startMs || !endMs || *endMs <= *startMs) {
        spdlog::warn("GenerateLocalRollups: invalid range [{}, {})", startIso, endIso);
        return {};
    }

    const std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesStartedBetween(*startMs, *endMs, stats);
    const std::string updatedAt = FormatIsoMs(m_Clock.NowMs());

    // keyed by hour start ms so the output comes out ordered
    std::map<double, ActivityRollup> buckets;
    for (const ActivityInterval &interval : intervals) {
        const double hourStart = FloorToHourMs(interval.started_at_ms);
        auto it = buckets.find(hourStart);
        if (it == buckets.end()) {
            ActivityRollup rollup;
            rollup.device_id = deviceId;
            rollup.hour_start = FormatIsoMs(hourStart);
            rollup.updated_at = updatedAt;
            it = buckets.emplace(hourStart, std::move(rollup)).first;
        }

        ActivityRollup &bucket = it->second;
        const int64_t active =
          std::max<int64_t>(0, std::llround(std::max(0.0, interval.seconds_active)));
        const int64_t idle = std::max<int64_t>(0, std::llround(std::max(0.0, interval.idle_seconds)));

        const bool suppressed = filter.ShouldSuppress(interval.domain, interval.app_name);
        const Category category = suppressed ? NEUTRAL : interval.category.value_or(NEUTRAL);
        switch (category) {
        case PRODUCTIVE:
            bucket.productive += active;
            break;
        case FRIVOLITY:
            bucket.frivolity += active;
            break;
        default:
            bucket.neutral += active;
            break;
        }
        bucket.idle += idle;
    }

    std::vector<ActivityRollup> out;
    out.reserve(buckets.size());
    for (auto &[hour, rollup] : buckets) {
        out.push_back(std::move(rollup));
    }

    if (stats.skipped > 0) {
        spdlog::warn("GenerateLocalRollups skipped {} malformed intervals", stats.skipped);
    }
    spdlog::debug("Generated {} rollups for device {} in [{}, {})", out.size(), deviceId, startIso,
                  endIso);
    return out;
}

// ─────────────────────────────────────
bool RollupAccumulator::UpsertRollups(const std::vector<ActivityRollup> &rollups,
                                      std::string &error) {
    // Stored timestamps are canonical so range filters can compare them as text
    std::vector<ActivityRollup> normalized = rollups;
    const std::string now = FormatIsoMs(m_Clock.NowMs());
    for (ActivityRollup &rollup : normalized) {
        const std::optional<double> hourStart = ParseIsoMs(rollup.hour_start);
        if (rollup.device_id.empty() || !hourStart) {
            error = "rollup needs a device id and an ISO hour start";
            return false;
        }
        rollup.hour_start = FormatIsoMs(*hourStart);

        if (rollup.updated_at.empty()) {
            rollup.updated_at = now;
        } else if (const std::optional<double> updated = ParseIsoMs(rollup.updated_at)) {
            rollup.updated_at = FormatIsoMs(*updated);
        } else {
            error = "invalid rollup updated_at: " + rollup.updated_at;
            return false;
        }
    }

    if (!m_Store.UpsertActivityRollups(normalized, error)) {
        return false;
    }
    spdlog::info("Upserted {} activity rollups", rollups.size());
    return true;
}

// ─────────────────────────────────────
std::vector<ActivityRollup> RollupAccumulator::ListSince(const std::string &deviceId,
                                                         const std::string &updatedAfterIso) {
    const std::optional<double> since = ParseIsoMs(updatedAfterIso);
    if (!since) {
        spdlog::warn("ListSince: invalid timestamp '{}'", updatedAfterIso);
        return {};
    }
    return m_Store.ListActivityRollupsSince(deviceId, FormatIsoMs(*since));
}

// ─────────────────────────────────────
RollupSummary RollupAccumulator::GetSummary(const std::string &deviceId, int windowHours) {
    RollupSummary summary;
    summary.device_id = deviceId;
    summary.window_hours = ClampWindowHours(windowHours);

    // Slots are whole hours ending with the current one
    const double firstSlotMs =
      FloorToHourMs(m_Clock.NowMs()) - (summary.window_hours - 1) * kHourMs;
    summary.timeline.resize(summary.window_hours);
    for (int i = 0; i < summary.window_hours; ++i) {
        summary.timeline[i].hour_start = FormatIsoMs(firstSlotMs + i * kHourMs);
    }

    const std::vector<ActivityRollup> rows =
      m_Store.ListActivityRollupsFrom(deviceId, FormatIsoMs(firstSlotMs));
    summary.sample_count = static_cast<int>(rows.size());

    for (const ActivityRollup &row : rows) {
        summary.totals.productive += row.productive;
        summary.totals.neutral += row.neutral;
        summary.totals.frivolity += row.frivolity;
        summary.totals.idle += row.idle;
        summary.total_seconds += row.productive + row.neutral + row.frivolity;

        const std::optional<double> hourMs = ParseIsoMs(row.hour_start);
        if (!hourMs) {
            continue;
        }
        const auto idx = static_cast<long>(std::floor((*hourMs - firstSlotMs) / kHourMs));
        if (idx < 0 || idx >= summary.window_hours) {
            continue;
        }
        CategoryBreakdown &slot = summary.timeline[idx].totals;
        slot.productive += row.productive;
        slot.neutral += row.neutral;
        slot.frivolity += row.frivolity;
        slot.idle += row.idle;
    }

    for (RollupTimelineSlot &slot : summary.timeline) {
        slot.dominant = slot.totals.Dominant();
    }
    return summary;
}

// ─────────────────────────────────────
bool RollupAccumulator::RecordReadingProgress(double occurredAtMs, int dayStartHour,
                                              const ReadingProgressDelta &delta,
                                              std::string &error) {
    const double hourStart = FloorToHourMs(occurredAtMs);
    const std::string day = DayKey(LocalDayStartMs(occurredAtMs, dayStartHour, m_Basis), m_Basis);
    return m_Store.AccumulateReadingProgress(day, FormatIsoMs(hourStart),
                                             FormatIsoMs(m_Clock.NowMs()), delta, error);
}

// ─────────────────────────────────────
bool RollupAccumulator::RecordWritingProgress(double occurredAtMs, int dayStartHour,
                                              const WritingProgressDelta &delta,
                                              std::string &error) {
    const double hourStart = FloorToHourMs(occurredAtMs);
    const std::string day = DayKey(LocalDayStartMs(occurredAtMs, dayStartHour, m_Basis), m_Basis);
    return m_Store.AccumulateWritingProgress(day, FormatIsoMs(hourStart),
                                             FormatIsoMs(m_Clock.NowMs()), delta, error);
}
