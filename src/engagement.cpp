#include "engagement.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "time_utils.hpp"
#include "window_clipper.hpp"

namespace {

double RoundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

} // namespace

// ─────────────────────────────────────
int ComputeFixationScore(double clicksPerMinute, double keystrokesPerMinute,
                         double scrollVelocity) {
    const double raw = (clicksPerMinute * kFixationClickWeight +
                        keystrokesPerMinute * kFixationKeystrokeWeight) *
                       (1.0 - scrollVelocity / kFixationVelocityScale);
    const long score = std::lround(raw);
    return static_cast<int>(std::clamp<long>(score, 0, 100));
}

// ─────────────────────────────────────
EngagementLevel ClassifyEngagement(int fixationScore) {
    if (fixationScore >= kIntenseThreshold) {
        return ENGAGEMENT_INTENSE;
    }
    if (fixationScore >= kHighThreshold) {
        return ENGAGEMENT_HIGH;
    }
    if (fixationScore >= kModerateThreshold) {
        return ENGAGEMENT_MODERATE;
    }
    if (fixationScore >= kPassiveThreshold) {
        return ENGAGEMENT_PASSIVE;
    }
    return ENGAGEMENT_LOW;
}

// ─────────────────────────────────────
EngagementScorer::EngagementScorer(IntervalStore &store, const Clock &clock)
    : m_Store(store), m_Clock(clock) {}

// ─────────────────────────────────────
EngagementMetrics EngagementScorer::GetEngagementMetrics(const std::string &domain, int days) {
    days = ClampDays(days);
    const double rangeEndMs = m_Clock.NowMs();
    const double rangeStartMs = rangeEndMs - days * kDayMs;

    EngagementMetrics metrics;
    metrics.domain = domain;

    LoadStats stats;
    for (const ActivityInterval &interval :
         m_Store.FetchActivitiesForDomain(domain, rangeStartMs, rangeEndMs, stats)) {
        const std::optional<ClippedContribution> clip =
          ClipInterval(interval, rangeStartMs, rangeEndMs);
        if (!clip) {
            continue;
        }
        metrics.session_count++;
        metrics.total_seconds += clip->active_seconds;
    }
    metrics.skipped_intervals = stats.skipped;

    double scrollDepthSum = 0.0;
    int scrollDepthCount = 0;
    double scrollVelocitySum = 0.0;
    int scrollVelocityCount = 0;
    double clicks = 0.0;
    double keystrokes = 0.0;

    for (const BehaviorEvent &event : m_Store.FetchBehaviorEvents(domain, rangeStartMs, rangeEndMs)) {
        if (event.event_type == "scroll") {
            if (event.value_int) {
                scrollDepthSum += static_cast<double>(*event.value_int);
                scrollDepthCount++;
            }
            if (event.value_float && std::isfinite(*event.value_float)) {
                scrollVelocitySum += *event.value_float;
                scrollVelocityCount++;
            }
        } else if (event.event_type == "click") {
            clicks += static_cast<double>(event.value_int.value_or(1));
        } else if (event.event_type == "keystroke") {
            keystrokes += static_cast<double>(event.value_int.value_or(1));
        }
    }

    const double totalMinutes = std::max(1.0, metrics.total_seconds / 60.0);
    metrics.avg_scroll_depth =
      scrollDepthCount > 0 ? std::round(scrollDepthSum / scrollDepthCount) : 0.0;
    metrics.avg_scroll_velocity =
      scrollVelocityCount > 0 ? std::round(scrollVelocitySum / scrollVelocityCount) : 0.0;
    metrics.avg_clicks_per_minute = RoundToTenth(clicks / totalMinutes);
    metrics.avg_keystrokes_per_minute = RoundToTenth(keystrokes / totalMinutes);

    metrics.fixation_score = ComputeFixationScore(
      metrics.avg_clicks_per_minute, metrics.avg_keystrokes_per_minute, metrics.avg_scroll_velocity);
    metrics.engagement_level = ClassifyEngagement(metrics.fixation_score);

    spdlog::debug("Engagement for {} over {} days: {} sessions, fixation {}", domain, days,
                  metrics.session_count, metrics.fixation_score);
    return metrics;
}

// ─────────────────────────────────────
bool EngagementScorer::IngestBehaviorEvents(const std::vector<BehaviorEvent> &events,
                                            std::string &error) {
    // Stored timestamps are canonical so range filters can compare them as text
    std::vector<BehaviorEvent> normalized = events;
    for (BehaviorEvent &event : normalized) {
        const std::optional<double> ts = ParseIsoMs(event.timestamp);
        if (!ts) {
            error = "invalid event timestamp: " + event.timestamp;
            return false;
        }
        if (event.domain.empty() || event.event_type.empty()) {
            error = "event needs a domain and an event type";
            return false;
        }
        event.timestamp = FormatIsoMs(*ts);
    }

    if (!m_Store.InsertBehaviorEvents(normalized, error)) {
        return false;
    }
    spdlog::info("Ingested {} behavior events", events.size());
    return true;
}
