#include "window_clipper.hpp"

#include <algorithm>
#include <cmath>

#include "time_utils.hpp"

// ─────────────────────────────────────
double OverlapMs(double aStartMs, double aEndMs, double bStartMs, double bEndMs) {
    const double start = std::max(aStartMs, bStartMs);
    const double end = std::min(aEndMs, bEndMs);
    return std::max(0.0, end - start);
}

// ─────────────────────────────────────
double EffectiveEndMs(const ActivityInterval &interval) {
    if (interval.ended_at_ms && std::isfinite(*interval.ended_at_ms)) {
        return *interval.ended_at_ms;
    }
    const double totalSeconds =
      std::max(0.0, interval.seconds_active) + std::max(0.0, interval.idle_seconds);
    return interval.started_at_ms + totalSeconds * 1000.0;
}

// ─────────────────────────────────────
std::optional<ClippedContribution> ClipInterval(const ActivityInterval &interval,
                                                double rangeStartMs, double rangeEndMs) {
    if (!std::isfinite(interval.started_at_ms)) {
        return std::nullopt;
    }

    const double activeRaw = std::max(0.0, interval.seconds_active);
    const double idleRaw = std::max(0.0, interval.idle_seconds);
    if (activeRaw + idleRaw <= 0.0) {
        return std::nullopt;
    }

    const double startMs = interval.started_at_ms;
    const double endMs = EffectiveEndMs(interval);
    if (!std::isfinite(endMs)) {
        return std::nullopt;
    }

    const double overlap = OverlapMs(startMs, endMs, rangeStartMs, rangeEndMs);
    if (overlap <= 0.0) {
        return std::nullopt;
    }

    // Sub-millisecond rows count in full
    const double durationMs = std::max(1.0, endMs - startMs);
    const double ratio = std::min(1.0, overlap / durationMs);

    ClippedContribution clip;
    clip.interval_start_ms = startMs;
    clip.interval_end_ms = endMs;
    clip.overlap_start_ms = std::max(startMs, rangeStartMs);
    clip.overlap_end_ms = std::min(endMs, rangeEndMs);
    clip.active_seconds = activeRaw * ratio;
    clip.idle_seconds = idleRaw * ratio;
    return clip;
}

// ─────────────────────────────────────
std::vector<BucketShare> DistributeAcrossHours(const ClippedContribution &clip) {
    std::vector<BucketShare> shares;
    const double spanMs = clip.OverlapMs();
    if (spanMs <= 0.0) {
        return shares;
    }

    const double firstHour = FloorToHourMs(clip.overlap_start_ms);
    const double lastHour = FloorToHourMs(clip.overlap_end_ms - 1.0);
    int index = 0;
    for (double hourStart = firstHour; hourStart <= lastHour; hourStart += kHourMs, ++index) {
        const double bucketOverlap =
          OverlapMs(clip.overlap_start_ms, clip.overlap_end_ms, hourStart, hourStart + kHourMs);
        if (bucketOverlap <= 0.0) {
            continue;
        }
        const double fraction = bucketOverlap / spanMs;
        shares.push_back({index, hourStart, fraction, clip.active_seconds * fraction,
                          clip.idle_seconds * fraction});
    }
    return shares;
}

// ─────────────────────────────────────
std::vector<BucketShare> DistributeAcrossBuckets(const ClippedContribution &clip, double originMs,
                                                 double widthMs, int bucketCount) {
    std::vector<BucketShare> shares;
    const double spanMs = clip.OverlapMs();
    if (spanMs <= 0.0 || widthMs <= 0.0 || bucketCount <= 0) {
        return shares;
    }

    const int first =
      std::max(0, static_cast<int>(std::floor((clip.overlap_start_ms - originMs) / widthMs)));
    const int last = std::min(
      bucketCount - 1, static_cast<int>(std::floor((clip.overlap_end_ms - 1.0 - originMs) / widthMs)));

    for (int idx = first; idx <= last; ++idx) {
        const double bucketStart = originMs + idx * widthMs;
        const double bucketOverlap =
          OverlapMs(clip.overlap_start_ms, clip.overlap_end_ms, bucketStart, bucketStart + widthMs);
        if (bucketOverlap <= 0.0) {
            continue;
        }
        const double fraction = bucketOverlap / spanMs;
        shares.push_back({idx, bucketStart, fraction, clip.active_seconds * fraction,
                          clip.idle_seconds * fraction});
    }
    return shares;
}
