#pragma once

#include <optional>
#include <vector>

#include "common.hpp"

// One interval intersected with one query window. Seconds are scaled by
// overlap / interval duration. Never persisted.
struct ClippedContribution {
    double interval_start_ms = 0.0;
    double interval_end_ms = 0.0;
    double overlap_start_ms = 0.0;
    double overlap_end_ms = 0.0;
    double active_seconds = 0.0;
    double idle_seconds = 0.0;

    double OverlapMs() const {
        return overlap_end_ms - overlap_start_ms;
    }
};

// Portion of a clipped contribution that lands in one fixed-width bucket
struct BucketShare {
    int index = 0;
    double bucket_start_ms = 0.0;
    double fraction = 0.0;
    double active_seconds = 0.0;
    double idle_seconds = 0.0;
};

double OverlapMs(double aStartMs, double aEndMs, double bStartMs, double bEndMs);

// endedAt when present, otherwise startedAt + (active + idle) seconds
double EffectiveEndMs(const ActivityInterval &interval);

std::optional<ClippedContribution> ClipInterval(const ActivityInterval &interval,
                                                double rangeStartMs, double rangeEndMs);

// Walks the wall-clock hours touched by the clip. index counts from the first hour.
std::vector<BucketShare> DistributeAcrossHours(const ClippedContribution &clip);

// Buckets are [originMs + i * widthMs, originMs + (i + 1) * widthMs) for i in [0, bucketCount).
// Parts of the clip outside every bucket are dropped.
std::vector<BucketShare> DistributeAcrossBuckets(const ClippedContribution &clip, double originMs,
                                                 double widthMs, int bucketCount);
