#include "report_builder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>

#include <spdlog/spdlog.h>

#include "suppression.hpp"
#include "window_clipper.hpp"

namespace {

std::string FormatHour12(int h) {
    const char *ampm = h >= 12 ? "PM" : "AM";
    const int hour = h % 12 == 0 ? 12 : h % 12;
    return std::to_string(hour) + ampm;
}

// Lexicographically smallest name wins a tie
std::optional<std::string> TopDomain(const std::map<std::string, double> &totals) {
    std::optional<std::string> best;
    double bestSeconds = 0.0;
    for (const auto &[domain, seconds] : totals) {
        if (seconds > bestSeconds) {
            bestSeconds = seconds;
            best = domain;
        }
    }
    return best;
}

// Lowest hour wins a tie
int ArgmaxHour(const std::array<double, 24> &hours, int fallback) {
    int best = fallback;
    double bestSeconds = 0.0;
    for (int h = 0; h < 24; ++h) {
        if (hours[h] > bestSeconds) {
            bestSeconds = hours[h];
            best = h;
        }
    }
    return best;
}

// Rounds, then clamps; missing or non-finite values take the fallback
int ClampRounded(const std::optional<double> &value, int fallback, int lo, int hi) {
    const double v = value && std::isfinite(*value) ? std::round(*value) : fallback;
    return static_cast<int>(std::clamp(v, static_cast<double>(lo), static_cast<double>(hi)));
}

double RoundTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

// Named totals in first-seen order
using NamedTotals = std::vector<std::pair<std::string, double>>;

void AddNamed(NamedTotals &totals, const std::string &name, double seconds) {
    for (auto &[existing, total] : totals) {
        if (existing == name) {
            total += seconds;
            return;
        }
    }
    totals.emplace_back(name, seconds);
}

// Largest first; ties keep first-seen order
std::vector<NamedSeconds> RankNamed(NamedTotals totals, size_t limit) {
    std::stable_sort(totals.begin(), totals.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });
    std::vector<NamedSeconds> ranked;
    for (size_t i = 0; i < totals.size() && i < limit; ++i) {
        ranked.push_back({totals[i].first, std::llround(totals[i].second)});
    }
    return ranked;
}

std::optional<std::string> TopNamed(const NamedTotals &totals) {
    std::optional<std::string> best;
    double bestValue = 0.0;
    for (const auto &[name, value] : totals) {
        if (!best || value > bestValue) {
            best = name;
            bestValue = value;
        }
    }
    return best;
}

std::optional<std::string> NonEmpty(const std::string &value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// One clipped activity inside the episode window
struct EpisodeSource {
    const ActivityInterval *interval = nullptr;
    ClippedContribution clip;
    bool suppressed = false;
    Category category = NEUTRAL;
};

struct EpisodeSpan {
    double start_ms = 0.0;
    double end_ms = 0.0;
    std::vector<EpisodeSource> sources;
};

// Behaviour event with its parsed time. Title and url come from the metadata
// and are dropped for suppressed domains.
struct TimedEvent {
    double ts_ms = 0.0;
    const BehaviorEvent *event = nullptr;
    int64_t amount = 1;
    std::optional<std::string> title;
    std::optional<std::string> url;
};

struct TimedMarker {
    double ts_ms = 0.0;
    ConsumptionMarker marker;
};

std::optional<std::string> MetadataString(const nlohmann::json &meta, const char *key) {
    if (meta.is_object() && meta.contains(key) && meta.at(key).is_string()) {
        return meta.at(key).get<std::string>();
    }
    return std::nullopt;
}

} // namespace

// ─────────────────────────────────────
ReportBuilder::ReportBuilder(IntervalStore &store, const Clock &clock, TimeBasis basis)
    : m_Store(store), m_Clock(clock), m_Basis(basis) {}

// ╭─────────────────────────────────────╮
// │              Overview               │
// ╰─────────────────────────────────────╯
AnalyticsOverview ReportBuilder::GetOverview(int days, const AnalyticsSettings &settings) {
    days = ClampDays(days);
    const double rangeEndMs = m_Clock.NowMs();
    const double rangeStartMs = rangeEndMs - days * kDayMs;
    const PrivacyFilter filter(settings.excluded_keywords);

    LoadStats stats;
    const std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesOverlapping(rangeStartMs, rangeEndMs, stats);

    AnalyticsOverview overview;
    overview.period_days = days;
    overview.skipped_intervals = stats.skipped;

    CategoryBreakdown &categories = overview.category_breakdown;
    std::map<std::string, double> domainTotals;
    std::array<double, 24> hourlyProductive{};
    std::array<double, 24> hourlyDistraction{};
    double totalActive = 0.0;
    int sessionCount = 0;

    for (const ActivityInterval &interval : intervals) {
        const std::optional<ClippedContribution> clip =
          ClipInterval(interval, rangeStartMs, rangeEndMs);
        if (!clip) {
            continue;
        }
        sessionCount++;
        totalActive += clip->active_seconds;
        categories.idle += clip->idle_seconds;

        const bool suppressed = filter.ShouldSuppress(interval.domain, interval.app_name);
        const Category category = suppressed ? NEUTRAL : interval.category.value_or(NEUTRAL);
        categories.AddActive(category, clip->active_seconds);

        if (!suppressed) {
            domainTotals[interval.Label()] += clip->active_seconds;
        }

        for (const BucketShare &share : DistributeAcrossHours(*clip)) {
            const int hour = HourOfDay(share.bucket_start_ms, m_Basis);
            if (category == PRODUCTIVE) {
                hourlyProductive[hour] += share.active_seconds;
            } else if (category == FRIVOLITY || category == DRAINING) {
                hourlyDistraction[hour] += share.active_seconds;
            }
        }
    }

    // Reading and writing count as productive time. Totals come from the day
    // rollups, the hour split from the hourly ones.
    const double todayStartMs = LocalDayStartMs(rangeEndMs, settings.day_start_hour, m_Basis);
    const std::string fromDay = DayKey(todayStartMs - (days - 1) * kDayMs, m_Basis);
    const std::string toDay = DayKey(todayStartMs, m_Basis);

    const double readingSeconds = std::max(0.0, m_Store.SumReadingDailyActive(fromDay, toDay));
    if (readingSeconds > 0.0) {
        totalActive += readingSeconds;
        categories.productive += readingSeconds;
        for (const AuxHourlyRollup &row : m_Store.FetchReadingHourly(rangeStartMs, rangeEndMs)) {
            hourlyProductive[HourOfDay(row.hour_start_ms, m_Basis)] +=
              std::max(0.0, row.active_seconds);
        }
    }

    const double writingSeconds = std::max(0.0, m_Store.SumWritingDailyActive(fromDay, toDay));
    if (writingSeconds > 0.0) {
        totalActive += writingSeconds;
        categories.productive += writingSeconds;
        for (const AuxHourlyRollup &row : m_Store.FetchWritingHourly(rangeStartMs, rangeEndMs)) {
            hourlyProductive[HourOfDay(row.hour_start_ms, m_Basis)] +=
              std::max(0.0, row.active_seconds);
        }
    }

    overview.top_engagement_domain = TopDomain(domainTotals);
    overview.peak_productive_hour = ArgmaxHour(hourlyProductive, kDefaultPeakProductiveHour);
    overview.risk_hour = ArgmaxHour(hourlyDistraction, kDefaultRiskHour);

    const double totalCategorized = categories.Active();
    overview.productivity_score =
      totalCategorized > 0.0
        ? static_cast<int>(std::lround(categories.productive / totalCategorized * 100.0))
        : 50;

    // Trend compares raw productive seconds of the older half of the rows
    // (by start time) with the newer half
    const size_t recentCount = intervals.size() / 2;
    const size_t olderCount = intervals.size() - recentCount;
    double olderProductive = 0.0;
    double recentProductive = 0.0;
    for (size_t i = 0; i < intervals.size(); ++i) {
        const ActivityInterval &interval = intervals[i];
        if (filter.ShouldSuppress(interval.domain, interval.app_name) ||
            interval.category != PRODUCTIVE) {
            continue;
        }
        if (i < olderCount) {
            olderProductive += interval.seconds_active;
        } else {
            recentProductive += interval.seconds_active;
        }
    }

    if (recentProductive > olderProductive * kFocusTrendImprovingRatio) {
        overview.focus_trend = TREND_IMPROVING;
    } else if (recentProductive < olderProductive * kFocusTrendDecliningRatio) {
        overview.focus_trend = TREND_DECLINING;
    } else {
        overview.focus_trend = TREND_STABLE;
    }

    std::vector<std::string> insights = GenerateInsights(
      categories, overview.peak_productive_hour, overview.risk_hour, overview.focus_trend);
    if (readingSeconds > 0.0) {
        insights.insert(insights.begin(),
                        "Reading contributed " + std::to_string(std::lround(readingSeconds / 60.0)) +
                          "m of productive time in this window");
    }
    if (writingSeconds > 0.0) {
        insights.insert(insights.begin(),
                        "Writing contributed " + std::to_string(std::lround(writingSeconds / 60.0)) +
                          "m of productive time in this window");
    }
    if (insights.size() > kMaxInsights) {
        insights.resize(kMaxInsights);
    }
    overview.insights = std::move(insights);

    overview.deep_work_seconds = ComputeDeepWork(rangeStartMs, rangeEndMs);
    overview.total_active_hours = std::round(totalActive / 3600.0 * 10.0) / 10.0;
    overview.total_sessions = sessionCount;
    overview.avg_session_length = sessionCount > 0 ? std::llround(totalActive / sessionCount) : 0;

    if (stats.skipped > 0) {
        spdlog::warn("GetOverview skipped {} malformed intervals", stats.skipped);
    }
    spdlog::debug("Overview for {} days: {} sessions, {:.1f}h active, score {}", days,
                  sessionCount, overview.total_active_hours, overview.productivity_score);
    return overview;
}

// ─────────────────────────────────────
std::vector<std::string> ReportBuilder::GenerateInsights(const CategoryBreakdown &categories,
                                                         int peakHour, int riskHour,
                                                         FocusTrend trend) {
    std::vector<std::string> insights;

    insights.push_back("Your peak focus hour is " + FormatHour12(peakHour) +
                       ", schedule deep work here");

    const double distraction = categories.frivolity + categories.draining;
    if (distraction > categories.productive * 0.3) {
        insights.push_back(FormatHour12(riskHour) + " is your highest risk hour for distraction");
    }

    if (trend == TREND_IMPROVING) {
        insights.push_back("Your focus has been improving, keep it up!");
    } else if (trend == TREND_DECLINING) {
        insights.push_back("Focus is trending down, consider a reset tomorrow");
    }

    const double totalActive = categories.Active();
    if (totalActive + categories.idle > 0.0) {
        const double idleRatio = categories.idle / (totalActive + categories.idle);
        if (idleRatio > 0.3) {
            insights.push_back(std::to_string(std::lround(idleRatio * 100.0)) +
                               "% idle time detected, are you stepping away often?");
        }
    }

    // No activity says nothing about discipline
    if (totalActive > 0.0) {
        const double distractionRatio = distraction / std::max(1.0, totalActive);
        if (distractionRatio > 0.25) {
            insights.push_back(std::to_string(std::lround(distractionRatio * 100.0)) +
                               "% distraction (frivolous + draining), higher than average");
        } else if (distractionRatio < 0.1) {
            insights.push_back("Only " + std::to_string(std::lround(distractionRatio * 100.0)) +
                               "% distraction, excellent discipline!");
        }
    }

    if (insights.size() > kMaxInsights) {
        insights.resize(kMaxInsights);
    }
    return insights;
}

// ╭─────────────────────────────────────╮
// │             Time of day             │
// ╰─────────────────────────────────────╯
std::vector<TimeOfDayStats> ReportBuilder::GetTimeOfDayAnalysis(int days,
                                                                const AnalyticsSettings &settings) {
    days = ClampDays(days);
    const int dayStart = settings.day_start_hour;
    const double rangeEndMs = m_Clock.NowMs();
    const double rangeStartMs = rangeEndMs - days * kDayMs;
    const PrivacyFilter filter(settings.excluded_keywords);

    std::vector<TimeOfDayStats> buckets(24);
    for (int i = 0; i < 24; ++i) {
        buckets[i].hour = UnshiftHourFromDayStart(i, dayStart);
    }
    std::array<std::map<std::string, double>, 24> domainSeconds;

    LoadStats stats;
    const std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesOverlapping(rangeStartMs, rangeEndMs, stats);

    for (const ActivityInterval &interval : intervals) {
        const std::optional<ClippedContribution> clip =
          ClipInterval(interval, rangeStartMs, rangeEndMs);
        if (!clip) {
            continue;
        }

        const bool suppressed = filter.ShouldSuppress(interval.domain, interval.app_name);
        const Category category = suppressed ? NEUTRAL : interval.category.value_or(NEUTRAL);
        const std::string label = interval.Label();

        for (const BucketShare &share : DistributeAcrossHours(*clip)) {
            const int idx = ShiftHourToDayStart(HourOfDay(share.bucket_start_ms, m_Basis), dayStart);
            TimeOfDayStats &bucket = buckets[idx];
            bucket.sample_count++;
            bucket.totals.idle += share.idle_seconds;
            bucket.totals.AddActive(category, share.active_seconds);
            if (!suppressed) {
                domainSeconds[idx][label] += share.active_seconds;
            }
        }
    }

    // Reading / writing hours are matched by their wall-clock hour
    auto foldAux = [&](const std::vector<AuxHourlyRollup> &rows) {
        for (const AuxHourlyRollup &row : rows) {
            const int idx = ShiftHourToDayStart(HourOfDay(row.hour_start_ms, m_Basis), dayStart);
            buckets[idx].totals.productive += std::max(0.0, row.active_seconds);
            buckets[idx].sample_count++;
        }
    };
    foldAux(m_Store.FetchReadingHourly(rangeStartMs, rangeEndMs));
    foldAux(m_Store.FetchWritingHourly(rangeStartMs, rangeEndMs));

    for (int i = 0; i < 24; ++i) {
        TimeOfDayStats &bucket = buckets[i];
        bucket.dominant_category = bucket.totals.Dominant();
        bucket.dominant_domain = TopDomain(domainSeconds[i]);

        const double total = bucket.totals.Total();
        bucket.avg_engagement =
          total > 0.0 ? static_cast<int>(std::lround(bucket.totals.Active() / total * 100.0)) : 0;
    }

    if (stats.skipped > 0) {
        spdlog::warn("GetTimeOfDayAnalysis skipped {} malformed intervals", stats.skipped);
    }
    return buckets;
}

// ╭─────────────────────────────────────╮
// │               Trends                │
// ╰─────────────────────────────────────╯
std::vector<TrendPoint> ReportBuilder::GetTrends(TrendGranularity granularity,
                                                 const AnalyticsSettings &settings) {
    const double now = m_Clock.NowMs();

    double unitMs = kDayMs;
    int bucketCount = 30;
    if (granularity == GRANULARITY_HOUR) {
        unitMs = kHourMs;
        bucketCount = 24;
    } else if (granularity == GRANULARITY_WEEK) {
        unitMs = kWeekMs;
        bucketCount = 12;
    }

    // Daily buckets line up with day starts; the others end at now
    const double rangeStartMs =
      granularity == GRANULARITY_DAY
        ? LocalDayStartMs(now, settings.day_start_hour, m_Basis) - (bucketCount - 1) * unitMs
        : now - bucketCount * unitMs;
    const double rangeEndMs = now;
    const PrivacyFilter filter(settings.excluded_keywords);

    std::vector<TrendPoint> buckets(bucketCount);
    for (int i = 0; i < bucketCount; ++i) {
        const double ts = rangeStartMs + i * unitMs;
        TrendPoint &point = buckets[i];
        point.timestamp = FormatIsoMs(ts);
        switch (granularity) {
        case GRANULARITY_HOUR:
            point.label = HourLabel(ts, m_Basis);
            break;
        case GRANULARITY_DAY:
            point.label = DateLabel(ts, m_Basis);
            break;
        case GRANULARITY_WEEK:
            point.label = "Week " + std::to_string(static_cast<int>(std::ceil((now - ts) / kWeekMs)));
            break;
        }
    }

    LoadStats stats;
    const std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesOverlapping(rangeStartMs, rangeEndMs, stats);

    for (const ActivityInterval &interval : intervals) {
        const std::optional<ClippedContribution> clip =
          ClipInterval(interval, rangeStartMs, rangeEndMs);
        if (!clip) {
            continue;
        }

        const bool suppressed = filter.ShouldSuppress(interval.domain, interval.app_name);
        const Category category = suppressed ? NEUTRAL : interval.category.value_or(NEUTRAL);

        for (const BucketShare &share :
             DistributeAcrossBuckets(*clip, rangeStartMs, unitMs, bucketCount)) {
            TrendPoint &point = buckets[share.index];
            switch (category) {
            case PRODUCTIVE:
                point.productive += share.active_seconds;
                break;
            case EMERGENCY:
                point.emergency += share.active_seconds;
                break;
            case FRIVOLITY:
            case DRAINING:
                point.frivolity += share.active_seconds;
                break;
            case NEUTRAL:
                point.neutral += share.active_seconds;
                break;
            }
            point.idle += share.idle_seconds;
        }
    }

    auto foldAux = [&](const std::vector<AuxHourlyRollup> &rows) {
        for (const AuxHourlyRollup &row : rows) {
            const auto idx = static_cast<long>(std::floor((row.hour_start_ms - rangeStartMs) / unitMs));
            if (idx < 0 || idx >= bucketCount) {
                continue;
            }
            buckets[idx].productive += std::max(0.0, row.active_seconds);
        }
    };
    foldAux(m_Store.FetchReadingHourly(rangeStartMs, rangeEndMs));
    foldAux(m_Store.FetchWritingHourly(rangeStartMs, rangeEndMs));

    for (const PomodoroSession &session : m_Store.FetchPomodoroSessions(rangeStartMs, rangeEndMs)) {
        const auto span = DeepWorkSpan(session, rangeStartMs, rangeEndMs);
        if (!span) {
            continue;
        }
        const int first = std::max(0, static_cast<int>(std::floor((span->first - rangeStartMs) / unitMs)));
        const int last = std::min(bucketCount - 1,
                                  static_cast<int>(std::floor((span->second - rangeStartMs) / unitMs)));
        for (int idx = first; idx <= last; ++idx) {
            const double bucketStart = rangeStartMs + idx * unitMs;
            const double overlap = OverlapMs(span->first, span->second, bucketStart, bucketStart + unitMs);
            if (overlap > 0.0) {
                buckets[idx].deep_work += std::llround(overlap / 1000.0);
            }
        }
    }

    for (TrendPoint &point : buckets) {
        const double active = point.productive + point.neutral + point.frivolity + point.emergency;
        const double total = active + point.idle;
        point.engagement = total > 0.0 ? static_cast<int>(std::lround(active / total * 100.0)) : 0;
        point.quality_score =
          active > 0.0 ? static_cast<int>(std::lround(point.productive / active * 100.0)) : 50;
    }

    if (stats.skipped > 0) {
        spdlog::warn("GetTrends skipped {} malformed intervals", stats.skipped);
    }
    spdlog::debug("Trends ({}): {} buckets from {}", GranularityName(granularity), bucketCount,
                  FormatIsoMs(rangeStartMs));
    return buckets;
}

// ╭─────────────────────────────────────╮
// │          Behaviour episodes         │
// ╰─────────────────────────────────────╯
EpisodeMap ReportBuilder::GetBehaviorEpisodes(const EpisodeQuery &query,
                                              const AnalyticsSettings &settings) {
    const double now = m_Clock.NowMs();
    const PrivacyFilter filter(settings.excluded_keywords);

    EpisodeMap map;
    map.hours = ClampRounded(query.hours, kDefaultEpisodeHours, 1, kMaxEpisodeHours);
    map.gap_minutes =
      ClampRounded(query.gap_minutes, kDefaultEpisodeGapMinutes, 1, kMaxEpisodeGapMinutes);
    map.bin_seconds = ClampRounded(query.bin_seconds, kDefaultEpisodeBinSeconds,
                                   kMinEpisodeBinSeconds, kMaxEpisodeBinSeconds);
    map.max_episodes = ClampRounded(query.max_episodes, kDefaultMaxEpisodes, 1, kMaxEpisodes);

    const std::optional<double> parsedEnd = query.end ? ParseIsoMs(*query.end) : std::nullopt;
    const std::optional<double> parsedStart =
      query.start ? ParseIsoMs(*query.start) : std::nullopt;
    const double requestedEnd = parsedEnd.value_or(now);
    const double requestedStart = parsedStart.value_or(requestedEnd - map.hours * kHourMs);
    const double rangeStartMs = std::min(requestedStart, requestedEnd);
    const double rangeEndMs = std::max(requestedStart, requestedEnd);
    const double gapMs = map.gap_minutes * 60.0 * 1000.0;
    const double binMs = map.bin_seconds * 1000.0;

    map.generated_at = FormatIsoMs(now);
    map.range_start = FormatIsoMs(rangeStartMs);
    map.range_end = FormatIsoMs(rangeEndMs);

    LoadStats stats;
    std::vector<ActivityInterval> intervals =
      m_Store.FetchActivitiesOverlapping(rangeStartMs, rangeEndMs, stats);
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const ActivityInterval &a, const ActivityInterval &b) {
                         return a.started_at_ms < b.started_at_ms;
                     });
    map.skipped_intervals = stats.skipped;

    // Raw events carry their metadata as text; keep the storage alive for the pointers
    const std::vector<BehaviorEvent> rawEvents =
      m_Store.FetchBehaviorEventsBetween(rangeStartMs, rangeEndMs);
    std::vector<TimedEvent> events;
    for (const BehaviorEvent &raw : rawEvents) {
        const std::optional<double> ts = ParseIsoMs(raw.timestamp);
        if (!ts) {
            continue;
        }
        TimedEvent event;
        event.ts_ms = *ts;
        event.event = &raw;
        event.amount = std::max<int64_t>(1, raw.value_int.value_or(1));
        if (!raw.metadata.empty() && !filter.ShouldSuppress(raw.domain, "")) {
            const nlohmann::json meta = nlohmann::json::parse(raw.metadata, nullptr, false);
            if (!meta.is_discarded()) {
                event.title = MetadataString(meta, "title");
                event.url = MetadataString(meta, "url");
            }
        }
        events.push_back(std::move(event));
    }

    std::vector<TimedMarker> markers;
    for (ConsumptionMarker &marker : m_Store.FetchConsumptionMarkers(rangeStartMs, rangeEndMs)) {
        const std::optional<double> ts = ParseIsoMs(marker.occurred_at);
        if (!ts) {
            continue;
        }
        if (filter.ShouldSuppress(marker.domain, marker.title)) {
            marker.domain.clear();
            marker.title.clear();
            marker.url.clear();
        }
        markers.push_back({*ts, std::move(marker)});
    }

    // Gap grouping
    std::vector<EpisodeSpan> spans;
    for (const ActivityInterval &interval : intervals) {
        const std::optional<ClippedContribution> clip =
          ClipInterval(interval, rangeStartMs, rangeEndMs);
        if (!clip) {
            continue;
        }

        EpisodeSource source;
        source.interval = &interval;
        source.clip = *clip;
        source.suppressed = filter.ShouldSuppress(interval.domain, interval.app_name);
        source.category =
          source.suppressed || !interval.category ? NEUTRAL : *interval.category;

        if (spans.empty() || clip->overlap_start_ms - spans.back().end_ms > gapMs) {
            spans.push_back({clip->overlap_start_ms, clip->overlap_end_ms, {}});
        } else {
            spans.back().end_ms = std::max(spans.back().end_ms, clip->overlap_end_ms);
        }
        spans.back().sources.push_back(source);
    }

    const size_t firstKept =
      spans.size() > static_cast<size_t>(map.max_episodes) ? spans.size() - map.max_episodes : 0;

    NamedTotals globalDomains;
    for (size_t s = firstKept; s < spans.size(); ++s) {
        const EpisodeSpan &span = spans[s];
        BehaviorEpisode episode;
        episode.id = "ep-" + std::to_string(std::llround(span.start_ms)) + "-" +
                     std::to_string(s - firstKept + 1);
        episode.start = FormatIsoMs(span.start_ms);
        episode.end = FormatIsoMs(span.end_ms);
        episode.duration_seconds =
          std::max<int64_t>(1, std::llround((span.end_ms - span.start_ms) / 1000.0));

        CategoryBreakdown breakdown;
        NamedTotals domainTotals;
        NamedTotals appTotals;
        double activeSeconds = 0.0;
        double idleSeconds = 0.0;
        std::optional<std::string> previousDomain;
        std::vector<std::pair<double, ContentSnapshot>> snapshots;

        for (const EpisodeSource &source : span.sources) {
            const ActivityInterval &interval = *source.interval;
            const ClippedContribution &clip = source.clip;
            activeSeconds += clip.active_seconds;
            idleSeconds += clip.idle_seconds;
            breakdown.idle += clip.idle_seconds;
            breakdown.AddActive(source.category, clip.active_seconds);

            EpisodeSlice slice;
            slice.activity_id = interval.id;
            slice.start = FormatIsoMs(clip.overlap_start_ms);
            slice.end = FormatIsoMs(clip.overlap_end_ms);
            slice.category = CategoryName(source.category);
            slice.active_seconds = clip.active_seconds;
            slice.idle_seconds = clip.idle_seconds;

            if (!source.suppressed) {
                const std::string key = !interval.domain.empty()     ? interval.domain
                                        : !interval.app_name.empty() ? interval.app_name
                                                                     : "unknown";
                AddNamed(domainTotals, key, clip.active_seconds);
                if (previousDomain && *previousDomain != key) {
                    episode.domain_switches++;
                }
                previousDomain = key;

                if (!interval.app_name.empty()) {
                    AddNamed(appTotals, interval.app_name, clip.active_seconds);
                }

                slice.app_name = NonEmpty(interval.app_name);
                slice.domain = NonEmpty(interval.domain);
                slice.url = NonEmpty(interval.url);
                slice.window_title = NonEmpty(interval.window_title);

                if (slice.url || slice.window_title) {
                    snapshots.emplace_back(clip.overlap_start_ms,
                                           ContentSnapshot{slice.start, slice.domain, slice.url,
                                                           slice.window_title, "activity",
                                                           kActivitySnapshotConfidence});
                }
            }
            episode.context_slices.push_back(std::move(slice));
        }

        std::vector<const TimedEvent *> episodeEvents;
        for (const TimedEvent &event : events) {
            if (event.ts_ms >= span.start_ms && event.ts_ms <= span.end_ms) {
                episodeEvents.push_back(&event);
                episode.event_counts.Add(event.event->event_type, event.amount);
                if (event.title || event.url) {
                    snapshots.emplace_back(
                      event.ts_ms,
                      ContentSnapshot{event.event->timestamp, NonEmpty(event.event->domain),
                                      event.url, event.title, "behavior-event",
                                      kEventSnapshotConfidence});
                }
            }
        }

        for (const TimedMarker &marker : markers) {
            if (marker.ts_ms >= span.start_ms && marker.ts_ms <= span.end_ms) {
                episode.markers.push_back(marker.marker);
            }
        }

        // Consecutive duplicates collapse into one snapshot
        std::stable_sort(snapshots.begin(), snapshots.end(),
                         [](const auto &a, const auto &b) { return a.first < b.first; });
        std::optional<std::string> lastKey;
        for (const auto &[ts, snapshot] : snapshots) {
            const std::string key = snapshot.domain.value_or("") + "|" + snapshot.url.value_or("") +
                                    "|" + snapshot.title.value_or("");
            if (lastKey && *lastKey == key) {
                continue;
            }
            lastKey = key;
            episode.content_snapshots.push_back(snapshot);
            if (episode.content_snapshots.size() >= kMaxContentSnapshots) {
                break;
            }
        }

        episode.active_seconds = std::llround(activeSeconds);
        episode.idle_seconds = std::llround(idleSeconds);
        episode.dominant_category = breakdown.Dominant();
        episode.category_breakdown.productive = std::round(breakdown.productive);
        episode.category_breakdown.neutral = std::round(breakdown.neutral);
        episode.category_breakdown.frivolity = std::round(breakdown.frivolity);
        episode.category_breakdown.draining = std::round(breakdown.draining);
        episode.category_breakdown.emergency = std::round(breakdown.emergency);
        episode.category_breakdown.idle = std::round(breakdown.idle);
        episode.top_domains = RankNamed(domainTotals, kEpisodeTopEntries);
        episode.top_apps = RankNamed(appTotals, kEpisodeTopEntries);

        // Timeline bins
        for (double binStart = span.start_ms; binStart < span.end_ms; binStart += binMs) {
            const double binEnd = std::min(span.end_ms, binStart + binMs);
            EpisodeBin bin;
            bin.start = FormatIsoMs(binStart);
            bin.end = FormatIsoMs(binEnd);
            NamedTotals binDomains;
            NamedTotals titleCounts;

            for (const EpisodeSource &source : span.sources) {
                const ClippedContribution &clip = source.clip;
                const double overlap =
                  OverlapMs(clip.overlap_start_ms, clip.overlap_end_ms, binStart, binEnd);
                if (overlap <= 0.0) {
                    continue;
                }
                const double fraction = overlap / std::max(1.0, clip.OverlapMs());
                bin.category_breakdown.idle += clip.idle_seconds * fraction;
                bin.category_breakdown.AddActive(source.category, clip.active_seconds * fraction);
                if (source.suppressed) {
                    continue;
                }
                const ActivityInterval &interval = *source.interval;
                const std::string &key =
                  !interval.domain.empty() ? interval.domain : interval.app_name;
                if (!key.empty()) {
                    AddNamed(binDomains, key, clip.active_seconds * fraction);
                }
                if (!interval.window_title.empty()) {
                    AddNamed(titleCounts, interval.window_title, 1.0);
                }
            }

            for (const TimedEvent *event : episodeEvents) {
                if (event->ts_ms < binStart || event->ts_ms >= binEnd) {
                    continue;
                }
                if (!bin.event_counts.Add(event->event->event_type, event->amount)) {
                    continue;
                }
                // Titles the page reported outweigh window titles
                if (event->title) {
                    AddNamed(titleCounts, *event->title, 2.0);
                }
            }

            bin.active_seconds = bin.category_breakdown.Active();
            bin.idle_seconds = bin.category_breakdown.idle;
            bin.top_domain = TopNamed(binDomains);
            bin.top_title = TopNamed(titleCounts);
            episode.timeline_bins.push_back(std::move(bin));
        }

        const int64_t totalActions = episode.event_counts.scroll + episode.event_counts.click +
                                     episode.event_counts.keystroke;
        const double minutes = std::max(1.0 / 60.0, episode.duration_seconds / 60.0);
        episode.rates.actions_per_minute = RoundTenth(totalActions / minutes);
        episode.rates.scrolls_per_minute = RoundTenth(episode.event_counts.scroll / minutes);
        episode.rates.clicks_per_minute = RoundTenth(episode.event_counts.click / minutes);
        episode.rates.keystrokes_per_minute = RoundTenth(episode.event_counts.keystroke / minutes);
        episode.rates.focus_events_per_minute =
          RoundTenth((episode.event_counts.focus + episode.event_counts.blur) / minutes);

        episode.has_behavior_events = !episodeEvents.empty();
        episode.has_content_titles =
          std::any_of(episode.content_snapshots.begin(), episode.content_snapshots.end(),
                      [](const ContentSnapshot &snap) { return snap.title.has_value(); });
        episode.has_consumption_markers = !episode.markers.empty();

        map.total_duration_seconds += episode.duration_seconds;
        map.total_active_seconds += episode.active_seconds;
        map.total_idle_seconds += episode.idle_seconds;
        map.total_markers += episode.markers.size();
        map.total_content_snapshots += episode.content_snapshots.size();
        for (const NamedSeconds &domain : episode.top_domains) {
            AddNamed(globalDomains, domain.name, static_cast<double>(domain.active_seconds));
        }

        map.episodes.push_back(std::move(episode));
    }
    map.top_domains = RankNamed(globalDomains, kEpisodeSummaryTopDomains);

    if (stats.skipped > 0) {
        spdlog::warn("GetBehaviorEpisodes skipped {} malformed intervals", stats.skipped);
    }
    spdlog::debug("Episodes: {} of {} kept in [{}, {}], gap {} min, bin {} s", map.episodes.size(),
                  spans.size(), map.range_start, map.range_end, map.gap_minutes, map.bin_seconds);
    return map;
}

// ╭─────────────────────────────────────╮
// │              Deep work              │
// ╰─────────────────────────────────────╯
std::optional<std::pair<double, double>>
ReportBuilder::DeepWorkSpan(const PomodoroSession &session, double rangeStartMs,
                            double rangeEndMs) const {
    const double plannedEnd =
      session.started_at_ms + std::max(0.0, session.planned_duration_sec) * 1000.0;
    const double actualEnd = session.ended_at_ms.value_or(m_Clock.NowMs());
    const double end = std::min({plannedEnd, actualEnd, rangeEndMs});
    const double start = std::max(session.started_at_ms, rangeStartMs);
    if (end <= start) {
        return std::nullopt;
    }
    return std::make_pair(start, end);
}

// ─────────────────────────────────────
int64_t ReportBuilder::ComputeDeepWork(double rangeStartMs, double rangeEndMs) {
    int64_t total = 0;
    for (const PomodoroSession &session : m_Store.FetchPomodoroSessions(rangeStartMs, rangeEndMs)) {
        const auto span = DeepWorkSpan(session, rangeStartMs, rangeEndMs);
        if (span) {
            total += std::llround((span->second - span->first) / 1000.0);
        }
    }
    return total;
}
