#include <gtest/gtest.h>

#include <algorithm>

#include "report_builder.hpp"
#include "rollups.hpp"
#include "test_support.hpp"

class ReportBuilderTest : public StoreTest {
  protected:
    ManualClock m_Clock{Ms("2026-10-20T00:00:00Z")};
    AnalyticsSettings m_Settings;

    ReportBuilder Builder() {
        return ReportBuilder(Store(), m_Clock, BASIS_UTC);
    }
};

// ╭─────────────────────────────────────╮
// │               Trends                │
// ╰─────────────────────────────────────╯
TEST_F(ReportBuilderTest, HourlyTrendPutsIntervalInItsHour) {
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", std::nullopt, "docs.example", "productive",
                        2700.0));

    const auto trend = Builder().GetTrends(GRANULARITY_HOUR, m_Settings);
    ASSERT_EQ(trend.size(), 24u);
    for (size_t i = 0; i < trend.size(); ++i) {
        if (i == 9) {
            EXPECT_DOUBLE_EQ(trend[i].productive, 2700.0);
        } else {
            EXPECT_DOUBLE_EQ(trend[i].productive, 0.0) << "bucket " << i;
        }
    }
    EXPECT_EQ(trend[9].label, "09:00");
    EXPECT_EQ(trend[9].timestamp, "2026-10-19T09:00:00.000Z");
    EXPECT_EQ(trend[9].quality_score, 100);
    EXPECT_EQ(trend[9].engagement, 100);
    EXPECT_EQ(trend[0].quality_score, 50);
    EXPECT_EQ(trend[0].engagement, 0);
}

TEST_F(ReportBuilderTest, HourlyTrendReadsOffsetTimestamps) {
    m_Clock.Set(Ms("2026-10-19T10:00:00Z"));
    Insert(MakeActivity("2026-10-19T11:00:00+02:00", "2026-10-19T11:45:00+02:00", "docs.example",
                        "productive", 2700.0));

    const auto trend = Builder().GetTrends(GRANULARITY_HOUR, m_Settings);
    double productive = 0.0;
    for (const TrendPoint &point : trend) {
        productive += point.productive;
    }
    EXPECT_DOUBLE_EQ(productive, 2700.0);
    EXPECT_DOUBLE_EQ(trend.back().productive, 2700.0);
}

TEST_F(ReportBuilderTest, TrendFoldsDrainingIntoFrivolity) {
    Insert(MakeActivity("2026-10-19T10:00:00.000Z", "2026-10-19T10:10:00.000Z", "a.example",
                        "draining", 600.0));
    Insert(MakeActivity("2026-10-19T10:10:00.000Z", "2026-10-19T10:20:00.000Z", "b.example",
                        "frivolity", 600.0));
    Insert(MakeActivity("2026-10-19T10:20:00.000Z", "2026-10-19T10:30:00.000Z", "c.example",
                        "productive", 600.0, 600.0));

    const auto trend = Builder().GetTrends(GRANULARITY_HOUR, m_Settings);
    EXPECT_DOUBLE_EQ(trend[10].frivolity, 1200.0);
    EXPECT_DOUBLE_EQ(trend[10].productive, 600.0);
    EXPECT_DOUBLE_EQ(trend[10].idle, 600.0);
    EXPECT_EQ(trend[10].quality_score, 33);
    EXPECT_EQ(trend[10].engagement, 75);
}

TEST_F(ReportBuilderTest, DailyTrendAlignsToDayStart) {
    m_Settings.day_start_hour = 4;
    m_Clock.Set(Ms("2026-10-19T12:00:00Z"));
    Insert(MakeActivity("2026-10-19T02:00:00.000Z", "2026-10-19T03:00:00.000Z", "late.example",
                        "productive", 3600.0));

    const auto trend = Builder().GetTrends(GRANULARITY_DAY, m_Settings);
    ASSERT_EQ(trend.size(), 30u);
    EXPECT_EQ(trend.back().timestamp, "2026-10-19T04:00:00.000Z");
    EXPECT_EQ(trend.back().label, "Oct 19");
    // 02:00 still belongs to the day that started on the 18th
    EXPECT_DOUBLE_EQ(trend[28].productive, 3600.0);
    EXPECT_DOUBLE_EQ(trend.back().productive, 0.0);
}

TEST_F(ReportBuilderTest, WeeklyTrendLabelsCountBack) {
    const auto trend = Builder().GetTrends(GRANULARITY_WEEK, m_Settings);
    ASSERT_EQ(trend.size(), 12u);
    EXPECT_EQ(trend.front().label, "Week 12");
    EXPECT_EQ(trend.back().label, "Week 1");
}

TEST_F(ReportBuilderTest, TrendOverlaysDeepWork) {
    std::string error;
    ASSERT_TRUE(Store().InsertPomodoroSession("2026-10-19T09:30:00.000Z",
                                              std::string("2026-10-19T10:30:00.000Z"), 3600.0,
                                              error))
      << error;

    const auto trend = Builder().GetTrends(GRANULARITY_HOUR, m_Settings);
    EXPECT_EQ(trend[9].deep_work, 1800);
    EXPECT_EQ(trend[10].deep_work, 1800);
    EXPECT_EQ(trend[11].deep_work, 0);
}

// ╭─────────────────────────────────────╮
// │             Time of day             │
// ╰─────────────────────────────────────╯
TEST_F(ReportBuilderTest, MidnightSpanSplitsAcrossShiftedBuckets) {
    m_Settings.day_start_hour = 4;
    m_Clock.Set(Ms("2026-10-20T04:00:00Z"));
    Insert(MakeActivity("2026-10-19T23:30:00.000Z", "2026-10-20T00:30:00.000Z", "video.example",
                        "frivolity", 3600.0));

    const auto stats = Builder().GetTimeOfDayAnalysis(1, m_Settings);
    ASSERT_EQ(stats.size(), 24u);
    EXPECT_EQ(stats[19].hour, 23);
    EXPECT_EQ(stats[20].hour, 0);
    EXPECT_DOUBLE_EQ(stats[19].totals.frivolity, 1800.0);
    EXPECT_DOUBLE_EQ(stats[20].totals.frivolity, 1800.0);
    EXPECT_EQ(stats[19].dominant_category, "frivolity");
    EXPECT_EQ(stats[19].dominant_domain, "video.example");
    EXPECT_EQ(stats[19].sample_count, 1);

    double elsewhere = 0.0;
    for (size_t i = 0; i < stats.size(); ++i) {
        if (i != 19 && i != 20) {
            elsewhere += stats[i].totals.Total();
        }
    }
    EXPECT_DOUBLE_EQ(elsewhere, 0.0);
    EXPECT_EQ(stats[0].hour, 4);
    EXPECT_EQ(stats[0].dominant_category, "idle");
    EXPECT_FALSE(stats[0].dominant_domain.has_value());
}

TEST_F(ReportBuilderTest, TimeOfDayHidesSuppressedDomains) {
    m_Settings.excluded_keywords = {"bank"};
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T09:40:00.000Z", "mybank.example",
                        "productive", 2400.0));
    Insert(MakeActivity("2026-10-19T09:40:00.000Z", "2026-10-19T09:50:00.000Z", "docs.example",
                        "productive", 600.0));

    const auto stats = Builder().GetTimeOfDayAnalysis(7, m_Settings);
    const TimeOfDayStats &nine = stats[ShiftHourToDayStart(9, m_Settings.day_start_hour)];
    EXPECT_EQ(nine.hour, 9);
    EXPECT_DOUBLE_EQ(nine.totals.neutral, 2400.0);
    EXPECT_DOUBLE_EQ(nine.totals.productive, 600.0);
    EXPECT_EQ(nine.dominant_category, "neutral");
    EXPECT_EQ(nine.dominant_domain, "docs.example");
}

// ╭─────────────────────────────────────╮
// │              Overview               │
// ╰─────────────────────────────────────╯
TEST_F(ReportBuilderTest, EmptyOverviewUsesSafeDefaults) {
    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_EQ(overview.period_days, 7);
    EXPECT_EQ(overview.productivity_score, 50);
    EXPECT_EQ(overview.peak_productive_hour, 9);
    EXPECT_EQ(overview.risk_hour, 15);
    EXPECT_EQ(overview.focus_trend, TREND_STABLE);
    EXPECT_EQ(overview.total_sessions, 0);
    EXPECT_EQ(overview.avg_session_length, 0);
    EXPECT_FALSE(overview.top_engagement_domain.has_value());
    ASSERT_FALSE(overview.insights.empty());
    EXPECT_EQ(overview.insights[0], "Your peak focus hour is 9AM, schedule deep work here");
    for (const std::string &line : overview.insights) {
        EXPECT_EQ(line.find("discipline"), std::string::npos);
    }
}

TEST_F(ReportBuilderTest, OverviewSuppressesExcludedKeywords) {
    m_Settings.excluded_keywords = {"bank"};
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T10:00:00.000Z", "mybank.example",
                        "productive", 3600.0));
    Insert(MakeActivity("2026-10-19T10:00:00.000Z", "2026-10-19T10:30:00.000Z", "docs.example",
                        "productive", 1800.0));
    Insert(MakeActivity("2026-10-19T14:00:00.000Z", "2026-10-19T14:10:00.000Z", "video.example",
                        "frivolity", 600.0));

    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_DOUBLE_EQ(overview.category_breakdown.productive, 1800.0);
    EXPECT_DOUBLE_EQ(overview.category_breakdown.neutral, 3600.0);
    EXPECT_DOUBLE_EQ(overview.category_breakdown.frivolity, 600.0);
    EXPECT_EQ(overview.top_engagement_domain, "docs.example");
    EXPECT_EQ(overview.productivity_score, 30);
    EXPECT_EQ(overview.peak_productive_hour, 10);
    EXPECT_EQ(overview.risk_hour, 14);
    EXPECT_EQ(overview.total_sessions, 3);
    EXPECT_EQ(overview.avg_session_length, 2000);
    EXPECT_DOUBLE_EQ(overview.total_active_hours, 1.7);
}

TEST_F(ReportBuilderTest, OverviewCountsSkippedRows) {
    InsertRaw("2026-10-19T09:00:00 later", std::nullopt, "bad.example", 60.0);
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T09:10:00.000Z", "ok.example",
                        "productive", 600.0));

    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_EQ(overview.skipped_intervals, 1u);
    EXPECT_EQ(overview.total_sessions, 1);
    EXPECT_EQ(overview.productivity_score, 100);
}

TEST_F(ReportBuilderTest, HourTiesGoToTheEarliestHour) {
    Insert(MakeActivity("2026-10-19T15:00:00.000Z", "2026-10-19T15:10:00.000Z", "b.example",
                        "productive", 600.0));
    Insert(MakeActivity("2026-10-19T11:00:00.000Z", "2026-10-19T11:10:00.000Z", "c.example",
                        "productive", 600.0));
    Insert(MakeActivity("2026-10-19T13:00:00.000Z", "2026-10-19T13:10:00.000Z", "a.example",
                        "productive", 600.0));

    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_EQ(overview.peak_productive_hour, 11);
    EXPECT_EQ(overview.top_engagement_domain, "a.example");
}

TEST_F(ReportBuilderTest, FocusTrendComparesOlderAndNewerHalves) {
    Insert(MakeActivity("2026-10-15T09:00:00.000Z", "2026-10-15T09:10:00.000Z", "a.example",
                        "productive", 600.0));
    Insert(MakeActivity("2026-10-16T09:00:00.000Z", "2026-10-16T09:10:00.000Z", "a.example",
                        "productive", 600.0));
    Insert(MakeActivity("2026-10-18T09:00:00.000Z", "2026-10-18T10:00:00.000Z", "a.example",
                        "productive", 3600.0));
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T10:00:00.000Z", "a.example",
                        "productive", 3600.0));

    EXPECT_EQ(Builder().GetOverview(7, m_Settings).focus_trend, TREND_IMPROVING);
}

TEST_F(ReportBuilderTest, FocusTrendDeclines) {
    Insert(MakeActivity("2026-10-15T09:00:00.000Z", "2026-10-15T10:00:00.000Z", "a.example",
                        "productive", 3600.0));
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T09:10:00.000Z", "a.example",
                        "productive", 600.0));

    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_EQ(overview.focus_trend, TREND_DECLINING);
    EXPECT_NE(std::find(overview.insights.begin(), overview.insights.end(),
                        "Focus is trending down, consider a reset tomorrow"),
              overview.insights.end());
}

TEST_F(ReportBuilderTest, ReadingCountsAsProductive) {
    RollupAccumulator rollups(Store(), m_Clock, BASIS_UTC);
    std::string error;
    ReadingProgressDelta delta;
    delta.active_seconds = 1200;
    ASSERT_TRUE(rollups.RecordReadingProgress(Ms("2026-10-19T10:20:00Z"),
                                              m_Settings.day_start_hour, delta, error))
      << error;

    const AnalyticsOverview overview = Builder().GetOverview(7, m_Settings);
    EXPECT_DOUBLE_EQ(overview.category_breakdown.productive, 1200.0);
    EXPECT_EQ(overview.productivity_score, 100);
    EXPECT_EQ(overview.peak_productive_hour, 10);
    ASSERT_FALSE(overview.insights.empty());
    EXPECT_EQ(overview.insights[0], "Reading contributed 20m of productive time in this window");
    EXPECT_LE(overview.insights.size(), kMaxInsights);
}

TEST_F(ReportBuilderTest, DeepWorkStopsAtPlannedEnd) {
    std::string error;
    // Ran past its plan: only the planned 25 minutes count
    ASSERT_TRUE(Store().InsertPomodoroSession("2026-10-19T10:00:00.000Z",
                                              std::string("2026-10-19T10:40:00.000Z"), 1500.0,
                                              error));
    // Still running: counts up to now
    ASSERT_TRUE(Store().InsertPomodoroSession("2026-10-19T23:50:00.000Z", std::nullopt, 1500.0,
                                              error));

    EXPECT_EQ(Builder().ComputeDeepWork(Ms("2026-10-19T00:00:00Z"), m_Clock.NowMs()), 1500 + 600);
    EXPECT_EQ(Builder().ComputeDeepWork(Ms("2026-10-19T10:10:00Z"), Ms("2026-10-19T12:00:00Z")),
              900);
    EXPECT_EQ(Builder().GetOverview(7, m_Settings).deep_work_seconds, 2100);
}

TEST(InsightsTest, EmitsEveryApplicableLine) {
    CategoryBreakdown categories;
    categories.productive = 100.0;
    categories.frivolity = 900.0;
    categories.idle = 2000.0;

    const auto insights = ReportBuilder::GenerateInsights(categories, 13, 21, TREND_DECLINING);
    ASSERT_EQ(insights.size(), kMaxInsights);
    EXPECT_EQ(insights[0], "Your peak focus hour is 1PM, schedule deep work here");
    EXPECT_EQ(insights[1], "9PM is your highest risk hour for distraction");
    EXPECT_EQ(insights[2], "Focus is trending down, consider a reset tomorrow");
    EXPECT_EQ(insights[3], "67% idle time detected, are you stepping away often?");
    EXPECT_EQ(insights[4], "90% distraction (frivolous + draining), higher than average");
}

TEST(InsightsTest, PraisesLowDistraction) {
    CategoryBreakdown categories;
    categories.productive = 1000.0;
    categories.frivolity = 50.0;

    const auto insights = ReportBuilder::GenerateInsights(categories, 0, 15, TREND_STABLE);
    ASSERT_EQ(insights.size(), 2u);
    EXPECT_EQ(insights[0], "Your peak focus hour is 12AM, schedule deep work here");
    EXPECT_EQ(insights[1], "Only 5% distraction, excellent discipline!");
}
