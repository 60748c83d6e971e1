#include <gtest/gtest.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "json.hpp"
#include "reports.hpp"

using nlohmann::json;

TEST(JsonFieldTest, LenientReaders) {
    const json j = json::parse(R"({"n": 5, "d": 2.7, "s": "x", "bad": "five", "nil": null})");
    EXPECT_EQ(GetInt(j, "n", 0), 5);
    EXPECT_EQ(GetInt(j, "d", 0), 2);
    EXPECT_EQ(GetInt(j, "bad", 9), 9);
    EXPECT_EQ(GetInt(j, "missing", 9), 9);
    EXPECT_EQ(GetOptionalDouble(j, "d"), 2.7);
    EXPECT_EQ(GetString(j, "s", ""), "x");
    EXPECT_EQ(GetString(j, "n", "fallback"), "fallback");
    EXPECT_FALSE(GetOptionalInt64(j, "nil"));
    EXPECT_EQ(GetOptionalInt64(j, "d"), 3);
    EXPECT_FALSE(GetOptionalDouble(j, "s"));

    const auto strings = JsonArray2String(json::parse(R"(["a", 1, "b"])"));
    EXPECT_EQ(strings, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(JsonArray2String(json::object()).empty());
}

TEST(BehaviorEventBodyTest, ParsesEvents) {
    const auto events = ParseBehaviorEvents(json::parse(R"({
        "events": [
            {"timestamp": "2026-10-19T09:00:00Z", "domain": "news.example",
             "eventType": "scroll", "valueInt": 40, "valueFloat": 120.5,
             "sessionId": 12, "metadata": {"tab": 3}},
            {"timestamp": "2026-10-19T09:01:00Z", "domain": "news.example",
             "eventType": "click", "metadata": "ignored"}
        ]
    })"));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_type, "scroll");
    EXPECT_EQ(events[0].value_int, 40);
    EXPECT_EQ(events[0].value_float, 120.5);
    EXPECT_EQ(events[0].session_id, 12);
    EXPECT_EQ(json::parse(events[0].metadata), json({{"tab", 3}}));

    EXPECT_FALSE(events[1].value_int);
    EXPECT_FALSE(events[1].value_float);
    EXPECT_FALSE(events[1].session_id);
    EXPECT_TRUE(events[1].metadata.empty());
}

TEST(BehaviorEventBodyTest, RejectsMalformedBodies) {
    EXPECT_THROW(ParseBehaviorEvents(json::parse(R"({"items": []})")), std::invalid_argument);
    EXPECT_THROW(ParseBehaviorEvents(json::parse(R"([])")), std::invalid_argument);
    EXPECT_THROW(ParseBehaviorEvents(json::parse(R"({"events": [7]})")), std::invalid_argument);

    try {
        ParseBehaviorEvents(json::parse(R"({"events": [
            {"timestamp": "2026-10-19T09:00:00Z", "domain": "a", "eventType": "click"},
            {"timestamp": "2026-10-19T09:00:00Z", "eventType": "click"}
        ]})"));
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument &e) {
        EXPECT_STREQ(e.what(), "item 1: missing string 'domain'");
    }
}

TEST(RollupBodyTest, ParsesAndSanitisesSeconds) {
    const auto rollups = ParseActivityRollups(json::parse(R"({
        "rollups": [
            {"deviceId": "phone", "hourStart": "2026-10-19T09:00:00Z",
             "productive": 120.6, "neutral": -5, "frivolity": "lots", "idle": 30,
             "updatedAt": "2026-10-19T10:00:00Z"},
            {"deviceId": "phone", "hourStart": "2026-10-19T10:00:00Z"}
        ]
    })"));

    ASSERT_EQ(rollups.size(), 2u);
    EXPECT_EQ(rollups[0].productive, 121);
    EXPECT_EQ(rollups[0].neutral, 0);
    EXPECT_EQ(rollups[0].frivolity, 0);
    EXPECT_EQ(rollups[0].idle, 30);
    EXPECT_EQ(rollups[0].updated_at, "2026-10-19T10:00:00Z");
    EXPECT_EQ(rollups[1].productive, 0);
    EXPECT_TRUE(rollups[1].updated_at.empty());

    EXPECT_THROW(ParseActivityRollups(json::parse(R"({"rollups": [{"deviceId": "phone"}]})")),
                 std::invalid_argument);
    EXPECT_THROW(ParseActivityRollups(json::parse(R"({"rollups": {}})")), std::invalid_argument);
}

TEST(ReportJsonTest, OverviewUsesCamelCaseAndNulls) {
    AnalyticsOverview overview;
    overview.focus_trend = TREND_IMPROVING;
    overview.insights = {"one"};

    const json j = overview;
    EXPECT_EQ(j.at("periodDays"), 7);
    EXPECT_EQ(j.at("focusTrend"), "improving");
    EXPECT_TRUE(j.at("topEngagementDomain").is_null());
    EXPECT_EQ(j.at("categoryBreakdown").at("productive"), 0.0);
    EXPECT_EQ(j.at("insights").size(), 1u);
}

TEST(ReportJsonTest, PatternAndSummaryKeys) {
    BehavioralPattern pattern;
    pattern.from.category = "productive";
    pattern.to.domain = "video.example";
    pattern.frequency = 3;
    pattern.avg_duration_before_seconds = 420.0;
    pattern.dominant_hour_of_day = 14;

    const json p = pattern;
    EXPECT_EQ(p.at("fromContext").at("category"), "productive");
    EXPECT_TRUE(p.at("fromContext").at("domain").is_null());
    EXPECT_EQ(p.at("toContext").at("domain"), "video.example");
    EXPECT_EQ(p.at("avgTimeBefore"), 420.0);
    EXPECT_EQ(p.at("timeOfDayBucket"), 14);

    RollupSummary summary;
    summary.timeline.push_back(RollupTimelineSlot{"2026-10-19T09:00:00.000Z", {}, "idle"});
    const json s = summary;
    EXPECT_EQ(s.at("deviceId"), "all");
    EXPECT_EQ(s.at("timeline").size(), 1u);
    EXPECT_EQ(s.at("timeline")[0].at("dominant"), "idle");

    summary.device_id = "laptop";
    EXPECT_EQ(json(summary).at("deviceId"), "laptop");
}

TEST(ReportJsonTest, TrendAndEngagementNames) {
    TrendPoint point;
    point.label = "09:00";
    point.deep_work = 600;
    const json t = point;
    EXPECT_EQ(t.at("deepWork"), 600);
    EXPECT_EQ(t.at("qualityScore"), 50);

    EngagementMetrics metrics;
    metrics.engagement_level = ENGAGEMENT_INTENSE;
    EXPECT_EQ(json(metrics).at("engagementLevel"), "intense");

    EXPECT_EQ(ParseGranularity("week"), GRANULARITY_WEEK);
    EXPECT_FALSE(ParseGranularity("month"));
    EXPECT_STREQ(GranularityName(GRANULARITY_HOUR), "hour");
}
