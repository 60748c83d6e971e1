#include <gtest/gtest.h>

#include "engagement.hpp"
#include "test_support.hpp"

namespace {

BehaviorEvent Event(const std::string &timestamp, const std::string &domain,
                    const std::string &type, std::optional<int64_t> valueInt = std::nullopt,
                    std::optional<double> valueFloat = std::nullopt) {
    BehaviorEvent event;
    event.timestamp = timestamp;
    event.domain = domain;
    event.event_type = type;
    event.value_int = valueInt;
    event.value_float = valueFloat;
    return event;
}

} // namespace

TEST(FixationScoreTest, WeightsClicksAndKeystrokes) {
    EXPECT_EQ(ComputeFixationScore(10.0, 0.0, 0.0), 50);
    EXPECT_EQ(ComputeFixationScore(0.0, 10.0, 0.0), 20);
    EXPECT_EQ(ComputeFixationScore(2.0, 5.0, 200.0), 16);
    EXPECT_EQ(ClassifyEngagement(ComputeFixationScore(10.0, 0.0, 0.0)), ENGAGEMENT_MODERATE);
}

TEST(FixationScoreTest, ClampsToValidRange) {
    EXPECT_EQ(ComputeFixationScore(10.0, 50.0, 0.0), 100);
    EXPECT_EQ(ComputeFixationScore(10.0, 0.0, 2000.0), 0);
    EXPECT_EQ(ComputeFixationScore(0.0, 0.0, 0.0), 0);
}

TEST(FixationScoreTest, LevelThresholds) {
    EXPECT_EQ(ClassifyEngagement(100), ENGAGEMENT_INTENSE);
    EXPECT_EQ(ClassifyEngagement(80), ENGAGEMENT_INTENSE);
    EXPECT_EQ(ClassifyEngagement(79), ENGAGEMENT_HIGH);
    EXPECT_EQ(ClassifyEngagement(60), ENGAGEMENT_HIGH);
    EXPECT_EQ(ClassifyEngagement(59), ENGAGEMENT_MODERATE);
    EXPECT_EQ(ClassifyEngagement(40), ENGAGEMENT_MODERATE);
    EXPECT_EQ(ClassifyEngagement(39), ENGAGEMENT_PASSIVE);
    EXPECT_EQ(ClassifyEngagement(20), ENGAGEMENT_PASSIVE);
    EXPECT_EQ(ClassifyEngagement(19), ENGAGEMENT_LOW);
    EXPECT_EQ(ClassifyEngagement(0), ENGAGEMENT_LOW);
    EXPECT_STREQ(EngagementLevelName(ENGAGEMENT_PASSIVE), "passive");
}

class EngagementTest : public StoreTest {
  protected:
    ManualClock m_Clock{Ms("2026-10-19T12:00:00Z")};

    EngagementScorer Scorer() {
        return EngagementScorer(Store(), m_Clock);
    }
};

TEST_F(EngagementTest, AveragesEventsOverActiveMinutes) {
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T09:10:00.000Z", "news.example",
                        "frivolity", 600.0));
    Insert(MakeActivity("2026-10-19T09:10:00.000Z", "2026-10-19T09:20:00.000Z", "other.example",
                        "frivolity", 600.0));

    std::string error;
    ASSERT_TRUE(Scorer().IngestBehaviorEvents(
      {
        Event("2026-10-19T09:01:00Z", "news.example", "click", 10),
        Event("2026-10-19T09:02:00Z", "news.example", "click", 10),
        Event("2026-10-19T09:03:00Z", "news.example", "keystroke", 50),
        Event("2026-10-19T09:04:00Z", "news.example", "scroll", 40, 100.0),
        Event("2026-10-19T09:05:00Z", "news.example", "scroll", 60, 300.0),
        Event("2026-10-19T09:06:00Z", "other.example", "click", 500),
      },
      error))
      << error;

    const EngagementMetrics metrics = Scorer().GetEngagementMetrics("news.example", 7);
    EXPECT_EQ(metrics.domain, "news.example");
    EXPECT_DOUBLE_EQ(metrics.total_seconds, 600.0);
    EXPECT_EQ(metrics.session_count, 1);
    EXPECT_DOUBLE_EQ(metrics.avg_scroll_depth, 50.0);
    EXPECT_DOUBLE_EQ(metrics.avg_scroll_velocity, 200.0);
    EXPECT_DOUBLE_EQ(metrics.avg_clicks_per_minute, 2.0);
    EXPECT_DOUBLE_EQ(metrics.avg_keystrokes_per_minute, 5.0);
    EXPECT_EQ(metrics.fixation_score, 16);
    EXPECT_EQ(metrics.engagement_level, ENGAGEMENT_LOW);
}

TEST_F(EngagementTest, VelocityAveragesOnlyEventsThatCarryIt) {
    Insert(MakeActivity("2026-10-19T09:00:00.000Z", "2026-10-19T09:01:00.000Z", "feed.example",
                        "frivolity", 60.0));

    std::string error;
    ASSERT_TRUE(Scorer().IngestBehaviorEvents(
      {
        Event("2026-10-19T09:00:10Z", "feed.example", "scroll", 20, 500.0),
        Event("2026-10-19T09:00:20Z", "feed.example", "scroll", 80),
        Event("2026-10-19T09:00:30Z", "feed.example", "click"),
      },
      error))
      << error;

    const EngagementMetrics metrics = Scorer().GetEngagementMetrics("feed.example", 1);
    EXPECT_DOUBLE_EQ(metrics.avg_scroll_depth, 50.0);
    EXPECT_DOUBLE_EQ(metrics.avg_scroll_velocity, 500.0);
    // A click without a value counts once
    EXPECT_DOUBLE_EQ(metrics.avg_clicks_per_minute, 1.0);
    EXPECT_EQ(metrics.fixation_score, 3);
}

TEST_F(EngagementTest, UnknownDomainIsAllZeros) {
    const EngagementMetrics metrics = Scorer().GetEngagementMetrics("nowhere.example", 7);
    EXPECT_EQ(metrics.domain, "nowhere.example");
    EXPECT_DOUBLE_EQ(metrics.total_seconds, 0.0);
    EXPECT_EQ(metrics.session_count, 0);
    EXPECT_DOUBLE_EQ(metrics.avg_scroll_depth, 0.0);
    EXPECT_DOUBLE_EQ(metrics.avg_clicks_per_minute, 0.0);
    EXPECT_EQ(metrics.fixation_score, 0);
    EXPECT_EQ(metrics.engagement_level, ENGAGEMENT_LOW);
}

TEST_F(EngagementTest, IngestCanonicalisesTimestamps) {
    std::string error;
    ASSERT_TRUE(Scorer().IngestBehaviorEvents(
      {Event("2026-10-19T11:00:00+02:00", "news.example", "click", 3)}, error))
      << error;

    const auto events = Store().FetchBehaviorEvents("news.example", Ms("2026-10-19T00:00:00Z"),
                                                    Ms("2026-10-20T00:00:00Z"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].timestamp, "2026-10-19T09:00:00.000Z");
    EXPECT_EQ(events[0].value_int, 3);
}

TEST_F(EngagementTest, IngestRejectsTheWholeBatch) {
    std::string error;
    EXPECT_FALSE(Scorer().IngestBehaviorEvents(
      {Event("2026-10-19T09:00:00Z", "news.example", "click"),
       Event("yesterday", "news.example", "click")},
      error));
    EXPECT_NE(error.find("yesterday"), std::string::npos);

    EXPECT_FALSE(Scorer().IngestBehaviorEvents({Event("2026-10-19T09:00:00Z", "", "click")},
                                               error));

    EXPECT_TRUE(Store()
                  .FetchBehaviorEvents("news.example", Ms("2026-10-19T00:00:00Z"),
                                       Ms("2026-10-20T00:00:00Z"))
                  .empty());
}
