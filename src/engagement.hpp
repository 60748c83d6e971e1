#pragma once

#include <string>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "interval_store.hpp"
#include "reports.hpp"

constexpr double kFixationClickWeight = 5.0;
constexpr double kFixationKeystrokeWeight = 2.0;
constexpr double kFixationVelocityScale = 1000.0;

constexpr int kIntenseThreshold = 80;
constexpr int kHighThreshold = 60;
constexpr int kModerateThreshold = 40;
constexpr int kPassiveThreshold = 20;

// min(100, round((cpm * 5 + kpm * 2) * (1 - velocity / 1000))), never below 0
int ComputeFixationScore(double clicksPerMinute, double keystrokesPerMinute,
                         double scrollVelocity);
EngagementLevel ClassifyEngagement(int fixationScore);

class EngagementScorer {
  public:
    EngagementScorer(IntervalStore &store, const Clock &clock);

    EngagementMetrics GetEngagementMetrics(const std::string &domain, int days);
    bool IngestBehaviorEvents(const std::vector<BehaviorEvent> &events, std::string &error);

  private:
    IntervalStore &m_Store;
    const Clock &m_Clock;
};
