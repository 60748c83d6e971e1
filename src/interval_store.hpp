#pragma once

#include <sqlite3.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

// Activity row as the tracker hands it over. Timestamps may carry any offset
// ParseIsoMs accepts; they are stored in canonical UTC form.
struct ActivityRow {
    std::string started_at;
    std::optional<std::string> ended_at;
    std::string source = "app";
    std::string app_name;
    std::string domain;
    std::optional<std::string> category;
    double seconds_active = 0.0;
    double idle_seconds = 0.0;
    std::string url;
    std::string window_title;
};

class IntervalStore {
  public:
    IntervalStore(const std::string &db_path);
    ~IntervalStore();

    IntervalStore(const IntervalStore &) = delete;
    IntervalStore &operator=(const IntervalStore &) = delete;

    // Activities
    bool InsertActivity(const ActivityRow &row, std::string &error);
    std::vector<ActivityInterval> FetchActivitiesOverlapping(double rangeStartMs, double rangeEndMs,
                                                             LoadStats &stats);
    std::vector<ActivityInterval> FetchActivitiesStartedBetween(double startMs, double endMs,
                                                                LoadStats &stats);
    std::vector<ActivityInterval> FetchActivitiesForDomain(const std::string &domain,
                                                           double rangeStartMs, double rangeEndMs,
                                                           LoadStats &stats);

    // Reading / writing streams
    std::vector<AuxHourlyRollup> FetchReadingHourly(double rangeStartMs, double rangeEndMs);
    std::vector<AuxHourlyRollup> FetchWritingHourly(double rangeStartMs, double rangeEndMs);
    double SumReadingDailyActive(const std::string &fromDay, const std::string &toDay);
    double SumWritingDailyActive(const std::string &fromDay, const std::string &toDay);
    bool AccumulateReadingProgress(const std::string &day, const std::string &hourStart,
                                   const std::string &updatedAt,
                                   const ReadingProgressDelta &delta, std::string &error);
    bool AccumulateWritingProgress(const std::string &day, const std::string &hourStart,
                                   const std::string &updatedAt,
                                   const WritingProgressDelta &delta, std::string &error);

    // Focus sessions
    bool InsertPomodoroSession(const std::string &startedAt,
                               const std::optional<std::string> &endedAt,
                               double plannedDurationSec, std::string &error);
    std::vector<PomodoroSession> FetchPomodoroSessions(double rangeStartMs, double rangeEndMs);

    // Behavior events
    bool InsertBehaviorEvents(const std::vector<BehaviorEvent> &events, std::string &error);
    std::vector<BehaviorEvent> FetchBehaviorEvents(const std::string &domain, double sinceMs,
                                                   double untilMs);
    std::vector<BehaviorEvent> FetchBehaviorEventsBetween(double sinceMs, double untilMs);

    // Consumption log (written by the paywall / library side)
    bool InsertConsumptionMarker(const ConsumptionMarker &marker, std::string &error);
    std::vector<ConsumptionMarker> FetchConsumptionMarkers(double rangeStartMs,
                                                           double rangeEndMs);

    // Activity rollups
    bool UpsertActivityRollups(const std::vector<ActivityRollup> &rollups, std::string &error);
    std::vector<ActivityRollup> ListActivityRollupsSince(const std::string &deviceId,
                                                         const std::string &updatedAfter);
    // deviceId empty means every device
    std::vector<ActivityRollup> ListActivityRollupsFrom(const std::string &deviceId,
                                                        const std::string &hourStartFrom);

    // Behavioral patterns
    bool ReplacePatterns(const std::vector<BehavioralPattern> &patterns, std::string &error);
    std::vector<BehavioralPattern> FetchTopPatterns(int limit);
    std::optional<std::string> LatestPatternComputedAt();

    // Key/value settings
    std::optional<std::string> GetSetting(const std::string &key);
    bool SetSetting(const std::string &key, const std::string &value, std::string &error);

  private:
    void Init();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);
    bool Exec(const std::string &sql, std::string &error);

    bool BeginTransaction(std::string &error);
    bool CommitTransaction(std::string &error);
    void RollbackTransaction();

    std::vector<ActivityInterval> CollectActivities(sqlite3_stmt *stmt, LoadStats &stats);
    std::vector<BehaviorEvent> CollectBehaviorEvents(sqlite3_stmt *stmt);
    std::vector<AuxHourlyRollup> FetchAuxHourly(const char *table, double rangeStartMs,
                                                double rangeEndMs);
    double SumAuxDailyActive(const char *table, const std::string &fromDay,
                             const std::string &toDay);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;

    sqlite3_stmt *m_InsertActivityStmt = nullptr;
    sqlite3_stmt *m_InsertBehaviorEventStmt = nullptr;
    sqlite3_stmt *m_UpsertRollupStmt = nullptr;
    sqlite3_stmt *m_InsertPatternStmt = nullptr;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
