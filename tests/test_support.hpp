#pragma once

#include <gtest/gtest.h>

#include <sqlite3.h>
#include <unistd.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "clock.hpp"
#include "common.hpp"
#include "interval_store.hpp"
#include "time_utils.hpp"

// Fixed "now" that tests move by hand
class ManualClock : public Clock {
  public:
    explicit ManualClock(double nowMs) : m_NowMs(nowMs) {}

    double NowMs() const override {
        return m_NowMs;
    }
    void Set(double nowMs) {
        m_NowMs = nowMs;
    }
    void AdvanceMs(double deltaMs) {
        m_NowMs += deltaMs;
    }

  private:
    double m_NowMs;
};

inline double Ms(const std::string &iso) {
    const std::optional<double> ms = ParseIsoMs(iso);
    EXPECT_TRUE(ms.has_value()) << "bad fixture timestamp " << iso;
    return ms.value_or(0.0);
}

inline ActivityRow MakeActivity(const std::string &startedAt,
                                const std::optional<std::string> &endedAt,
                                const std::string &domain,
                                const std::optional<std::string> &category, double active,
                                double idle = 0.0) {
    ActivityRow row;
    row.started_at = startedAt;
    row.ended_at = endedAt;
    row.domain = domain;
    row.category = category;
    row.seconds_active = active;
    row.idle_seconds = idle;
    return row;
}

// Throw-away database file under the temp directory, one per test
class StoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_Path = std::filesystem::temp_directory_path() /
                 (std::string("hourglass_") + info->test_suite_name() + "_" + info->name() +
                  "_" + std::to_string(getpid()) + ".sqlite");
        RemoveFiles();
        m_Store = std::make_unique<IntervalStore>(m_Path.string());
    }

    void TearDown() override {
        m_Store.reset();
        RemoveFiles();
    }

    IntervalStore &Store() {
        return *m_Store;
    }

    void Insert(const ActivityRow &row) {
        std::string error;
        ASSERT_TRUE(Store().InsertActivity(row, error)) << error;
    }

    // Writes straight into the activities table, bypassing InsertActivity's checks,
    // the way another writer sharing the database could
    void InsertRaw(const std::string &startedAt, const std::optional<std::string> &endedAt,
                   const std::string &domain, double active) {
        sqlite3 *db = nullptr;
        ASSERT_EQ(sqlite3_open(m_Path.string().c_str(), &db), SQLITE_OK);
        sqlite3_stmt *stmt = nullptr;
        ASSERT_EQ(sqlite3_prepare_v2(db,
                                     "INSERT INTO activities (started_at, ended_at, domain, "
                                     "category, seconds_active) VALUES (?, ?, ?, 'productive', ?)",
                                     -1, &stmt, nullptr),
                  SQLITE_OK)
          << sqlite3_errmsg(db);
        sqlite3_bind_text(stmt, 1, startedAt.c_str(), -1, SQLITE_TRANSIENT);
        if (endedAt) {
            sqlite3_bind_text(stmt, 2, endedAt->c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, 2);
        }
        sqlite3_bind_text(stmt, 3, domain.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 4, active);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_DONE);
    }

  private:
    void RemoveFiles() {
        std::error_code ec;
        for (const char *suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(m_Path.string() + suffix, ec);
        }
    }

    std::filesystem::path m_Path;
    std::unique_ptr<IntervalStore> m_Store;
};
