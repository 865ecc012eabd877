#include <gtest/gtest.h>

#include "stats.h"
#include "test_helpers.h"

namespace {

int64_t today_end() { return stats_today_start() + 86399; }

} // namespace

TEST(StatsLedgerTest, SummarizesByKind) {
    StatsLedger ledger(":memory:");
    ASSERT_TRUE(ledger.is_open());

    ledger.record(StatKind::Job, "succeeded", true, "10.0.0.1");
    ledger.record(StatKind::Job, "succeeded", true, "10.0.0.2");
    ledger.record(StatKind::Job, "tool-timeout", false, "10.0.0.1");
    ledger.record(StatKind::Download, "served", true);

    StatSummary jobs = ledger.summarize(StatKind::Job, stats_today_start(), today_end());
    EXPECT_EQ(jobs.total, 3);
    EXPECT_EQ(jobs.successes, 2);
    EXPECT_EQ(jobs.failures, 1);
    ASSERT_EQ(jobs.by_name.size(), 2u);
    EXPECT_EQ(jobs.by_name[0], (pair<string, int>{"succeeded", 2}));

    StatSummary downloads = ledger.summarize(StatKind::Download, stats_today_start(), today_end());
    EXPECT_EQ(downloads.total, 1);
    EXPECT_EQ(downloads.successes, 1);
}

TEST(StatsLedgerTest, PerDayBuckets) {
    StatsLedger ledger(":memory:");
    ledger.record(StatKind::Job, "succeeded", true);
    ledger.record(StatKind::Job, "tool-failed", false);
    ledger.record(StatKind::Download, "served", true);

    auto week = ledger.per_day(StatKind::Job, stats_days_ago(6), today_end());
    ASSERT_EQ(week.size(), 7u);
    EXPECT_EQ(week.back().count, 2);
    EXPECT_EQ(week.front().count, 0);
    EXPECT_EQ(week.back().date.size(), 10u);
    EXPECT_LT(week.front().date, week.back().date);

    EXPECT_TRUE(ledger.per_day(StatKind::Job, today_end(), stats_today_start()).empty());
}

TEST(StatsLedgerTest, RangeExcludesOtherDays) {
    StatsLedger ledger(":memory:");
    ledger.record(StatKind::Job, "succeeded", true);
    EXPECT_EQ(ledger.summarize(StatKind::Job, stats_days_ago(3), stats_days_ago(2)).total, 0);
}

TEST(StatsLedgerTest, SeparateLedgersDoNotShareState) {
    StatsLedger a(":memory:");
    StatsLedger b(":memory:");

    a.record(StatKind::Job, "succeeded", true);
    EXPECT_EQ(a.summarize(StatKind::Job, stats_today_start(), today_end()).total, 1);
    EXPECT_EQ(b.summarize(StatKind::Job, stats_today_start(), today_end()).total, 0);
}

TEST(StatsLedgerTest, FileDatabasePersistsUntilReopened) {
    TempDir dir;
    string path = (dir / "stats.db").string();

    {
        StatsLedger ledger(path);
        ASSERT_TRUE(ledger.is_open());
        ledger.record(StatKind::Download, "aborted", false, "192.168.1.9");
    }

    StatsLedger reopened(path);
    StatSummary s = reopened.summarize(StatKind::Download, stats_today_start(), today_end());
    EXPECT_EQ(s.total, 1);
    EXPECT_EQ(s.failures, 1);
}

TEST(StatsLedgerTest, UnopenablePathRecordsNothing) {
    TempDir dir;
    StatsLedger ledger((dir / "no" / "such" / "dir" / "stats.db").string());

    EXPECT_FALSE(ledger.is_open());
    ledger.record(StatKind::Job, "succeeded", true);
    EXPECT_EQ(ledger.summarize(StatKind::Job, 0, today_end()).total, 0);
}

TEST(StatsLedgerTest, ConcurrentRecordsAreAllKept) {
    StatsLedger ledger(":memory:");
    vector<thread> workers;

    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&ledger] {
            for (int i = 0; i < 25; i++) ledger.record(StatKind::Job, "succeeded", true, "127.0.0.1");
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(ledger.summarize(StatKind::Job, stats_today_start(), today_end()).total, 100);
}

TEST(StatsLedgerTest, KindNames) {
    EXPECT_STREQ(stat_kind_name(StatKind::Job), "job");
    EXPECT_STREQ(stat_kind_name(StatKind::Download), "download");
}
