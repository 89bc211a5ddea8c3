#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MetricsReport.hpp"

using namespace sqlpool;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class MetricsReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_.totalAcquires = 200;
        snapshot_.totalReleases = 198;
        snapshot_.totalWaits = 50;
        snapshot_.spinWaits = 30;
        snapshot_.parkWaits = 20;
        snapshot_.avgWaitTimeMs = 1.25;
        snapshot_.waitPercentage = 25.0;
        snapshot_.peakUsage = 4;
        snapshot_.currentUsage = 2;
        snapshot_.poolSize = 4;
        snapshot_.connectionsCreated = 4;

        config_.min_size = 2;
        config_.max_size = 10;
    }

    PoolMetrics::Snapshot snapshot_;
    PoolConfig config_;
};

TEST_F(MetricsReportTest, JSONUsesSnakeCaseKeys) {
    auto obj = MetricsReport::toJSON(snapshot_);

    EXPECT_EQ(obj["total_acquires"], 200);
    EXPECT_EQ(obj["total_releases"], 198);
    EXPECT_EQ(obj["total_waits"], 50);
    EXPECT_EQ(obj["spin_waits"], 30);
    EXPECT_EQ(obj["park_waits"], 20);
    EXPECT_DOUBLE_EQ(obj["avg_wait_time_ms"].get<double>(), 1.25);
    EXPECT_DOUBLE_EQ(obj["wait_percentage"].get<double>(), 25.0);
    EXPECT_EQ(obj["peak_usage"], 4);
    EXPECT_EQ(obj["current_usage"], 2);
    EXPECT_EQ(obj["pool_size"], 4);
    EXPECT_TRUE(obj.contains("health_check_failures"));
    EXPECT_TRUE(obj.contains("release_warnings"));
}

TEST_F(MetricsReportTest, JSONStringHonoursPrettyOption) {
    ReportOptions compact;
    compact.pretty = false;

    auto dense = MetricsReport::toJSONString(snapshot_, compact);
    auto pretty = MetricsReport::toJSONString(snapshot_);

    EXPECT_EQ(dense.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(dense), json::parse(pretty));
}

TEST_F(MetricsReportTest, TextListsEveryCounter) {
    auto text = MetricsReport::toText(snapshot_);

    EXPECT_THAT(text, HasSubstr("Total acquires"));
    EXPECT_THAT(text, HasSubstr("200"));
    EXPECT_THAT(text, HasSubstr("Wait percentage         25.00%"));
    EXPECT_THAT(text, HasSubstr("Avg wait time           1.25 ms"));
    EXPECT_THAT(text, HasSubstr("Peak usage"));
}

TEST_F(MetricsReportTest, NoAdviceForHealthyPool) {
    EXPECT_THAT(MetricsReport::advise(snapshot_, config_), IsEmpty());
}

TEST_F(MetricsReportTest, NoAdviceForUnusedPool) {
    PoolMetrics::Snapshot empty;
    config_.max_size = 1;

    EXPECT_THAT(MetricsReport::advise(empty, config_), IsEmpty());
}

TEST_F(MetricsReportTest, AdvisesGrowthWhenAtCapacity) {
    snapshot_.peakUsage = 9;

    auto advice = MetricsReport::advise(snapshot_, config_);

    ASSERT_EQ(advice.size(), 1u);
    EXPECT_THAT(advice[0], HasSubstr("consider increasing max_size (peak 9/10)"));
}

TEST_F(MetricsReportTest, CapacityRatioIsConfigurable) {
    snapshot_.peakUsage = 6;
    ReportOptions options;
    options.capacityWarningRatio = 0.5;

    EXPECT_EQ(MetricsReport::advise(snapshot_, config_, options).size(), 1u);
}

TEST_F(MetricsReportTest, AdvisesOnTimeoutsAndConnectFailures) {
    snapshot_.totalTimeouts = 3;
    snapshot_.connectFailures = 2;

    auto advice = MetricsReport::advise(snapshot_, config_);

    EXPECT_THAT(advice, Contains(HasSubstr("3 acquire calls timed out")));
    EXPECT_THAT(advice, Contains(HasSubstr("2 connection attempts failed")));
}

TEST_F(MetricsReportTest, AdvisesSpinningWhenParksDominate) {
    snapshot_.spinWaits = 0;
    snapshot_.parkWaits = 50;
    config_.spin_iterations = 0;

    EXPECT_THAT(MetricsReport::advise(snapshot_, config_), Contains(HasSubstr("spin_iterations")));

    config_.spin_iterations = 10;
    EXPECT_THAT(MetricsReport::advise(snapshot_, config_), IsEmpty());
}
