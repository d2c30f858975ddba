/**
 * @file test_progress_estimator.cpp
 * @brief Unit tests for throughput estimation
 */

#include <gtest/gtest.h>

#include <kcenon/xdcc_client/core/progress_estimator.h>

#include <chrono>
#include <cstdint>
#include <limits>

namespace kcenon::xdcc_client::test {

using namespace std::chrono_literals;

class ProgressEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        start_ = std::chrono::steady_clock::now();
    }

    void TearDown() override {}

    time_point start_;
};

TEST_F(ProgressEstimatorTest, RateFromBytesAndElapsed) {
    progress_estimator estimator(start_);

    auto sample = estimator.sample(1048576, start_ + 2s);

    EXPECT_EQ(sample.bytes_received, 1048576u);
    EXPECT_DOUBLE_EQ(sample.elapsed_seconds, 2.0);
    EXPECT_NEAR(sample.rate, 524288.0, 0.5);
}

TEST_F(ProgressEstimatorTest, ZeroElapsedUsesEpsilon) {
    progress_estimator estimator(start_);

    auto sample = estimator.sample(1000, start_);

    EXPECT_DOUBLE_EQ(sample.elapsed_seconds, 0.0);
    EXPECT_NEAR(sample.rate, 1000.0 / progress_estimator::default_epsilon_seconds, 1e-6);
}

TEST_F(ProgressEstimatorTest, TimeBeforeStartCountsAsZero) {
    progress_estimator estimator(start_);

    auto sample = estimator.sample(10, start_ - 5s);

    EXPECT_DOUBLE_EQ(sample.elapsed_seconds, 0.0);
    EXPECT_GT(sample.rate, 0.0);
}

TEST_F(ProgressEstimatorTest, CustomEpsilon) {
    progress_estimator estimator(start_, 0.5);

    auto sample = estimator.sample(100, start_ + 100ms);

    EXPECT_NEAR(sample.rate, 200.0, 1e-9);
}

TEST_F(ProgressEstimatorTest, NonPositiveEpsilonFallsBackToDefault) {
    progress_estimator estimator(start_, 0.0);

    auto sample = estimator.sample(1, start_);

    EXPECT_NEAR(sample.rate, 1.0 / progress_estimator::default_epsilon_seconds, 1e-6);
}

TEST_F(ProgressEstimatorTest, ZeroBytesGiveZeroRate) {
    progress_estimator estimator(start_);

    EXPECT_DOUBLE_EQ(estimator.sample(0, start_ + 1s).rate, 0.0);
}

TEST_F(ProgressEstimatorTest, RestartMovesStartTime) {
    progress_estimator estimator(start_);
    estimator.restart(start_ + 10s);

    EXPECT_EQ(estimator.start_time(), start_ + 10s);
    EXPECT_DOUBLE_EQ(estimator.sample(100, start_ + 11s).elapsed_seconds, 1.0);
}

TEST_F(ProgressEstimatorTest, SampleAtCurrentTime) {
    progress_estimator estimator;

    auto sample = estimator.sample(4096);

    EXPECT_EQ(sample.bytes_received, 4096u);
    EXPECT_GE(sample.elapsed_seconds, 0.0);
    EXPECT_GT(sample.rate, 0.0);
}

// =============================================================================
// Remaining time
// =============================================================================

TEST_F(ProgressEstimatorTest, EstimateRemaining) {
    throughput_sample sample{500, 5.0, 100.0};

    auto remaining = progress_estimator::estimate_remaining(sample, 1500);

    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(*remaining, 10000ms);
}

TEST_F(ProgressEstimatorTest, EstimateRemainingUnknownTotal) {
    throughput_sample sample{500, 5.0, 100.0};

    EXPECT_FALSE(progress_estimator::estimate_remaining(sample, 0).has_value());
}

TEST_F(ProgressEstimatorTest, EstimateRemainingZeroRate) {
    throughput_sample sample{0, 5.0, 0.0};

    EXPECT_FALSE(progress_estimator::estimate_remaining(sample, 1000).has_value());
}

TEST_F(ProgressEstimatorTest, EstimateRemainingWhenDone) {
    throughput_sample sample{2000, 5.0, 400.0};

    auto remaining = progress_estimator::estimate_remaining(sample, 1000);

    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(*remaining, 0ms);
}

TEST_F(ProgressEstimatorTest, EstimateRemainingBeyondRangeIsUnknown) {
    progress_estimator estimator(start_);
    auto sample = estimator.sample(1, start_ + 2s);

    auto remaining = progress_estimator::estimate_remaining(
        sample, std::numeric_limits<uint64_t>::max());

    EXPECT_FALSE(remaining.has_value());
}

TEST_F(ProgressEstimatorTest, EstimateRemainingLargeTotalStaysPositive) {
    throughput_sample sample{0, 1.0, 1.0e9};

    auto remaining = progress_estimator::estimate_remaining(
        sample, std::numeric_limits<uint64_t>::max());

    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(remaining->count(), 0);
}

}  // namespace kcenon::xdcc_client::test
