#include <gtest/gtest.h>
#include <core/usage_estimator.hpp>
#include <stdexcept>

TEST(UsageEstimator, MultipliesByRatio) {
    UsageEstimator est(1.5);
    EXPECT_DOUBLE_EQ(est.estimate(int64_t{1000000000}), 1.5e9);
    EXPECT_DOUBLE_EQ(UsageEstimator::estimate(200, 2.5), 500.0);
}

TEST(UsageEstimator, ZeroBytesIsZero) {
    UsageEstimator est(3.0);
    EXPECT_DOUBLE_EQ(est.estimate(int64_t{0}), 0.0);
}

TEST(UsageEstimator, NegativeBytesThrow) {
    UsageEstimator est(3.0);
    EXPECT_THROW(est.estimate(int64_t{-1}), std::invalid_argument);
    EXPECT_THROW(UsageEstimator::estimate(-10, 1.0), std::invalid_argument);
}

TEST(UsageEstimator, NonPositiveRatioRejected) {
    EXPECT_THROW(UsageEstimator(0.0), std::invalid_argument);
    EXPECT_THROW(UsageEstimator(-1.0), std::invalid_argument);
}

TEST(UsageEstimator, SumsRawInputsFirst) {
    UsageEstimator est(2.0);
    std::vector<RawInput> inputs(3);
    inputs[0].size = 100;
    inputs[1].size = 250;
    inputs[2].size = 0;
    EXPECT_DOUBLE_EQ(est.estimate(inputs), 700.0);
    EXPECT_DOUBLE_EQ(est.estimate(std::vector<RawInput>{}), 0.0);
}
