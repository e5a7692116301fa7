#include <gtest/gtest.h>
#include <cloth/fixed_step.hpp>
#include <cmath>
#include <stdexcept>

using namespace drape;

class FixedStepTest : public ::testing::Test {
protected:
    static constexpr double kStep = 1.0 / 120.0;
    int calls = 0;
    TickCallback count = [this]() { ++calls; };
};

TEST_F(FixedStepTest, ShortFrameRunsNoTicks) {
    FixedStepDriver driver(kStep);
    EXPECT_EQ(driver.advance(kStep / 2.0, count), 0);
    EXPECT_EQ(calls, 0);
    EXPECT_DOUBLE_EQ(driver.accumulator(), kStep / 2.0);
}

TEST_F(FixedStepTest, LeftoverCarriesOver) {
    FixedStepDriver driver(kStep);
    EXPECT_EQ(driver.advance(kStep / 2.0, count), 0);
    EXPECT_EQ(driver.advance(kStep / 2.0, count), 1);
    EXPECT_EQ(calls, 1);
    EXPECT_DOUBLE_EQ(driver.accumulator(), 0.0);
}

TEST_F(FixedStepTest, SixtyHertzFrameRunsTwoTicks) {
    FixedStepDriver driver(kStep);
    EXPECT_EQ(driver.advance(1.0 / 60.0, count), 2);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(driver.total_ticks(), 2u);
    EXPECT_LT(driver.accumulator(), kStep);
}

TEST_F(FixedStepTest, WholeMultipleOfStepRunsExactlyThatManyTicks) {
    for (int k = 1; k <= 120; ++k) {
        for (double dt : {k * kStep, k / 120.0}) {
            FixedStepDriver driver(kStep);
            calls = 0;
            EXPECT_EQ(driver.advance(dt, count), k) << "k=" << k << " dt=" << dt;
            EXPECT_EQ(calls, k);
            EXPECT_GE(driver.accumulator(), 0.0);
            EXPECT_LT(driver.accumulator(), kStep * 1e-6) << "k=" << k;
        }
    }
}

TEST_F(FixedStepTest, TicksMatchElapsedTime) {
    FixedStepDriver driver(kStep);
    int total = 0;
    for (int frame = 0; frame < 100; ++frame) {
        total += driver.advance(0.013, count);
    }
    double expected = std::floor(100 * 0.013 / kStep);
    EXPECT_NEAR(total, expected, 1.0);
    EXPECT_GE(driver.accumulator(), 0.0);
    EXPECT_LT(driver.accumulator(), kStep);
}

TEST_F(FixedStepTest, InvalidDeltasAreIgnored) {
    FixedStepDriver driver(kStep);
    driver.advance(kStep / 2.0, count);
    EXPECT_EQ(driver.advance(-1.0, count), 0);
    EXPECT_EQ(driver.advance(std::nan(""), count), 0);
    EXPECT_EQ(driver.advance(INFINITY, count), 0);
    EXPECT_EQ(calls, 0);
    EXPECT_DOUBLE_EQ(driver.accumulator(), kStep / 2.0);
}

TEST_F(FixedStepTest, MaxTicksDropsSurplus) {
    FixedStepDriver driver(0.25, 3);
    EXPECT_EQ(driver.advance(2.0, count), 3);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(driver.dropped_ticks(), 5u);
    EXPECT_DOUBLE_EQ(driver.accumulator(), 0.0);

    // Normal frames are unaffected
    EXPECT_EQ(driver.advance(0.5, count), 2);
}

TEST_F(FixedStepTest, Reset) {
    FixedStepDriver driver(0.25, 1);
    driver.advance(1.1, count);
    driver.reset();
    EXPECT_EQ(driver.total_ticks(), 0u);
    EXPECT_EQ(driver.dropped_ticks(), 0u);
    EXPECT_DOUBLE_EQ(driver.accumulator(), 0.0);
    EXPECT_DOUBLE_EQ(driver.fixed_step(), 0.25);
}

TEST_F(FixedStepTest, RejectsInvalidParameters) {
    EXPECT_THROW(FixedStepDriver(0.0), std::invalid_argument);
    EXPECT_THROW(FixedStepDriver(-0.1), std::invalid_argument);
    EXPECT_THROW(FixedStepDriver(kStep, -1), std::invalid_argument);
}
