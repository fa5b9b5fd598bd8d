#include <gtest/gtest.h>
#include <main/control/moisture_filter.hpp>

TEST(MoistureFilter, PercentEndpointsAndMidpoint) {
    EXPECT_EQ(MoistureFilter::toPercent(3200.0f, 3200, 1300), 0);
    EXPECT_EQ(MoistureFilter::toPercent(1300.0f, 3200, 1300), 100);
    EXPECT_EQ(MoistureFilter::toPercent(2250.0f, 3200, 1300), 50);
}

TEST(MoistureFilter, PercentClampsOutsideCalibration) {
    EXPECT_EQ(MoistureFilter::toPercent(4095.0f, 3200, 1300), 0);
    EXPECT_EQ(MoistureFilter::toPercent(200.0f, 3200, 1300), 100);
}

TEST(MoistureFilter, PercentWithRisingProbe) {
    EXPECT_EQ(MoistureFilter::toPercent(1000.0f, 1000, 3000), 0);
    EXPECT_EQ(MoistureFilter::toPercent(2000.0f, 1000, 3000), 50);
    EXPECT_EQ(MoistureFilter::toPercent(3500.0f, 1000, 3000), 100);
}

TEST(MoistureFilter, EqualCalibrationIsAlwaysZero) {
    EXPECT_EQ(MoistureFilter::toPercent(0.0f, 2000, 2000), 0);
    EXPECT_EQ(MoistureFilter::toPercent(2000.0f, 2000, 2000), 0);
    EXPECT_EQ(MoistureFilter::toPercent(4095.0f, 2000, 2000), 0);

    MoistureFilter f(0.5f, 2000, 2000);
    EXPECT_EQ(f.update(1234, 0).percent, 0);
}

TEST(MoistureFilter, SeedsFromFirstReading) {
    MoistureFilter f(0.2f, 3200, 1300);
    EXPECT_FALSE(f.hasValue());

    SoilSample s = f.update(2000, 10);
    EXPECT_TRUE(f.hasValue());
    EXPECT_EQ(s.raw, 2000);
    EXPECT_FLOAT_EQ(s.smoothed, 2000.0f);
    EXPECT_EQ(s.ts_ms, 10u);

    s = f.update(3000, 20);
    EXPECT_NEAR(s.smoothed, 2200.0f, 0.01f);
    EXPECT_EQ(s.raw, 3000);
}

TEST(MoistureFilter, PercentFollowsSmoothedNotRaw) {
    MoistureFilter f(0.2f, 3200, 1300);
    (void)f.update(3200, 0);
    // One fully wet sample only moves the EMA a fifth of the way
    SoilSample s = f.update(1300, 1000);
    EXPECT_NEAR(s.smoothed, 2820.0f, 0.01f);
    EXPECT_EQ(s.percent, 20);
}

TEST(MoistureFilter, AlphaOneTracksRaw) {
    MoistureFilter f(1.0f, 3200, 1300);
    (void)f.update(3000, 0);
    EXPECT_FLOAT_EQ(f.update(1500, 1).smoothed, 1500.0f);
}

TEST(MoistureFilter, ResetReseeds) {
    MoistureFilter f(0.2f, 3200, 1300);
    (void)f.update(3000, 0);
    f.reset();
    EXPECT_FALSE(f.hasValue());
    EXPECT_FLOAT_EQ(f.update(1500, 1).smoothed, 1500.0f);
}

TEST(MoistureFilter, Average) {
    const uint16_t samples[] = {1, 2, 4};
    EXPECT_EQ(MoistureFilter::average(samples, 3), 2);
    const uint16_t full[] = {4095, 4095, 4095, 4095};
    EXPECT_EQ(MoistureFilter::average(full, 4), 4095);
    EXPECT_EQ(MoistureFilter::average(nullptr, 3), 0);
    EXPECT_EQ(MoistureFilter::average(samples, 0), 0);
}
