#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

#include "collide2d/core/settings.hpp"

TEST(SettingsTest, DefaultsAreValid) {
    Settings s;
    EXPECT_NO_THROW(s.validate());
    EXPECT_DOUBLE_EQ(s.StepFrequency, 1.0 / 60.0);
    EXPECT_EQ(s.VelocityIterations, 10);
    EXPECT_EQ(s.PositionIterations, 10);
    EXPECT_TRUE(s.WarmStartingEnabled);
    EXPECT_TRUE(s.BlockSolverEnabled);
    EXPECT_EQ(s.ContinuousMode, ContinuousDetectionMode::BulletsOnly);
    EXPECT_EQ(s.Narrowphase, NarrowphaseAlgorithm::Sat);
    EXPECT_DOUBLE_EQ(s.getWarmStartDistanceSquared(), 1.0e-4);
}

TEST(SettingsTest, RejectsOutOfRangeValues) {
    Settings s;
    s.StepFrequency = 0.0;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.VelocityIterations = 0;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.PositionIterations = -1;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.AABBExpansion = -0.1;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.Baumgarte = 1.5;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.LinearTolerance = NAN;
    EXPECT_THROW(s.validate(), std::invalid_argument);

    s = Settings();
    s.MaxTranslation = 0.0;
    EXPECT_THROW(s.validate(), std::invalid_argument);
}

TEST(SettingsTest, ZeroPositionIterationsAllowed) {
    Settings s;
    s.PositionIterations = 0;
    s.AABBExpansion = 0.0;
    s.WarmStartingEnabled = false;
    EXPECT_NO_THROW(s.validate());
}
