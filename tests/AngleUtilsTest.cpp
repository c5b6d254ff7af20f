#include "utils/AngleUtils.hpp"
#include <gtest/gtest.h>

using utils::computeTurnDelta;
using utils::toCompassDegrees;
using utils::TurnDelta;
using utils::TurnDirection;
using utils::wrapAngle360;

TEST(WrapAngle360, WrapsIntoRange) {
    EXPECT_NEAR(to_stDeg(wrapAngle360(0_stDeg)), 0.0, 1e-9);
    EXPECT_NEAR(to_stDeg(wrapAngle360(370_stDeg)), 10.0, 1e-9);
    EXPECT_NEAR(to_stDeg(wrapAngle360(-90_stDeg)), 270.0, 1e-9);
    EXPECT_NEAR(to_stDeg(wrapAngle360(from_stDeg(1085.5))), 5.5, 1e-9);
}

TEST(WrapAngle360, TinyNegativeStaysBelowFullTurn) {
    Angle wrapped = wrapAngle360(from_stDeg(-1e-15));
    EXPECT_GE(to_stDeg(wrapped), 0.0);
    EXPECT_LT(to_stDeg(wrapped), 360.0);
}

TEST(CompassDegrees, ReadsClockwiseFromNorth) {
    EXPECT_NEAR(toCompassDegrees(from_cDeg(0)), 0.0, 1e-9);
    EXPECT_NEAR(toCompassDegrees(from_cDeg(90)), 90.0, 1e-9);
    EXPECT_NEAR(toCompassDegrees(from_cDeg(270)), 270.0, 1e-9);
    EXPECT_NEAR(toCompassDegrees(from_cDeg(-90)), 270.0, 1e-9);
    EXPECT_NEAR(toCompassDegrees(from_cDeg(725)), 5.0, 1e-9);
    // Standard 0 points along +x, which is compass 90
    EXPECT_NEAR(toCompassDegrees(0_stDeg), 90.0, 1e-9);
}

TEST(TurnDelta, ChoosesShorterTurnAcrossZero) {
    auto delta = computeTurnDelta(from_cDeg(10), from_cDeg(350));
    EXPECT_EQ(delta.shortest(), TurnDirection::LEFT);
    EXPECT_NEAR(to_stDeg(delta.magnitude()), 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(delta.sign(), -1.0);
    EXPECT_NEAR(to_stDeg(delta.right), 340.0, 1e-9);
}

TEST(TurnDelta, ChoosesRightWhenClockwiseIsShorter) {
    auto delta = computeTurnDelta(from_cDeg(350), from_cDeg(10));
    EXPECT_EQ(delta.shortest(), TurnDirection::RIGHT);
    EXPECT_NEAR(to_stDeg(delta.magnitude()), 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(delta.sign(), 1.0);
}

TEST(TurnDelta, TieBreaksRight) {
    TurnDelta tie{180_stDeg, 180_stDeg};
    EXPECT_EQ(tie.shortest(), TurnDirection::RIGHT);
    EXPECT_DOUBLE_EQ(tie.sign(), 1.0);

    auto delta = computeTurnDelta(from_cDeg(0), from_cDeg(180));
    EXPECT_NEAR(to_stDeg(delta.left), 180.0, 1e-9);
    EXPECT_NEAR(to_stDeg(delta.right), 180.0, 1e-9);
}

TEST(TurnDelta, CandidatesSumToFullCircle) {
    for (double current = 0.0; current < 360.0; current += 17.0) {
        for (double desired = 0.0; desired < 360.0; desired += 23.0) {
            auto delta = computeTurnDelta(from_cDeg(current), from_cDeg(desired));
            if (current == desired) {
                EXPECT_NEAR(to_stDeg(delta.magnitude()), 0.0, 1e-9);
                continue;
            }
            EXPECT_NEAR(to_stDeg(delta.left + delta.right), 360.0, 1e-9);
            EXPECT_LE(to_stDeg(delta.magnitude()), 180.0 + 1e-9);
        }
    }
}

TEST(TurnDelta, AcceptsUnwrappedInputs) {
    auto delta = computeTurnDelta(from_cDeg(-10), from_cDeg(730));
    EXPECT_EQ(delta.shortest(), TurnDirection::RIGHT);
    EXPECT_NEAR(to_stDeg(delta.magnitude()), 20.0, 1e-9);
}
