#include <gtest/gtest.h>
#include "Gesture.h"
#include "TestHands.h"

using TestHands::Pose;
using TestHands::makeHand;

// Every combination of four or more extended fingers is an open palm.
TEST(GestureClassifierTest, FourOrMoreFingersIsPalm) {
    for (int mask = 0; mask < 32; mask++) {
        Pose p;
        p.thumb  = mask & 1;
        p.index  = mask & 2;
        p.middle = mask & 4;
        p.ring   = mask & 8;
        p.pinky  = mask & 16;
        FingerState f = Gestures::fingerState(makeHand(p));
        if (f.extendedCount() >= 4) {
            EXPECT_EQ(Gestures::classify(makeHand(p)), Gesture::PALM) << "mask " << mask;
        }
    }
}

TEST(GestureClassifierTest, IndexOnlyIsPoint) {
    EXPECT_EQ(Gestures::classify(TestHands::pointing()), Gesture::POINT);
    EXPECT_EQ(Gestures::classify(TestHands::pointing(0.1f, 0.05f)), Gesture::POINT);
}

TEST(GestureClassifierTest, TwoFingersCloseIsDraw) {
    Pose p;
    p.index = p.middle = true;
    p.indexX  = 0.45f;
    p.middleX = 0.48f;
    EXPECT_EQ(Gestures::classify(makeHand(p)), Gesture::DRAW);
}

TEST(GestureClassifierTest, TwoFingersSpreadIsPeace) {
    Pose p;
    p.index = p.middle = true;
    p.indexX  = 0.40f;
    p.middleX = 0.60f;
    EXPECT_EQ(Gestures::classify(makeHand(p)), Gesture::PEACE);
}

TEST(GestureClassifierTest, RockAndThree) {
    EXPECT_EQ(Gestures::classify(TestHands::rock()), Gesture::ROCK);

    Pose three;
    three.index = three.middle = three.ring = true;
    EXPECT_EQ(Gestures::classify(makeHand(three)), Gesture::THREE);
}

TEST(GestureClassifierTest, ThumbOnlyIsTap) {
    EXPECT_EQ(Gestures::classify(TestHands::thumbsUp()), Gesture::TAP);
}

TEST(GestureClassifierTest, IndexFallbackIsPoint) {
    // Index + ring matches none of the named poses.
    Pose p;
    p.index = p.ring = true;
    EXPECT_EQ(Gestures::classify(makeHand(p)), Gesture::POINT);

    // Thumb + index + middle: three fingers, but not rock or three.
    Pose q;
    q.thumb = q.index = q.middle = true;
    EXPECT_EQ(Gestures::classify(makeHand(q)), Gesture::POINT);
}

TEST(GestureClassifierTest, NoIndexIsNone) {
    EXPECT_EQ(Gestures::classify(makeHand(Pose())), Gesture::NONE);

    Pose p;
    p.middle = true;
    EXPECT_EQ(Gestures::classify(makeHand(p)), Gesture::NONE);

    Pose q;
    q.thumb = q.pinky = true;
    EXPECT_EQ(Gestures::classify(makeHand(q)), Gesture::NONE);
}

TEST(GestureClassifierTest, FingerStateReportsEachFinger) {
    FingerState f = Gestures::fingerState(TestHands::rock());
    EXPECT_TRUE(f.thumb);
    EXPECT_TRUE(f.index);
    EXPECT_FALSE(f.middle);
    EXPECT_FALSE(f.ring);
    EXPECT_TRUE(f.pinky);
    EXPECT_EQ(f.extendedCount(), 3);
}

TEST(GestureNamesTest, RoundTripEveryGesture) {
    const Gesture all[] = {
        Gesture::NONE, Gesture::POINT, Gesture::DRAW, Gesture::PEACE, Gesture::PALM,
        Gesture::ROCK, Gesture::THREE, Gesture::TAP,  Gesture::FIST
    };
    for (Gesture g : all) {
        Gesture parsed = Gesture::NONE;
        ASSERT_TRUE(Gestures::fromString(Gestures::toString(g), parsed));
        EXPECT_EQ(parsed, g);
    }
    Gesture untouched = Gesture::ROCK;
    EXPECT_FALSE(Gestures::fromString("wave", untouched));
    EXPECT_EQ(untouched, Gesture::ROCK);
}

TEST(GestureNamesTest, DrawingGesturesAndTools) {
    EXPECT_TRUE(Gestures::isDrawing(Gesture::POINT));
    EXPECT_TRUE(Gestures::isDrawing(Gesture::DRAW));
    EXPECT_TRUE(Gestures::isDrawing(Gesture::PEACE));
    EXPECT_TRUE(Gestures::isDrawing(Gesture::PALM));
    EXPECT_TRUE(Gestures::isDrawing(Gesture::THREE));
    EXPECT_FALSE(Gestures::isDrawing(Gesture::NONE));
    EXPECT_FALSE(Gestures::isDrawing(Gesture::ROCK));
    EXPECT_FALSE(Gestures::isDrawing(Gesture::TAP));
    EXPECT_FALSE(Gestures::isDrawing(Gesture::FIST));

    EXPECT_EQ(Gestures::impliedTool(Gesture::PALM),  ToolType::ERASER);
    EXPECT_EQ(Gestures::impliedTool(Gesture::POINT), ToolType::PEN);
    EXPECT_EQ(Gestures::impliedTool(Gesture::THREE), ToolType::PEN);
}

// ── Stabilizer ──────────────────────────────────────────────────────────────

TEST(GestureStabilizerTest, WindowOneIsPassThrough) {
    GestureStabilizer s(1);
    const Gesture seq[] = {Gesture::POINT, Gesture::PALM, Gesture::PALM, Gesture::NONE, Gesture::ROCK};
    for (Gesture g : seq) EXPECT_EQ(s.push(g), g);
}

TEST(GestureStabilizerTest, WindowThreeNeedsAgreement) {
    GestureStabilizer s(3);
    EXPECT_EQ(s.push(Gesture::POINT), Gesture::NONE);
    EXPECT_EQ(s.push(Gesture::POINT), Gesture::NONE);
    EXPECT_EQ(s.push(Gesture::PALM),  Gesture::NONE);

    EXPECT_EQ(s.push(Gesture::PALM), Gesture::NONE);
    EXPECT_EQ(s.push(Gesture::PALM), Gesture::PALM);
}

TEST(GestureStabilizerTest, ChangeReportedOnce) {
    GestureStabilizer s(3);
    int changes = 0;
    for (int i = 0; i < 5; i++) {
        Gesture g = s.push(Gesture::POINT);
        if (s.changed()) changes++;
        EXPECT_EQ(g, i >= 2 ? Gesture::POINT : Gesture::NONE) << "frame " << i;
    }
    EXPECT_EQ(changes, 1);
}

TEST(GestureStabilizerTest, WindowClampedToOne) {
    GestureStabilizer s(0);
    EXPECT_EQ(s.getWindow(), 1);
    s.setWindow(-4);
    EXPECT_EQ(s.getWindow(), 1);
}

TEST(GestureStabilizerTest, ShrinkingWindowEvictsOldest) {
    GestureStabilizer s(4);
    s.push(Gesture::ROCK);
    s.push(Gesture::POINT);
    s.push(Gesture::POINT);
    s.setWindow(2);
    EXPECT_EQ(s.push(Gesture::POINT), Gesture::POINT);
}

TEST(GestureStabilizerTest, ResetClearsHistory) {
    GestureStabilizer s(2);
    s.push(Gesture::PALM);
    s.push(Gesture::PALM);
    ASSERT_EQ(s.stable(), Gesture::PALM);

    s.reset();
    EXPECT_EQ(s.stable(), Gesture::NONE);
    EXPECT_TRUE(s.changed());
    EXPECT_EQ(s.push(Gesture::PALM), Gesture::NONE);
}
