#include <gtest/gtest.h>
#include "CoordinateMapper.h"

TEST(LandmarkMapperTest, MirrorsHorizontally) {
    float x, y;
    LandmarkMapper::toSurface(0.25f, 0.5f, 800.f, 600.f, &x, &y);
    EXPECT_FLOAT_EQ(x, 600.f);
    EXPECT_FLOAT_EQ(y, 300.f);

    LandmarkMapper::toSurface(0.f, 0.f, 800.f, 600.f, &x, &y);
    EXPECT_FLOAT_EQ(x, 800.f);
    EXPECT_FLOAT_EQ(y, 0.f);
}

TEST(LandmarkMapperTest, MirrorTwiceIsIdentity) {
    const float xs[] = {0.f, 0.1f, 0.25f, 0.5f, 0.8f, 1.f};
    for (float x : xs) EXPECT_NEAR(LandmarkMapper::mirror(LandmarkMapper::mirror(x)), x, 1e-6f);
}

TEST(LandmarkMapperTest, SameMappingForAnyRectangle) {
    float cx, cy, sx, sy;
    LandmarkMapper::toSurface(0.3f, 0.4f, 1200.f, 800.f, &cx, &cy);
    LandmarkMapper::toSurface(0.3f, 0.4f, 600.f, 400.f, &sx, &sy);
    EXPECT_FLOAT_EQ(cx, sx * 2.f);
    EXPECT_FLOAT_EQ(cy, sy * 2.f);
}
