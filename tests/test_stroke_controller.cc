#include <gtest/gtest.h>
#include <memory>
#include "SoftwareCanvas.h"
#include "StrokeController.h"

class StrokeControllerTest : public SoftwareCanvasTest {
  protected:
    std::unique_ptr<StrokeController> controller;

    void SetUp() override {
        SoftwareCanvasTest::SetUp();
        controller = std::make_unique<StrokeController>(&surfaces);
    }
    void TearDown() override {
        controller.reset();
        SoftwareCanvasTest::TearDown();
    }
};

TEST_F(StrokeControllerTest, DefaultsToIdlePen) {
    EXPECT_EQ(controller->getState(), StrokeState::IDLE);
    EXPECT_EQ(controller->getTool(), ToolType::PEN);
    EXPECT_EQ(controller->getBrushSize(), 5);
    EXPECT_FALSE(controller->hasToolOverride());
}

TEST_F(StrokeControllerTest, StrokeLifecycleCommits) {
    ASSERT_TRUE(controller->beginStroke(50.f, 50.f));
    EXPECT_TRUE(controller->isDrawing());
    EXPECT_TRUE(surfaces.isStrokeOpen());
    ASSERT_TRUE(controller->continueStroke(60.f, 50.f));
    EXPECT_EQ(controller->getStroke().size(), 2u);

    controller->endStroke();
    EXPECT_EQ(controller->getState(), StrokeState::IDLE);
    EXPECT_FALSE(surfaces.isStrokeOpen());
    EXPECT_TRUE(controller->getStroke().empty());
    EXPECT_TRUE(isInk(frontPixel(50, 50)));
    EXPECT_TRUE(isInk(frontPixel(56, 50)));
}

TEST_F(StrokeControllerTest, CancelDiscards) {
    ASSERT_TRUE(controller->beginStroke(50.f, 50.f));
    controller->cancelStroke();
    EXPECT_FALSE(controller->isDrawing());
    EXPECT_TRUE(isPaper(frontPixel(50, 50)));
}

TEST_F(StrokeControllerTest, SecondBeginRejected) {
    ASSERT_TRUE(controller->beginStroke(10.f, 10.f));
    unsigned id = controller->getStrokeId();
    EXPECT_FALSE(controller->beginStroke(90.f, 90.f));
    EXPECT_EQ(controller->getStrokeId(), id);
    EXPECT_EQ(controller->getStroke().size(), 1u);
}

TEST_F(StrokeControllerTest, ContinueWhileIdleIgnored) {
    EXPECT_FALSE(controller->continueStroke(10.f, 10.f));
    EXPECT_TRUE(isPaper(backPixel(10, 10)));
}

TEST_F(StrokeControllerTest, SmoothingStartsAtThirdPoint) {
    ASSERT_TRUE(controller->beginStroke(0.f, 0.f));
    ASSERT_TRUE(controller->continueStroke(10.f, 0.f));
    ASSERT_TRUE(controller->continueStroke(110.f, 20.f));

    const std::vector<StrokePoint>& s = controller->getStroke();
    ASSERT_EQ(s.size(), 3u);
    EXPECT_FLOAT_EQ(s[1].x, 10.f);
    EXPECT_FLOAT_EQ(s[2].x, 20.f);
    EXPECT_FLOAT_EQ(s[2].y, 2.f);
}

TEST_F(StrokeControllerTest, SmoothingFactorConfigurable) {
    controller->setSmoothingFactor(0.5f);
    controller->setSmoothingFactor(0.f);   // rejected
    EXPECT_FLOAT_EQ(controller->getSmoothingFactor(), 0.5f);

    ASSERT_TRUE(controller->beginStroke(0.f, 0.f));
    ASSERT_TRUE(controller->continueStroke(0.f, 0.f));
    ASSERT_TRUE(controller->continueStroke(100.f, 0.f));
    EXPECT_FLOAT_EQ(controller->getStroke().back().x, 50.f);
}

TEST_F(StrokeControllerTest, PressureClamped) {
    ASSERT_TRUE(controller->beginStroke(20.f, 20.f, 0.f));
    ASSERT_TRUE(controller->continueStroke(22.f, 20.f, 3.f));
    EXPECT_FLOAT_EQ(controller->getStroke()[0].pressure, 0.1f);
    EXPECT_FLOAT_EQ(controller->getStroke()[1].pressure, 1.f);
}

TEST_F(StrokeControllerTest, BrushSizeClamped) {
    controller->setBrushSize(100);
    EXPECT_EQ(controller->getBrushSize(), 50);
    controller->adjustBrushSize(1);
    EXPECT_EQ(controller->getBrushSize(), 50);
    controller->setBrushSize(0);
    EXPECT_EQ(controller->getBrushSize(), 1);
    controller->adjustBrushSize(-1);
    EXPECT_EQ(controller->getBrushSize(), 1);
    controller->adjustBrushSize(+4);
    EXPECT_EQ(controller->getBrushSize(), 5);
}

TEST_F(StrokeControllerTest, ColorIsOpaqueRgb) {
    controller->setColor(10, 20, 30);
    SDL_Color c = controller->getColor();
    EXPECT_EQ(c.r, 10);
    EXPECT_EQ(c.g, 20);
    EXPECT_EQ(c.b, 30);
    EXPECT_EQ(c.a, 255);
}

TEST_F(StrokeControllerTest, ExplicitToolOverridesUntilGestureTool) {
    controller->setTool(ToolType::ERASER);
    EXPECT_EQ(controller->getTool(), ToolType::ERASER);
    EXPECT_TRUE(controller->hasToolOverride());

    controller->applyGestureTool(ToolType::PEN);
    EXPECT_EQ(controller->getTool(), ToolType::PEN);
    EXPECT_FALSE(controller->hasToolOverride());
}

TEST_F(StrokeControllerTest, ToolSwitchMidStrokeStartsNewStroke) {
    ASSERT_TRUE(controller->beginStroke(40.f, 40.f));
    ASSERT_TRUE(controller->continueStroke(60.f, 40.f));
    unsigned first = controller->getStrokeId();

    controller->setTool(ToolType::ERASER);
    EXPECT_TRUE(controller->isDrawing());
    EXPECT_EQ(controller->getTool(), ToolType::ERASER);
    EXPECT_EQ(controller->getStrokeId(), first);
    // The pen part was committed before the eraser took over.
    EXPECT_TRUE(isInk(frontPixel(45, 40)));
    EXPECT_EQ(controller->getStroke().size(), 1u);
    EXPECT_FLOAT_EQ(controller->getStroke()[0].x, 60.f);
}

TEST_F(StrokeControllerTest, EraserStrokeRemovesInk) {
    ASSERT_TRUE(controller->beginStroke(100.f, 75.f));
    ASSERT_TRUE(controller->continueStroke(104.f, 75.f));
    controller->endStroke();
    ASSERT_TRUE(isInk(frontPixel(100, 75)));

    controller->setTool(ToolType::ERASER);
    controller->setBrushSize(10);
    ASSERT_TRUE(controller->beginStroke(100.f, 75.f));
    controller->endStroke();
    EXPECT_LT(alphaOf(frontPixel(100, 75)), 255);
}

TEST_F(StrokeControllerTest, PressureScalesDabSize) {
    controller->setBrushSize(10);
    ASSERT_TRUE(controller->beginStroke(50.f, 50.f, 0.2f));
    controller->endStroke();
    // Radius 2 and 20% opacity at pressure 0.2: tinted centre, paper 6 px out.
    EXPECT_LT(redOf(frontPixel(50, 50)), 255);
    EXPECT_TRUE(isPaper(frontPixel(56, 50)));

    ASSERT_TRUE(controller->beginStroke(120.f, 50.f, 1.f));
    controller->endStroke();
    EXPECT_TRUE(isInk(frontPixel(126, 50)));
}

TEST_F(StrokeControllerTest, RenderFailureAbortsStroke) {
    ASSERT_TRUE(controller->beginStroke(50.f, 50.f));
    surfaces.destroy();

    EXPECT_FALSE(controller->continueStroke(60.f, 50.f));
    EXPECT_EQ(controller->getState(), StrokeState::IDLE);
    EXPECT_TRUE(controller->getStroke().empty());
    EXPECT_FALSE(surfaces.isStrokeOpen());
    EXPECT_FALSE(controller->continueStroke(70.f, 50.f));
}
