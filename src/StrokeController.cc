#include "StrokeController.h"
#include "SurfacePair.h"
#include "Config.h"
#include "Log.h"
#include <algorithm>
#include <cmath>

static const char* toolName(ToolType t) {
    switch (t) {
        case ToolType::PEN:    return "pen";
        case ToolType::ERASER: return "eraser";
    }
    return "?";
}

static float clampPressure(float p) {
    if (!std::isfinite(p)) return 1.f;
    return std::max(0.1f, std::min(1.f, p));
}

StrokeController::StrokeController(SurfacePair* s) : surface(s) {
    changeTool(ToolType::PEN);
}

// ── Stroke lifecycle ──────────────────────────────────────────────────────────

bool StrokeController::beginStroke(float x, float y, float pressure) {
    if (state == StrokeState::DRAWING) {
        SDL_LogWarn(GPEN_LOG_INPUT, "beginStroke ignored: a stroke is already in progress");
        return false;
    }
    if (!surface->seed()) return false;

    StrokePoint p;
    p.x = x;
    p.y = y;
    p.pressure = clampPressure(pressure);
    stroke.clear();
    stroke.push_back(p);
    strokeStart = SDL_GetTicks();
    strokeId++;
    state = StrokeState::DRAWING;
    SDL_LogDebug(GPEN_LOG_INPUT, "%s stroke started at (%.1f, %.1f)", toolName(toolState.tool), x, y);

    if (!currentTool->onStrokeBegin(p, toolState)) {
        abortStroke();
        return false;
    }
    return true;
}

bool StrokeController::continueStroke(float x, float y, float pressure) {
    if (state != StrokeState::DRAWING) return false;

    StrokePoint p;
    p.x = x;
    p.y = y;
    p.pressure = clampPressure(pressure);
    // Exponential smoothing toward the raw sample once the stroke has a direction.
    if (stroke.size() >= 2) {
        const StrokePoint& prev = stroke.back();
        p.x = prev.x + (x - prev.x) * smoothingFactor;
        p.y = prev.y + (y - prev.y) * smoothingFactor;
    }
    stroke.push_back(p);

    if (!currentTool->onStrokeMove(p, toolState)) {
        abortStroke();
        return false;
    }
    return true;
}

void StrokeController::endStroke() {
    if (state != StrokeState::DRAWING) return;
    currentTool->onStrokeEnd();
    surface->commit();
    SDL_LogDebug(GPEN_LOG_INPUT, "stroke committed, %d points", (int)stroke.size());
    stroke.clear();
    state = StrokeState::IDLE;
}

void StrokeController::cancelStroke() {
    if (state != StrokeState::DRAWING) return;
    currentTool->onStrokeEnd();
    surface->discard();
    SDL_LogDebug(GPEN_LOG_INPUT, "stroke discarded, %d points", (int)stroke.size());
    stroke.clear();
    state = StrokeState::IDLE;
}

void StrokeController::abortStroke() {
    SDL_LogError(GPEN_LOG_RENDER, "rendering failed mid-stroke, stroke dropped: %s", SDL_GetError());
    cancelStroke();
}

// ── Tool configuration ────────────────────────────────────────────────────────

void StrokeController::setTool(ToolType t) {
    toolOverride = true;
    changeTool(t);
}

void StrokeController::applyGestureTool(ToolType t) {
    toolOverride = false;
    changeTool(t);
}

void StrokeController::changeTool(ToolType t) {
    if (currentTool && currentTool->type() == t) return;

    // A tool switch mid-stroke closes the current stroke and carries on
    // from the same spot with the new tool.
    bool resume = state == StrokeState::DRAWING;
    StrokePoint last;
    if (resume) {
        last = stroke.back();
        endStroke();
    }

    toolState.tool = t;
    switch (t) {
        case ToolType::PEN:    currentTool = std::make_unique<PenTool>(surface);    break;
        case ToolType::ERASER: currentTool = std::make_unique<EraserTool>(surface); break;
    }
    SDL_LogInfo(GPEN_LOG_INPUT, "tool: %s", toolName(t));

    if (resume) {
        unsigned id = strokeId;
        beginStroke(last.x, last.y, last.pressure);
        strokeId = id;
    }
}

void StrokeController::setColor(Uint8 r, Uint8 g, Uint8 b) {
    toolState.color = { r, g, b, 255 };
}

void StrokeController::setBrushSize(int size) {
    toolState.brushSize = std::max(MIN_BRUSH_SIZE, std::min(MAX_BRUSH_SIZE, size));
}

void StrokeController::setSmoothingFactor(float f) {
    if (f > 0.f && f <= 1.f) smoothingFactor = f;
}
