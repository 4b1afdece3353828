#pragma once
#include <SDL2/SDL.h>
#include <memory>
#include <vector>
#include "Tools.h"

class SurfacePair;

enum class StrokeState { IDLE, DRAWING };

// Owns the tool state and the single in-progress stroke. Both the gesture
// path and the pointer path drive strokes through this class; it forwards
// samples to the active tool and commits or discards the surface pair's
// back buffer when the stroke ends.
class StrokeController {
  public:
    explicit StrokeController(SurfacePair* surface);

    // ── Stroke lifecycle ──────────────────────────────────────────────────────
    // Rejected (returns false) while a stroke is already open.
    bool beginStroke(float x, float y, float pressure = 1.f);
    bool continueStroke(float x, float y, float pressure = 1.f);
    void endStroke();      // commit
    void cancelStroke();   // discard

    StrokeState getState() const { return state; }
    bool isDrawing() const { return state == StrokeState::DRAWING; }
    const std::vector<StrokePoint>& getStroke() const { return stroke; }
    Uint32 getStrokeStartTicks() const { return strokeStart; }
    // Increments on every beginStroke. A tool switch that splits an open
    // stroke keeps the id, so whoever started the stroke still owns it.
    unsigned getStrokeId() const { return strokeId; }

    // ── Tool configuration ────────────────────────────────────────────────────
    // Explicit (keyboard / UI) selection. Wins over gesture-implied tools
    // until the next gesture-driven drawing transition.
    void setTool(ToolType t);
    // Gesture-implied selection; clears any explicit override.
    void applyGestureTool(ToolType t);
    bool hasToolOverride() const { return toolOverride; }
    ToolType getTool() const { return toolState.tool; }

    void setColor(Uint8 r, Uint8 g, Uint8 b);
    SDL_Color getColor() const { return toolState.color; }
    void setBrushSize(int size);
    void adjustBrushSize(int delta) { setBrushSize(toolState.brushSize + delta); }
    int  getBrushSize() const { return toolState.brushSize; }
    const ToolState& getToolState() const { return toolState; }

    void  setSmoothingFactor(float f);
    float getSmoothingFactor() const { return smoothingFactor; }

  private:
    SurfacePair*                  surface;
    StrokeState                   state = StrokeState::IDLE;
    ToolState                     toolState;
    bool                          toolOverride = false;
    std::unique_ptr<AbstractTool> currentTool;
    std::vector<StrokePoint>      stroke;
    Uint32                        strokeStart = 0;
    unsigned                      strokeId = 0;
    float                         smoothingFactor = 0.1f;

    void changeTool(ToolType t);
    void abortStroke();
};
