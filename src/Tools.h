#pragma once

#include <SDL2/SDL.h>

class SurfacePair;

enum class ToolType { PEN, ERASER };

// Everything the rasterizer needs to know about the active tool.
struct ToolState {
    ToolType  tool      = ToolType::PEN;
    SDL_Color color     = {0, 0, 0, 255};
    int       brushSize = 5;   // stamp radius in canvas pixels at full pressure
};

struct StrokePoint {
    float x = 0.f, y = 0.f;
    float pressure = 1.f;      // [0.1, 1.0]
};

// Window to canvas pixel mapping for pointer input.
class ICoordinateMapper {
  public:
    virtual ~ICoordinateMapper() {}
    virtual void getCanvasCoords(int winX, int winY, int* canX, int* canY) = 0;
    virtual void getCanvasSize(int* w, int* h) = 0;  // runtime canvas dimensions
};

// A tool turns stroke samples into dabs on the surface pair's back buffer.
// Every call returns false when the renderer failed and the stroke must be
// abandoned.
class AbstractTool {
  protected:
    SurfacePair* surface;
    bool         isDrawing = false;
    StrokePoint  start, last;
  public:
    AbstractTool(SurfacePair* s) : surface(s) {}
    virtual ~AbstractTool() {}
    bool isActive() const { return isDrawing; }
    StrokePoint getStart() const { return start; }
    virtual ToolType type() const = 0;
    virtual bool onStrokeBegin(const StrokePoint& p, const ToolState& state);
    virtual bool onStrokeMove (const StrokePoint& p, const ToolState& state);
    virtual void onStrokeEnd  ();
};

class PenTool : public AbstractTool {
  public:
    using AbstractTool::AbstractTool;
    ToolType type() const override { return ToolType::PEN; }
    bool onStrokeBegin(const StrokePoint& p, const ToolState& state) override;
    bool onStrokeMove (const StrokePoint& p, const ToolState& state) override;
};

class EraserTool : public AbstractTool {
  public:
    using AbstractTool::AbstractTool;
    ToolType type() const override { return ToolType::ERASER; }
    bool onStrokeBegin(const StrokePoint& p, const ToolState& state) override;
    bool onStrokeMove (const StrokePoint& p, const ToolState& state) override;
};
