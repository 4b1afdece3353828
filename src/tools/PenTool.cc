#include "Tools.h"
#include "SurfacePair.h"

// Pressure scales both the dab radius and its opacity.
static float penRadius(const StrokePoint& p, const ToolState& state) {
    return state.brushSize * p.pressure;
}

static SDL_Color penColor(const StrokePoint& p, const ToolState& state) {
    SDL_Color c = state.color;
    c.a = (Uint8)(c.a * p.pressure + 0.5f);
    return c;
}

bool PenTool::onStrokeBegin(const StrokePoint& p, const ToolState& state) {
    AbstractTool::onStrokeBegin(p, state);
    return surface->stamp(p.x, p.y, penRadius(p, state), penColor(p, state), StampMode::PEN);
}

bool PenTool::onStrokeMove(const StrokePoint& p, const ToolState& state) {
    if (!isDrawing) return true;
    bool ok = surface->line(last.x, last.y, p.x, p.y,
                            penRadius(p, state), penColor(p, state), StampMode::PEN);
    last = p;
    return ok;
}
