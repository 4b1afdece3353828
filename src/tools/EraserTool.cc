#include "Tools.h"
#include "SurfacePair.h"

// Eraser ignores the tool colour; only the radius follows pressure.
bool EraserTool::onStrokeBegin(const StrokePoint& p, const ToolState& state) {
    AbstractTool::onStrokeBegin(p, state);
    return surface->stamp(p.x, p.y, state.brushSize * p.pressure, state.color, StampMode::ERASE);
}

bool EraserTool::onStrokeMove(const StrokePoint& p, const ToolState& state) {
    if (!isDrawing) return true;
    bool ok = surface->line(last.x, last.y, p.x, p.y,
                            state.brushSize * p.pressure, state.color, StampMode::ERASE);
    last = p;
    return ok;
}
