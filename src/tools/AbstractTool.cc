#include "Tools.h"

bool AbstractTool::onStrokeBegin(const StrokePoint& p, const ToolState& /*state*/) {
    isDrawing = true;
    start = last = p;
    return true;
}

bool AbstractTool::onStrokeMove(const StrokePoint& p, const ToolState& /*state*/) {
    if (isDrawing) last = p;
    return true;
}

void AbstractTool::onStrokeEnd() {
    isDrawing = false;
}
