#include "Status.h"
#include "GestureSession.h"
#include "PointerInput.h"
#include "StrokeController.h"
#include <cstdio>

Status makeStatus(const StrokeController& controller, const GestureSession* session,
                  const PointerInput& pointer) {
    Status s;
    s.tool         = controller.getTool();
    s.strokeActive = controller.isDrawing();
    s.pressure     = pointer.isActive() ? pointer.getPressure() : 1.f;
    s.velocity     = pointer.getVelocity();
    if (session && session->isRunning()) {
        s.gesture     = session->getGesture();
        s.handVisible = session->isHandVisible();
        s.cursorX     = session->getCursorX();
        s.cursorY     = session->getCursorY();
    }
    return s;
}

std::string formatStatus(const Status& s) {
    char buf[160];
    snprintf(buf, sizeof(buf), "gPen | %s | gesture: %s%s | pressure %.2f%s",
             s.tool == ToolType::ERASER ? "eraser" : "pen",
             Gestures::toString(s.gesture),
             s.handVisible ? "" : " (no hand)",
             s.pressure,
             s.strokeActive ? " | drawing" : "");
    return buf;
}
