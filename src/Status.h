#pragma once
#include <string>
#include "Gesture.h"
#include "Tools.h"

class StrokeController;
class GestureSession;
class PointerInput;

// Read-only snapshot for the UI. Nothing in here is ever written back.
struct Status {
    ToolType tool         = ToolType::PEN;
    Gesture  gesture      = Gesture::NONE;
    bool     strokeActive = false;
    float    pressure     = 1.f;
    float    velocity     = 0.f;   // px/s
    bool     handVisible  = false;
    float    cursorX = 0.f, cursorY = 0.f;
};

// session may be null when no gesture session is running.
Status makeStatus(const StrokeController& controller, const GestureSession* session,
                  const PointerInput& pointer);

// One-line summary used for the window title.
std::string formatStatus(const Status& s);
