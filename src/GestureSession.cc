#include "GestureSession.h"
#include "CoordinateMapper.h"
#include "StrokeController.h"
#include "SurfacePair.h"
#include "Log.h"

GestureSession::GestureSession(StrokeController* c, SurfacePair* s, int stabilityWindow)
    : controller(c), surface(s), stabilizer(stabilityWindow) {}

GestureSession::~GestureSession() {
    if (running) stop();
}

void GestureSession::start() {
    if (running) return;
    stabilizer.reset();
    rawGesture  = Gesture::NONE;
    handVisible = false;
    running     = true;
    SDL_LogInfo(GPEN_LOG_GESTURE, "gesture session started (stability window %d)", stabilizer.getWindow());
}

void GestureSession::stop() {
    if (!running) return;
    endGestureStroke();
    stabilizer.reset();
    rawGesture  = Gesture::NONE;
    handVisible = false;
    running     = false;
    SDL_LogInfo(GPEN_LOG_GESTURE, "gesture session stopped");
}

bool GestureSession::ownsStroke() const {
    return gestureStroke && controller->isDrawing() && controller->getStrokeId() == strokeId;
}

void GestureSession::endGestureStroke() {
    if (ownsStroke()) controller->endStroke();
    gestureStroke = false;
}

void GestureSession::onHandLost() {
    if (handVisible) SDL_LogInfo(GPEN_LOG_GESTURE, "hand lost");
    handVisible = false;
    rawGesture  = Gesture::NONE;
    stabilizer.reset();
    endGestureStroke();
}

void GestureSession::processFrame(const HandFrame& frame) {
    if (!running) return;
    if (!frame.hasHand) {
        onHandLost();
        return;
    }
    if (!frame.isWellFormed()) {
        SDL_LogWarn(GPEN_LOG_GESTURE, "malformed landmark frame (%d points), dropped", frame.pointCount);
        return;
    }
    if (!handVisible) SDL_LogInfo(GPEN_LOG_GESTURE, "hand detected");
    handVisible = true;

    const Landmark& tip = frame.landmarks[LM::INDEX_TIP];
    LandmarkMapper::toSurface(tip.x, tip.y, screenRect.w, screenRect.h, &cursorX, &cursorY);
    cursorX += screenRect.x;
    cursorY += screenRect.y;

    rawGesture = Gestures::classify(frame.landmarks);
    Gesture g  = stabilizer.push(rawGesture);
    if (stabilizer.changed()) onGestureChanged(g);

    if (!Gestures::isDrawing(g)) return;

    float cx, cy;
    LandmarkMapper::toSurface(tip.x, tip.y, (float)surface->width(), (float)surface->height(), &cx, &cy);
    if (!controller->isDrawing()) {
        controller->applyGestureTool(Gestures::impliedTool(g));
        gestureStroke = controller->beginStroke(cx, cy);
        strokeId      = controller->getStrokeId();
    } else if (ownsStroke()) {
        controller->continueStroke(cx, cy);
    }
}

void GestureSession::onGestureChanged(Gesture g) {
    SDL_LogInfo(GPEN_LOG_GESTURE, "gesture: %s", Gestures::toString(g));
    switch (g) {
        case Gesture::POINT:
        case Gesture::DRAW:
        case Gesture::PEACE:
        case Gesture::PALM:
        case Gesture::THREE:
            // Tool follows the gesture; a different tool restarts the stroke in place.
            if (ownsStroke()) controller->applyGestureTool(Gestures::impliedTool(g));
            break;
        case Gesture::TAP:
            endGestureStroke();
            if (tapZones && onTap) onTap(cursorX, cursorY);
            break;
        case Gesture::NONE:
        case Gesture::ROCK:
        case Gesture::FIST:
            endGestureStroke();
            break;
    }
}
