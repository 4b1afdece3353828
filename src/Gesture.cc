#include "Gesture.h"
#include "Log.h"
#include <algorithm>
#include <cmath>

static float distance2D(const Landmark& a, const Landmark& b) {
    float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Tip above its PIP joint in image space (smaller y) means extended.
static bool isFingerUp(const LandmarkSet& lm, int tip, int pip) {
    return lm[tip].y < lm[pip].y;
}

namespace Gestures {

FingerState fingerState(const LandmarkSet& lm) {
    FingerState f;
    f.index  = isFingerUp(lm, LM::INDEX_TIP,  LM::INDEX_PIP);
    f.middle = isFingerUp(lm, LM::MIDDLE_TIP, LM::MIDDLE_PIP);
    f.ring   = isFingerUp(lm, LM::RING_TIP,   LM::RING_PIP);
    f.pinky  = isFingerUp(lm, LM::PINKY_TIP,  LM::PINKY_PIP);
    // The thumb folds sideways, so vertical ordering says nothing about it.
    f.thumb  = distance2D(lm[LM::WRIST], lm[LM::THUMB_TIP]) > THUMB_EXTENDED_DIST;
    return f;
}

Gesture classify(const LandmarkSet& lm) {
    FingerState f = fingerState(lm);
    int count = f.extendedCount();
    float fingerDistance = distance2D(lm[LM::INDEX_TIP], lm[LM::MIDDLE_TIP]);

    SDL_LogDebug(GPEN_LOG_GESTURE, "fingers T:%d I:%d M:%d R:%d P:%d = %d",
                 f.thumb, f.index, f.middle, f.ring, f.pinky, count);

    // First match wins; order matters.
    if (count >= 4)
        return Gesture::PALM;
    if (count == 1 && f.index)
        return Gesture::POINT;
    if (count == 2 && f.index && f.middle)
        return fingerDistance < TWO_FINGER_CLOSE_DIST ? Gesture::DRAW : Gesture::PEACE;
    if (count == 3 && f.index && f.pinky && f.thumb)
        return Gesture::ROCK;
    if (count == 3 && f.index && f.middle && f.ring)
        return Gesture::THREE;
    if (count == 1 && f.thumb && !f.index)
        return Gesture::TAP;
    if (f.index)
        return Gesture::POINT;
    return Gesture::NONE;
}

const char* toString(Gesture g) {
    switch (g) {
        case Gesture::NONE:  return "none";
        case Gesture::POINT: return "point";
        case Gesture::DRAW:  return "draw";
        case Gesture::PEACE: return "peace";
        case Gesture::PALM:  return "palm";
        case Gesture::ROCK:  return "rock";
        case Gesture::THREE: return "three";
        case Gesture::TAP:   return "tap";
        case Gesture::FIST:  return "fist";
    }
    return "none";
}

bool fromString(const std::string& name, Gesture& out) {
    static const Gesture all[] = {
        Gesture::NONE, Gesture::POINT, Gesture::DRAW, Gesture::PEACE, Gesture::PALM,
        Gesture::ROCK, Gesture::THREE, Gesture::TAP,  Gesture::FIST
    };
    for (Gesture g : all) {
        if (name == toString(g)) { out = g; return true; }
    }
    return false;
}

bool isDrawing(Gesture g) {
    switch (g) {
        case Gesture::POINT:
        case Gesture::DRAW:
        case Gesture::PEACE:
        case Gesture::PALM:
        case Gesture::THREE:
            return true;
        case Gesture::NONE:
        case Gesture::ROCK:
        case Gesture::TAP:
        case Gesture::FIST:
            return false;
    }
    return false;
}

ToolType impliedTool(Gesture g) {
    return g == Gesture::PALM ? ToolType::ERASER : ToolType::PEN;
}

} // namespace Gestures

// ── GestureStabilizer ─────────────────────────────────────────────────────────

GestureStabilizer::GestureStabilizer(int w) : window(std::max(1, w)) {}

Gesture GestureStabilizer::push(Gesture raw) {
    history.push_back(raw);
    while ((int)history.size() > window) history.pop_front();

    Gesture next = Gesture::NONE;
    if ((int)history.size() == window &&
        std::all_of(history.begin(), history.end(), [&](Gesture g) { return g == raw; }))
        next = raw;

    justChanged = next != current;
    if (justChanged)
        SDL_LogDebug(GPEN_LOG_GESTURE, "stable gesture %s -> %s",
                     Gestures::toString(current), Gestures::toString(next));
    current = next;
    return current;
}

void GestureStabilizer::setWindow(int w) {
    window = std::max(1, w);
    while ((int)history.size() > window) history.pop_front();
}

void GestureStabilizer::reset() {
    history.clear();
    justChanged = current != Gesture::NONE;
    current = Gesture::NONE;
}
