#pragma once
#include <deque>
#include <string>
#include "Landmarks.h"
#include "Tools.h"

enum class Gesture { NONE, POINT, DRAW, PEACE, PALM, ROCK, THREE, TAP, FIST };

// Per-finger extension flags for one landmark set.
struct FingerState {
    bool thumb  = false;
    bool index  = false;
    bool middle = false;
    bool ring   = false;
    bool pinky  = false;

    int extendedCount() const {
        return (int)thumb + (int)index + (int)middle + (int)ring + (int)pinky;
    }
};

// Stateless hand pose classification over a fixed priority list.
namespace Gestures {
    // Wrist-to-thumb-tip distance above which the thumb counts as extended.
    constexpr float THUMB_EXTENDED_DIST = 0.1f;
    // Index/middle tip distance below which two fingers read as "draw" rather than "peace".
    constexpr float TWO_FINGER_CLOSE_DIST = 0.08f;

    FingerState fingerState(const LandmarkSet& lm);
    Gesture     classify(const LandmarkSet& lm);

    const char* toString(Gesture g);
    // Returns false and leaves `out` untouched for unknown names.
    bool        fromString(const std::string& name, Gesture& out);

    // Gestures that start or continue a stroke.
    bool        isDrawing(Gesture g);
    // Tool a drawing gesture asks for. Non-drawing gestures return PEN.
    ToolType    impliedTool(Gesture g);
}

// Debounces raw per-frame labels: the stable value is the latest label only
// when the whole window agrees, NONE otherwise.
class GestureStabilizer {
  public:
    explicit GestureStabilizer(int window = 1);

    // Feed one raw label; returns the stable gesture for this frame.
    Gesture push(Gesture raw);

    Gesture stable()  const { return current; }
    // True only on the frame where the stable value switched.
    bool    changed() const { return justChanged; }

    int  getWindow() const { return window; }
    void setWindow(int w);
    void reset();

  private:
    int                 window;
    std::deque<Gesture> history;
    Gesture             current     = Gesture::NONE;
    bool                justChanged = false;
};
