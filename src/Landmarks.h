#pragma once
#include <array>
#include <cmath>

// MediaPipe-style 21 point hand skeleton. Coordinates are normalized to the
// camera frame: x,y in [0,1], origin top-left, y pointing down.
struct Landmark {
    float x = 0.f, y = 0.f, z = 0.f;
};

constexpr int LANDMARK_COUNT = 21;

namespace LM {
    constexpr int WRIST      = 0;
    constexpr int THUMB_CMC  = 1;
    constexpr int THUMB_MCP  = 2;
    constexpr int THUMB_IP   = 3;
    constexpr int THUMB_TIP  = 4;
    constexpr int INDEX_MCP  = 5;
    constexpr int INDEX_PIP  = 6;
    constexpr int INDEX_DIP  = 7;
    constexpr int INDEX_TIP  = 8;
    constexpr int MIDDLE_MCP = 9;
    constexpr int MIDDLE_PIP = 10;
    constexpr int MIDDLE_DIP = 11;
    constexpr int MIDDLE_TIP = 12;
    constexpr int RING_MCP   = 13;
    constexpr int RING_PIP   = 14;
    constexpr int RING_DIP   = 15;
    constexpr int RING_TIP   = 16;
    constexpr int PINKY_MCP  = 17;
    constexpr int PINKY_PIP  = 18;
    constexpr int PINKY_DIP  = 19;
    constexpr int PINKY_TIP  = 20;
}

// One frame's worth of landmarks. Built once, then only read.
class LandmarkSet {
  public:
    LandmarkSet() {}
    explicit LandmarkSet(const std::array<Landmark, LANDMARK_COUNT>& pts) : points(pts) {}

    const Landmark& operator[](int i) const { return points[i]; }
    const std::array<Landmark, LANDMARK_COUNT>& all() const { return points; }

    // False if any x/y is NaN or infinite.
    bool isFinite() const {
        for (const Landmark& p : points)
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
        return true;
    }

  private:
    std::array<Landmark, LANDMARK_COUNT> points;
};

enum class Handedness { UNKNOWN, LEFT, RIGHT };

// What the landmark provider hands over per frame: no hand, or exactly one.
// pointCount is what the tracker actually produced; anything other than
// LANDMARK_COUNT marks the frame as malformed.
struct HandFrame {
    bool        hasHand    = false;
    int         pointCount = 0;
    LandmarkSet landmarks;
    Handedness  handedness = Handedness::UNKNOWN;
    float       confidence = 0.f;

    bool isWellFormed() const { return pointCount == LANDMARK_COUNT && landmarks.isFinite(); }

    static HandFrame none() { return HandFrame(); }
    static HandFrame hand(const LandmarkSet& set, Handedness h = Handedness::UNKNOWN, float conf = 1.f) {
        HandFrame f;
        f.hasHand    = true;
        f.pointCount = LANDMARK_COUNT;
        f.landmarks  = set;
        f.handedness = h;
        f.confidence = conf;
        return f;
    }
};

// Source of hand frames (camera tracker, recorded replay, ...).
class ILandmarkProvider {
  public:
    virtual ~ILandmarkProvider() {}
    // Returns true when a new frame was written to `out`.
    virtual bool poll(HandFrame& out) = 0;
};
