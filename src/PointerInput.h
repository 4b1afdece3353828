#pragma once
#include <SDL2/SDL.h>
#include <deque>
#include <functional>

class StrokeController;

// One pointer or touch sample in canvas pixels. force and contactRadius are
// 0 when the device does not report them.
struct PointerSample {
    SDL_FingerID id = 0;
    float  x = 0.f, y = 0.f;
    Uint32 timestamp = 0;        // ms
    float  force = 0.f;          // [0,1]
    float  contactRadius = 0.f;  // px, mean of the contact ellipse radii
};

// Direct mouse / touch input. Bypasses the gesture classifier and drives the
// stroke controller itself, deriving pressure from force or contact size.
class PointerInput {
  public:
    explicit PointerInput(StrokeController* controller);

    // Returns false if the sample was ignored (second pointer, no stroke).
    bool down(const PointerSample& s);
    bool move(const PointerSample& s);
    void up  (const PointerSample& s);
    // Drops the active pointer and commits its stroke; no tap is reported.
    void release();
    // Drops the active pointer and discards its stroke.
    void cancel();

    bool  isActive()    const { return active; }
    float getPressure() const { return pressure; }
    // px/s, magnitude of the last velocity estimate.
    float getVelocity() const;

    void setPressureWindow(int n) { if (n >= 1) pressureWindow = n; }
    void setTapThresholds(Uint32 maxMs, float maxDistance) { tapMaxMs = maxMs; tapMaxDistance = maxDistance; }
    void setPalmContactRadius(float r) { if (r > 0.f) palmContactRadius = r; }
    void setTapCallback(std::function<void(float, float)> cb) { onTap = cb; }

  private:
    StrokeController* controller;

    bool         active = false;
    SDL_FingerID activeId = 0;
    float        startX = 0.f, startY = 0.f;
    Uint32       startTime = 0, lastMoveTime = 0;
    float        velX = 0.f, velY = 0.f;
    float        pressure = 1.f;

    std::deque<float> pressureHistory;
    int    pressureWindow    = 5;
    Uint32 tapMaxMs          = 200;
    float  tapMaxDistance    = 10.f;
    float  palmContactRadius = 50.f;

    std::function<void(float, float)> onTap;

    float estimatePressure(const PointerSample& s);
    void  updateVelocity(const PointerSample& s);
    void  reset();
};
