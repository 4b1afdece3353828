#pragma once
#include <SDL2/SDL.h>
#include <functional>
#include "Gesture.h"
#include "Landmarks.h"

class StrokeController;
class SurfacePair;

// Camera-path state for one active session: stabilizer, current gesture,
// hand cursor and the stroke it started. The owner calls processFrame()
// once per landmark frame while the session is running.
class GestureSession {
  public:
    GestureSession(StrokeController* controller, SurfacePair* surface, int stabilityWindow = 1);
    ~GestureSession();

    void start();
    // Ends any gesture stroke and forgets all per-session state.
    void stop();
    bool isRunning() const { return running; }

    void processFrame(const HandFrame& frame);

    // Rectangle (window coordinates) the hand cursor is mapped onto.
    void setScreenRect(const SDL_FRect& r) { screenRect = r; }
    void setStabilityWindow(int w) { stabilizer.setWindow(w); }
    void setTapZonesEnabled(bool on) { tapZones = on; }
    void setTapCallback(std::function<void(float, float)> cb) { onTap = cb; }

    Gesture getGesture()    const { return stabilizer.stable(); }
    Gesture getRawGesture() const { return rawGesture; }
    bool    isHandVisible() const { return handVisible; }
    float   getCursorX()    const { return cursorX; }
    float   getCursorY()    const { return cursorY; }
    // True while the controller's open stroke was started by this session.
    bool    ownsStroke() const;

  private:
    StrokeController* controller;
    SurfacePair*      surface;
    GestureStabilizer stabilizer;

    bool      running       = false;
    bool      handVisible   = false;
    bool      gestureStroke = false;
    unsigned  strokeId      = 0;
    bool      tapZones      = false;
    Gesture   rawGesture    = Gesture::NONE;
    float     cursorX = 0.f, cursorY = 0.f;
    SDL_FRect screenRect = {0.f, 0.f, 0.f, 0.f};

    std::function<void(float, float)> onTap;

    void onHandLost();
    void onGestureChanged(Gesture g);
    void endGestureStroke();
};
