#pragma once
#include <SDL2/SDL.h>
#include <memory>
#include <string>
#include "Config.h"
#include "GestureSession.h"
#include "Landmarks.h"
#include "PointerInput.h"
#include "Status.h"
#include "StrokeController.h"
#include "SurfacePair.h"
#include "Tools.h"

class gPen : public ICoordinateMapper {
  public:
    explicit gPen(const Config& config);
    ~gPen();

    // Creates the window, renderer and canvas surfaces. False (with the SDL
    // error logged) when any of them is unavailable.
    bool init();
    void run();

    // Hand frames come from here while a gesture session runs.
    void setLandmarkProvider(std::unique_ptr<ILandmarkProvider> p);

    Status getStatus() const;

    // ICoordinateMapper interface
    void getCanvasCoords(int winX, int winY, int* cX, int* cY) override;
    void getCanvasSize(int* w, int* h) override { *w = surfaces.width(); *h = surfaces.height(); }

  private:
    Config        config;
    SDL_Window*   window   = nullptr;
    SDL_Renderer* renderer = nullptr;
    bool          sdlReady = false;

    SurfacePair      surfaces;
    StrokeController controller;
    PointerInput     pointer;

    std::unique_ptr<ILandmarkProvider> provider;
    std::unique_ptr<GestureSession>    session;
    Uint32 lastFrameTicks = 0;

    std::string lastTitle;

    static constexpr int    GAP            = 24;   // window margin around the fitted canvas
    static constexpr Uint32 FRAME_INTERVAL = 33;   // ms between landmark polls

    SDL_Rect  getFitViewport();
    SDL_FRect getViewportF();

    void startSession();
    void stopSession();
    void toggleSession();
    bool pollLandmarks();

    void onKey(const SDL_Keysym& key);
    void onFocusLost();
    void resizeCanvasToWindow();

    PointerSample mouseSample(int winX, int winY, Uint32 timestamp);
    PointerSample touchSample(const SDL_TouchFingerEvent& f);

    void drawHandCursor();
    void updateTitle();
};
