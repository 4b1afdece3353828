#pragma once
#include <SDL2/SDL.h>
#include <string>

// Minimum drawing area the window layer is allowed to hand us.
constexpr int MIN_CANVAS_W = 800;
constexpr int MIN_CANVAS_H = 600;

constexpr int MIN_BRUSH_SIZE = 1;
constexpr int MAX_BRUSH_SIZE = 50;

// Runtime configuration. Defaults match the behaviour of the hand-drawing
// pipeline out of the box; a YAML file may override any subset of keys.
struct Config {
    // Canvas
    int       canvasWidth  = 1200;
    int       canvasHeight = 800;
    SDL_Color background   = {255, 255, 255, 255};

    // Tool defaults
    int       brushSize = 5;
    SDL_Color color     = {0, 0, 0, 255};

    // Gesture pipeline
    int   stabilityWindow = 1;      // frames that must agree before a gesture is stable
    float smoothingFactor = 0.1f;   // fraction a raw point moves toward its target
    float stampSpacing    = 2.f;    // px between dabs along a segment
    bool  enableTapZones  = false;  // fire the tap callback for the thumbs-up pose

    // Pointer / touch
    int   pressureWindow    = 5;
    int   tapMaxMs          = 200;
    float tapMaxDistance    = 10.f;
    float palmContactRadius = 50.f;

    // Landmark replay
    std::string replayFile;
    bool        replayLoop = true;

    bool verbose = false;

    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;
    bool validate() const;
};
