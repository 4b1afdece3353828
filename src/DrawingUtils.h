#pragma once

#include <SDL2/SDL.h>

// Shared Drawing Helpers
namespace DrawingUtils {
    // Hard-edged filled disc in the current draw color and blend mode.
    void drawFillCircle(SDL_Renderer* renderer, int centerX, int centerY, int radius);

    // White ARGB8888 dab whose alpha falls off as 1 - smoothstep(r-1, r+1, d)
    // from the centre. The surface is square with side 2*ceil(r+1); the disc
    // centre sits in the middle of it. Caller owns the returned surface.
    SDL_Surface* createStampSurface(float radius);

    float smoothstep(float edge0, float edge1, float x);
}
