#pragma once
#include <SDL2/SDL.h>

// Application log categories. Everything goes through SDL's logger so the
// output format and priority filtering match the rest of the SDL stack.
enum {
    GPEN_LOG_APP = SDL_LOG_CATEGORY_CUSTOM,
    GPEN_LOG_GESTURE,
    GPEN_LOG_RENDER,
    GPEN_LOG_INPUT
};

namespace Log {
    // INFO for all gPen categories, or DEBUG when verbose.
    inline void setVerbose(bool verbose) {
        SDL_LogPriority p = verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_INFO;
        SDL_LogSetPriority(GPEN_LOG_APP,     p);
        SDL_LogSetPriority(GPEN_LOG_GESTURE, p);
        SDL_LogSetPriority(GPEN_LOG_RENDER,  p);
        SDL_LogSetPriority(GPEN_LOG_INPUT,   p);
    }
}
