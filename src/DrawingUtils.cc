#include <cmath>
#include <algorithm>

#include "DrawingUtils.h"

namespace DrawingUtils {

// ── Drawing primitives ────────────────────────────────────────────────────────

    void drawFillCircle(SDL_Renderer* renderer, int centerX, int centerY, int radius) {
        if (radius <= 0) {
            SDL_RenderDrawPoint(renderer, centerX, centerY);
            return;
        }
        for (int h = -radius; h <= radius; h++) {
            int half = (int)std::sqrt((float)(radius * radius - h * h));
            SDL_RenderDrawLine(renderer, centerX - half, centerY + h, centerX + half, centerY + h);
        }
    }

    float smoothstep(float edge0, float edge1, float x) {
        float t = std::max(0.f, std::min(1.f, (x - edge0) / (edge1 - edge0)));
        return t * t * (3.f - 2.f * t);
    }

// ── Stamp masks ───────────────────────────────────────────────────────────────

    SDL_Surface* createStampSurface(float radius) {
        int side = 2 * (int)std::ceil(radius + 1.f);
        SDL_Surface* s = SDL_CreateRGBSurfaceWithFormat(0, side, side, 32, SDL_PIXELFORMAT_ARGB8888);
        if (!s) return nullptr;

        float c = side / 2.f;
        SDL_LockSurface(s);
        for (int y = 0; y < side; y++) {
            uint32_t* row = (uint32_t*)((uint8_t*)s->pixels + y * s->pitch);
            for (int x = 0; x < side; x++) {
                // Sample at pixel centres.
                float dx = x + 0.5f - c, dy = y + 0.5f - c;
                float d  = std::sqrt(dx * dx + dy * dy);
                float a  = 1.f - smoothstep(radius - 1.f, radius + 1.f, d);
                uint32_t alpha = (uint32_t)std::lround(a * 255.f);
                row[x] = (alpha << 24) | 0x00FFFFFFu;
            }
        }
        SDL_UnlockSurface(s);
        return s;
    }
}
