#include "SurfacePair.h"
#include "DrawingUtils.h"
#include "Log.h"
#include <algorithm>
#include <cmath>

SurfacePair::~SurfacePair() {
    destroy();
}

// Helper: set render target, run f, restore whatever target was bound before.
template<typename F> bool SurfacePair::withTarget(SDL_Texture* target, F f) {
    SDL_Texture* prev = SDL_GetRenderTarget(renderer);
    if (SDL_SetRenderTarget(renderer, target) != 0) return false;
    bool ok = f();
    SDL_SetRenderTarget(renderer, prev);
    return ok;
}

SDL_Texture* SurfacePair::createTarget(int w, int h) {
    SDL_Texture* t = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                       SDL_TEXTUREACCESS_TARGET, w, h);
    if (t) SDL_SetTextureBlendMode(t, SDL_BLENDMODE_BLEND);
    return t;
}

bool SurfacePair::init(SDL_Renderer* r, int w, int h, SDL_Color bg) {
    destroy();
    if (!r || w <= 0 || h <= 0) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: invalid renderer or size %dx%d", w, h);
        return false;
    }
    if (!SDL_RenderTargetSupported(r)) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: renderer cannot render to textures");
        return false;
    }
    renderer   = r;
    background = bg;

    slots[0] = createTarget(w, h);
    slots[1] = createTarget(w, h);
    if (!slots[0] || !slots[1]) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: cannot create %dx%d target: %s", w, h, SDL_GetError());
        destroy();
        return false;
    }
    surfW = w;
    surfH = h;
    front = 0;

    // Alpha subtraction: colour is left alone, alpha scales by (1 - src alpha),
    // so erasing reveals whatever sits underneath instead of painting a colour.
    eraseBlend = SDL_ComposeCustomBlendMode(
        SDL_BLENDFACTOR_ZERO, SDL_BLENDFACTOR_ONE,                 SDL_BLENDOPERATION_ADD,
        SDL_BLENDFACTOR_ZERO, SDL_BLENDFACTOR_ONE_MINUS_SRC_ALPHA, SDL_BLENDOPERATION_ADD);
    SDL_Texture* probe = getStamp(1.f);
    if (!probe) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: cannot create stamp texture: %s", SDL_GetError());
        destroy();
        return false;
    }
    eraseBlendSupported = SDL_SetTextureBlendMode(probe, eraseBlend) == 0;
    SDL_SetTextureBlendMode(probe, SDL_BLENDMODE_BLEND);
    if (!eraseBlendSupported)
        SDL_LogInfo(GPEN_LOG_RENDER, "SurfacePair: custom blend modes unsupported, eraser uses hard-edged dabs");

    if (!clear()) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: initial clear failed: %s", SDL_GetError());
        destroy();
        return false;
    }
    SDL_LogInfo(GPEN_LOG_RENDER, "SurfacePair: %dx%d ready", w, h);
    return true;
}

void SurfacePair::destroy() {
    releaseStamps();
    for (SDL_Texture*& t : slots) {
        if (t) SDL_DestroyTexture(t);
        t = nullptr;
    }
    surfW = surfH = 0;
    front = 0;
    strokeOpen = false;
    eraseBlendSupported = false;
    renderer = nullptr;
}

void SurfacePair::releaseStamps() {
    for (auto& kv : stampCache) SDL_DestroyTexture(kv.second);
    stampCache.clear();
}

SDL_Texture* SurfacePair::getStamp(float radius) {
    int key = (int)std::lround(radius * 2.f);
    auto it = stampCache.find(key);
    if (it != stampCache.end()) return it->second;

    SDL_Surface* s = DrawingUtils::createStampSurface(key / 2.f);
    if (!s) return nullptr;
    SDL_Texture* t = SDL_CreateTextureFromSurface(renderer, s);
    SDL_FreeSurface(s);
    if (!t) return nullptr;
    stampCache[key] = t;
    return t;
}

bool SurfacePair::fillTarget(SDL_Texture* target, SDL_Color c) {
    return withTarget(target, [&]{
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
        return SDL_RenderClear(renderer) == 0;
    });
}

// ── Stroke lifecycle ──────────────────────────────────────────────────────────

bool SurfacePair::seed() {
    if (!isReady()) return false;
    bool ok = withTarget(backTexture(), [&]{
        SDL_SetTextureBlendMode(slots[front], SDL_BLENDMODE_NONE);
        int rc = SDL_RenderCopy(renderer, slots[front], nullptr, nullptr);
        SDL_SetTextureBlendMode(slots[front], SDL_BLENDMODE_BLEND);
        return rc == 0;
    });
    if (!ok) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: seed failed: %s", SDL_GetError());
        return false;
    }
    strokeOpen = true;
    return true;
}

bool SurfacePair::stamp(float x, float y, float radius, SDL_Color color, StampMode mode) {
    if (!isReady()) return false;
    if (!std::isfinite(x) || !std::isfinite(y) || x < 0.f || y < 0.f || x > surfW || y > surfH) {
        SDL_LogDebug(GPEN_LOG_RENDER, "stamp at (%.1f, %.1f) is off the surface, skipped", x, y);
        return true;
    }
    radius = std::max(0.5f, radius);

    bool ok = withTarget(backTexture(), [&]{
        if (mode == StampMode::ERASE && !eraseBlendSupported) {
            // Same trick as a plain eraser brush: overwrite with zero alpha.
            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
            SDL_SetRenderDrawColor(renderer, background.r, background.g, background.b, 0);
            DrawingUtils::drawFillCircle(renderer, (int)std::lround(x), (int)std::lround(y),
                                         (int)std::lround(radius));
            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
            return true;
        }

        SDL_Texture* dab = getStamp(radius);
        if (!dab) return false;
        int side = 0;
        SDL_QueryTexture(dab, nullptr, nullptr, &side, nullptr);
        SDL_FRect dst = { x - side / 2.f, y - side / 2.f, (float)side, (float)side };

        if (mode == StampMode::PEN) {
            SDL_SetTextureBlendMode(dab, SDL_BLENDMODE_BLEND);
            SDL_SetTextureColorMod(dab, color.r, color.g, color.b);
            SDL_SetTextureAlphaMod(dab, color.a);
        } else {
            SDL_SetTextureBlendMode(dab, eraseBlend);
            SDL_SetTextureColorMod(dab, 255, 255, 255);
            SDL_SetTextureAlphaMod(dab, 255);
        }
        return SDL_RenderCopyF(renderer, dab, nullptr, &dst) == 0;
    });
    if (!ok) SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: stamp failed: %s", SDL_GetError());
    return ok;
}

bool SurfacePair::line(float x0, float y0, float x1, float y1, float radius,
                       SDL_Color color, StampMode mode) {
    if (!std::isfinite(x0) || !std::isfinite(y0) || !std::isfinite(x1) || !std::isfinite(y1)) {
        SDL_LogDebug(GPEN_LOG_RENDER, "segment with non-finite end point skipped");
        return true;
    }
    float dx = x1 - x0, dy = y1 - y0;
    float dist = std::sqrt(dx * dx + dy * dy);
    int steps = std::max(1, (int)std::floor(dist / stampSpacing));
    for (int i = 0; i <= steps; i++) {
        float t = (float)i / steps;
        if (!stamp(x0 + dx * t, y0 + dy * t, radius, color, mode)) return false;
    }
    return true;
}

void SurfacePair::commit() {
    if (!strokeOpen) return;
    front = 1 - front;
    strokeOpen = false;
}

void SurfacePair::discard() {
    if (!strokeOpen) return;
    strokeOpen = false;
    present();
}

// ── Output ────────────────────────────────────────────────────────────────────

bool SurfacePair::present(const SDL_FRect* dst) {
    if (!isReady()) return false;
    if (!dst && hasOutputRect) dst = &outputRect;
    SDL_Texture* src  = strokeOpen ? backTexture() : frontTexture();
    SDL_Texture* prev = SDL_GetRenderTarget(renderer);
    if (SDL_SetRenderTarget(renderer, nullptr) != 0) return false;

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer, background.r, background.g, background.b, 255);
    int rc = dst ? SDL_RenderFillRectF(renderer, dst) : SDL_RenderFillRect(renderer, nullptr);
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    if (rc == 0) rc = SDL_RenderCopyF(renderer, src, nullptr, dst);

    SDL_SetRenderTarget(renderer, prev);
    if (rc != 0) SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: present failed: %s", SDL_GetError());
    return rc == 0;
}

bool SurfacePair::clear() {
    if (!isReady()) return false;
    SDL_Color opaque = { background.r, background.g, background.b, 255 };
    bool ok = fillTarget(slots[0], opaque) && fillTarget(slots[1], opaque);
    strokeOpen = false;
    return ok && present();
}

bool SurfacePair::resize(int w, int h) {
    if (!isReady() || w <= 0 || h <= 0) return false;
    if (w == surfW && h == surfH) return true;
    if (strokeOpen) commit();

    SDL_Texture* oldFront = slots[front];
    SDL_Texture* oldBack  = slots[1 - front];
    int oldW = surfW, oldH = surfH;

    SDL_Texture* a = createTarget(w, h);
    SDL_Texture* b = createTarget(w, h);
    if (!a || !b) {
        SDL_LogError(GPEN_LOG_RENDER, "SurfacePair: cannot reallocate at %dx%d: %s", w, h, SDL_GetError());
        if (a) SDL_DestroyTexture(a);
        if (b) SDL_DestroyTexture(b);
        return false;
    }
    slots[0] = a;
    slots[1] = b;
    front = 0;
    surfW = w;
    surfH = h;

    SDL_Color opaque = { background.r, background.g, background.b, 255 };
    bool ok = fillTarget(a, opaque) && fillTarget(b, opaque);

    // Crop / pad: old pixels keep their position, new area is background.
    bool reseeded = ok && withTarget(a, [&]{
        SDL_Rect r = { 0, 0, std::min(oldW, w), std::min(oldH, h) };
        SDL_SetTextureBlendMode(oldFront, SDL_BLENDMODE_NONE);
        return SDL_RenderCopy(renderer, oldFront, &r, &r) == 0;
    });
    if (!reseeded) {
        SDL_LogWarn(GPEN_LOG_RENDER, "SurfacePair: previous image lost on resize, canvas cleared");
        ok = fillTarget(a, opaque);
    }
    SDL_DestroyTexture(oldFront);
    SDL_DestroyTexture(oldBack);

    SDL_LogInfo(GPEN_LOG_RENDER, "SurfacePair: resized %dx%d -> %dx%d", oldW, oldH, w, h);
    return ok && present();
}

// ── Readback ──────────────────────────────────────────────────────────────────

bool SurfacePair::readTexture(SDL_Texture* tex, std::vector<uint32_t>& pixels) {
    if (!isReady()) return false;
    pixels.resize((size_t)surfW * surfH);
    return withTarget(tex, [&]{
        return SDL_RenderReadPixels(renderer, nullptr, SDL_PIXELFORMAT_ARGB8888,
                                    pixels.data(), surfW * 4) == 0;
    });
}

bool SurfacePair::readFront(std::vector<uint32_t>& pixels) { return readTexture(frontTexture(), pixels); }
bool SurfacePair::readBack (std::vector<uint32_t>& pixels) { return readTexture(backTexture(),  pixels); }
