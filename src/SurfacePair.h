#pragma once
#include <SDL2/SDL.h>
#include <map>
#include <vector>
#include <cstdint>

enum class StampMode { PEN, ERASE };

// Double-buffered canvas held in two GPU target textures.
//
// slots[front] is the authoritative image. A stroke seeds the other slot
// (the back buffer) from it once, layers its dabs there, and commit() makes
// the back slot authoritative by flipping the index. Nothing is ever copied
// back, and a half-drawn stroke is never treated as the real image.
class SurfacePair {
  public:
    SurfacePair() {}
    ~SurfacePair();

    // Allocates both targets. Fails if the renderer cannot render to
    // textures; the SDL error is logged and nothing is left allocated.
    bool init(SDL_Renderer* renderer, int w, int h, SDL_Color background);
    void destroy();
    bool isReady() const { return slots[0] != nullptr; }

    // ── Stroke lifecycle ──────────────────────────────────────────────────────
    bool seed();
    // Anti-aliased dab at (x,y). Off-surface or non-finite centres are
    // skipped and still count as success; false means the renderer failed.
    bool stamp(float x, float y, float radius, SDL_Color color, StampMode mode);
    // Dabs every `spacing` px from (x0,y0) to (x1,y1), both ends included.
    bool line(float x0, float y0, float x1, float y1, float radius, SDL_Color color, StampMode mode);
    void commit();
    void discard();
    bool isStrokeOpen() const { return strokeOpen; }

    // Draws background + current image to the renderer's default target.
    // dst = nullptr uses the output rect, or the whole output if none is set.
    bool present(const SDL_FRect* dst = nullptr);
    // Where discard, clear and resize re-present the image.
    void setOutputRect(const SDL_FRect& r) { outputRect = r; hasOutputRect = true; }
    bool clear();
    // Reallocates at the new size, keeping the top-left of the old image.
    bool resize(int w, int h);

    bool readFront(std::vector<uint32_t>& pixels);
    bool readBack (std::vector<uint32_t>& pixels);

    int  width()  const { return surfW; }
    int  height() const { return surfH; }
    float getStampSpacing() const  { return stampSpacing; }
    void  setStampSpacing(float s) { if (s > 0.f) stampSpacing = s; }
    SDL_Color getBackground() const { return background; }
    void setBackground(SDL_Color c) { background = c; }
    bool hasSoftEraser() const { return eraseBlendSupported; }

    SDL_Texture* frontTexture() const { return slots[front]; }
    SDL_Texture* backTexture()  const { return slots[1 - front]; }

  private:
    SDL_Renderer* renderer = nullptr;
    SDL_Texture*  slots[2] = {nullptr, nullptr};
    int           front    = 0;
    int           surfW = 0, surfH = 0;
    SDL_Color     background = {255, 255, 255, 255};
    float         stampSpacing = 2.f;
    bool          strokeOpen   = false;
    SDL_FRect     outputRect   = {0.f, 0.f, 0.f, 0.f};
    bool          hasOutputRect = false;

    // Keeps destination colour, scales destination alpha by (1 - src alpha).
    SDL_BlendMode eraseBlend = SDL_BLENDMODE_INVALID;
    bool          eraseBlendSupported = false;

    // Dab textures keyed by radius in half-pixel steps.
    std::map<int, SDL_Texture*> stampCache;

    SDL_Texture* createTarget(int w, int h);
    SDL_Texture* getStamp(float radius);
    bool fillTarget(SDL_Texture* target, SDL_Color c);
    bool readTexture(SDL_Texture* tex, std::vector<uint32_t>& pixels);
    void releaseStamps();

    template<typename F> bool withTarget(SDL_Texture* target, F f);
};
