#include "gPen.h"
#include "DrawingUtils.h"
#include "Log.h"
#include <algorithm>
#include <cmath>

// Number keys 1-9 pick from this palette.
static const SDL_Color PALETTE[9] = {
    {  0,   0,   0, 255},   // black
    {231,  76,  60, 255},   // red
    {230, 126,  34, 255},   // orange
    {241, 196,  15, 255},   // yellow
    { 46, 204, 113, 255},   // green
    { 52, 152, 219, 255},   // blue
    {155,  89, 182, 255},   // purple
    {236, 112, 160, 255},   // pink
    {127, 140, 141, 255},   // gray
};

// ─────────────────────────────────────────────────────────────────────────────

gPen::gPen(const Config& cfg)
    : config(cfg), controller(&surfaces), pointer(&controller) {
    controller.setColor(config.color.r, config.color.g, config.color.b);
    controller.setBrushSize(config.brushSize);
    controller.setSmoothingFactor(config.smoothingFactor);

    pointer.setPressureWindow(config.pressureWindow);
    pointer.setTapThresholds((Uint32)config.tapMaxMs, config.tapMaxDistance);
    pointer.setPalmContactRadius(config.palmContactRadius);
    pointer.setTapCallback([](float x, float y) {
        SDL_LogInfo(GPEN_LOG_INPUT, "tap at (%.0f, %.0f)", x, y);
    });
}

gPen::~gPen() {
    session.reset();
    surfaces.destroy();
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window)   SDL_DestroyWindow(window);
    if (sdlReady) SDL_Quit();
}

bool gPen::init() {
    // Touch must not also arrive as synthetic mouse input; fingers are handled directly.
    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        SDL_LogError(GPEN_LOG_APP, "SDL_Init failed: %s", SDL_GetError());
        return false;
    }
    sdlReady = true;
    Log::setVerbose(config.verbose);
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");

    window = SDL_CreateWindow("gPen", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              config.canvasWidth, config.canvasHeight,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(GPEN_LOG_APP, "cannot create window: %s", SDL_GetError());
        return false;
    }
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE);
    if (!renderer) {
        SDL_LogError(GPEN_LOG_APP, "cannot create renderer: %s", SDL_GetError());
        return false;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    if (!surfaces.init(renderer, config.canvasWidth, config.canvasHeight, config.background)) {
        SDL_LogError(GPEN_LOG_APP, "drawing surfaces unavailable: %s", SDL_GetError());
        return false;
    }
    surfaces.setStampSpacing(config.stampSpacing);

    SDL_LogInfo(GPEN_LOG_APP, "canvas %dx%d, brush %d", surfaces.width(), surfaces.height(),
                controller.getBrushSize());
    return true;
}

void gPen::setLandmarkProvider(std::unique_ptr<ILandmarkProvider> p) {
    stopSession();
    provider = std::move(p);
}

Status gPen::getStatus() const {
    return makeStatus(controller, session.get(), pointer);
}

// ── Viewport ──────────────────────────────────────────────────────────────────

SDL_Rect gPen::getFitViewport() {
    int winW, winH;
    SDL_GetWindowSize(window, &winW, &winH);
    int canvasW = surfaces.width(), canvasH = surfaces.height();
    int fitW = std::max(1, winW - GAP * 2);
    int fitH = std::max(1, winH - GAP * 2);
    float canvasAspect = (float)canvasW / canvasH;
    float windowAspect = (float)fitW / fitH;
    SDL_Rect v;
    if (windowAspect > canvasAspect) {
        v.h = fitH; v.w = (int)(fitH * canvasAspect);
        v.x = GAP + (fitW - v.w) / 2; v.y = GAP;
    } else {
        v.w = fitW; v.h = (int)(fitW / canvasAspect);
        v.x = GAP; v.y = GAP + (fitH - v.h) / 2;
    }
    return v;
}

SDL_FRect gPen::getViewportF() {
    SDL_Rect fit = getFitViewport();
    return { (float)fit.x, (float)fit.y, (float)fit.w, (float)fit.h };
}

// ── ICoordinateMapper ─────────────────────────────────────────────────────────

void gPen::getCanvasCoords(int winX, int winY, int* cX, int* cY) {
    SDL_FRect v = getViewportF();
    *cX = (int)std::floor((winX - v.x) * ((float)surfaces.width()  / v.w));
    *cY = (int)std::floor((winY - v.y) * ((float)surfaces.height() / v.h));
}

PointerSample gPen::mouseSample(int winX, int winY, Uint32 timestamp) {
    int cX, cY;
    getCanvasCoords(winX, winY, &cX, &cY);
    PointerSample s;
    s.id        = -1;
    s.x         = (float)cX;
    s.y         = (float)cY;
    s.timestamp = timestamp;
    return s;
}

PointerSample gPen::touchSample(const SDL_TouchFingerEvent& f) {
    int winW, winH;
    SDL_GetWindowSize(window, &winW, &winH);
    int cX, cY;
    getCanvasCoords((int)(f.x * winW), (int)(f.y * winH), &cX, &cY);
    PointerSample s;
    s.id        = f.fingerId;
    s.x         = (float)cX;
    s.y         = (float)cY;
    s.timestamp = f.timestamp;
    s.force     = f.pressure;
    // SDL2 finger events carry no contact size; contactRadius stays 0.
    return s;
}

// ── Gesture session ───────────────────────────────────────────────────────────

void gPen::startSession() {
    if (!provider) {
        SDL_LogWarn(GPEN_LOG_GESTURE, "no landmark source, gesture input unavailable");
        return;
    }
    if (session) return;
    session = std::make_unique<GestureSession>(&controller, &surfaces, config.stabilityWindow);
    session->setTapZonesEnabled(config.enableTapZones);
    session->setTapCallback([](float x, float y) {
        SDL_LogInfo(GPEN_LOG_GESTURE, "tap gesture at (%.0f, %.0f)", x, y);
    });
    session->start();
    lastFrameTicks = 0;
}

void gPen::stopSession() {
    if (!session) return;
    session->stop();
    session.reset();
}

void gPen::toggleSession() {
    if (session) stopSession();
    else         startSession();
}

// One provider frame per FRAME_INTERVAL. Returns true if a frame was processed.
bool gPen::pollLandmarks() {
    if (!session || !provider) return false;
    Uint32 now = SDL_GetTicks();
    if (lastFrameTicks != 0 && now - lastFrameTicks < FRAME_INTERVAL) return false;
    lastFrameTicks = now;

    HandFrame frame;
    if (!provider->poll(frame)) return false;
    session->setScreenRect(getViewportF());
    session->processFrame(frame);
    return true;
}

// ── Input ─────────────────────────────────────────────────────────────────────

void gPen::onKey(const SDL_Keysym& key) {
    switch (key.sym) {
        case SDLK_p: controller.setTool(ToolType::PEN);    break;
        case SDLK_e: controller.setTool(ToolType::ERASER); break;
        case SDLK_c:
            if (key.mod & (KMOD_GUI | KMOD_CTRL)) break;
            pointer.cancel();
            controller.cancelStroke();
            surfaces.clear();
            SDL_LogInfo(GPEN_LOG_APP, "canvas cleared");
            break;
        case SDLK_LEFTBRACKET:  controller.adjustBrushSize(-1); break;
        case SDLK_RIGHTBRACKET: controller.adjustBrushSize(+1); break;
        case SDLK_ESCAPE:
            pointer.release();
            controller.endStroke();
            break;
        case SDLK_g: toggleSession(); break;
        default:
            if (key.sym >= SDLK_1 && key.sym <= SDLK_9) {
                SDL_Color c = PALETTE[key.sym - SDLK_1];
                controller.setColor(c.r, c.g, c.b);
            }
            break;
    }
}

// Any open stroke is committed; a half-finished pointer drag never resumes.
void gPen::onFocusLost() {
    pointer.release();
    controller.endStroke();
}

void gPen::resizeCanvasToWindow() {
    int winW, winH;
    SDL_GetWindowSize(window, &winW, &winH);
    int w = std::max(MIN_CANVAS_W, winW - GAP * 2);
    int h = std::max(MIN_CANVAS_H, winH - GAP * 2);
    if (w == surfaces.width() && h == surfaces.height()) return;
    pointer.release();
    controller.endStroke();
    if (!surfaces.resize(w, h))
        SDL_LogError(GPEN_LOG_RENDER, "canvas resize to %dx%d failed", w, h);
}

// ── Rendering ─────────────────────────────────────────────────────────────────

void gPen::drawHandCursor() {
    if (!session || !session->isHandVisible()) return;
    int cx = (int)std::lround(session->getCursorX());
    int cy = (int)std::lround(session->getCursorY());
    int r  = std::max(4, controller.getBrushSize());

    SDL_Color ring = controller.getTool() == ToolType::ERASER ? SDL_Color{220, 60, 60, 180}
                                                              : SDL_Color{ 60, 120, 220, 180};
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, ring.r, ring.g, ring.b, ring.a);
    DrawingUtils::drawFillCircle(renderer, cx, cy, r + 2);
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 200);
    DrawingUtils::drawFillCircle(renderer, cx, cy, r);
}

void gPen::updateTitle() {
    std::string title = formatStatus(getStatus());
    if (title == lastTitle) return;
    SDL_SetWindowTitle(window, title.c_str());
    lastTitle = title;
}

void gPen::run() {
    bool running     = true;
    bool needsRedraw = true;
    SDL_Event e;

    if (provider) startSession();

    while (running) {
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) { running = false; break; }

            if (e.type == SDL_KEYDOWN && !e.key.repeat) {
                onKey(e.key.keysym);
                needsRedraw = true;
            }

            if (e.type == SDL_WINDOWEVENT) {
                switch (e.window.event) {
                    case SDL_WINDOWEVENT_FOCUS_LOST:
                        onFocusLost();
                        needsRedraw = true;
                        break;
                    case SDL_WINDOWEVENT_SIZE_CHANGED:
                        resizeCanvasToWindow();
                        needsRedraw = true;
                        break;
                    case SDL_WINDOWEVENT_EXPOSED:
                        needsRedraw = true;
                        break;
                }
            }

            // ── Mouse ──
            if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT
                && e.button.which != SDL_TOUCH_MOUSEID) {
                pointer.down(mouseSample(e.button.x, e.button.y, e.button.timestamp));
                needsRedraw = true;
            }
            if (e.type == SDL_MOUSEMOTION && e.motion.which != SDL_TOUCH_MOUSEID && pointer.isActive()) {
                pointer.move(mouseSample(e.motion.x, e.motion.y, e.motion.timestamp));
                needsRedraw = true;
            }
            if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT
                && e.button.which != SDL_TOUCH_MOUSEID) {
                pointer.up(mouseSample(e.button.x, e.button.y, e.button.timestamp));
                needsRedraw = true;
            }

            // ── Touch ──
            if (e.type == SDL_FINGERDOWN)   { pointer.down(touchSample(e.tfinger)); needsRedraw = true; }
            if (e.type == SDL_FINGERMOTION) { pointer.move(touchSample(e.tfinger)); needsRedraw = true; }
            if (e.type == SDL_FINGERUP)     { pointer.up  (touchSample(e.tfinger)); needsRedraw = true; }
        }

        if (pollLandmarks()) needsRedraw = true;

        if (!needsRedraw) { SDL_Delay(4); continue; }
        needsRedraw = false;

        SDL_SetRenderDrawColor(renderer, 40, 40, 40, 255);
        SDL_RenderClear(renderer);
        surfaces.setOutputRect(getViewportF());
        surfaces.present();
        drawHandCursor();
        SDL_RenderPresent(renderer);
        updateTitle();
    }

    stopSession();
    controller.endStroke();
}
