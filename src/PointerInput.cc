#include "PointerInput.h"
#include "StrokeController.h"
#include "Log.h"
#include <algorithm>
#include <cmath>

PointerInput::PointerInput(StrokeController* c) : controller(c) {}

// Force wins over contact size; devices reporting neither draw at full pressure.
float PointerInput::estimatePressure(const PointerSample& s) {
    float raw = 1.f;
    if (s.force > 0.f)              raw = std::min(s.force * 2.f, 1.f);
    else if (s.contactRadius > 0.f) raw = std::min(s.contactRadius / 20.f, 1.f);

    pressureHistory.push_back(raw);
    while ((int)pressureHistory.size() > pressureWindow) pressureHistory.pop_front();
    float sum = 0.f;
    for (float p : pressureHistory) sum += p;
    float avg = sum / pressureHistory.size();
    return std::max(0.1f, std::min(1.f, avg));
}

// Displacement from the stroke start over the time since the previous move.
void PointerInput::updateVelocity(const PointerSample& s) {
    if (lastMoveTime > 0 && s.timestamp > lastMoveTime) {
        float dt = (float)(s.timestamp - lastMoveTime);
        velX = (s.x - startX) / dt * 1000.f;
        velY = (s.y - startY) / dt * 1000.f;
    }
    lastMoveTime = s.timestamp;
}

float PointerInput::getVelocity() const {
    return std::sqrt(velX * velX + velY * velY);
}

void PointerInput::reset() {
    active = false;
    velX = velY = 0.f;
    lastMoveTime = 0;
    pressureHistory.clear();
}

bool PointerInput::down(const PointerSample& s) {
    if (active) {
        SDL_LogDebug(GPEN_LOG_INPUT, "pointer %lld ignored, pointer %lld is drawing",
                     (long long)s.id, (long long)activeId);
        return false;
    }
    if (controller->isDrawing()) {
        SDL_LogDebug(GPEN_LOG_INPUT, "pointer %lld ignored, a gesture stroke is open", (long long)s.id);
        return false;
    }

    pressureHistory.clear();
    pressure  = estimatePressure(s);
    active    = true;
    activeId  = s.id;
    startX    = s.x;
    startY    = s.y;
    startTime = lastMoveTime = s.timestamp;
    velX = velY = 0.f;

    if (s.contactRadius > palmContactRadius) {
        SDL_LogInfo(GPEN_LOG_INPUT, "palm contact (r=%.1f), switching to eraser", s.contactRadius);
        controller->setTool(ToolType::ERASER);
    }
    if (!controller->beginStroke(s.x, s.y, pressure)) {
        reset();
        return false;
    }
    return true;
}

bool PointerInput::move(const PointerSample& s) {
    if (!active || s.id != activeId) return false;
    pressure = estimatePressure(s);
    updateVelocity(s);
    return controller->continueStroke(s.x, s.y, pressure);
}

void PointerInput::up(const PointerSample& s) {
    if (!active || s.id != activeId) return;

    Uint32 duration = s.timestamp - startTime;
    float dx = s.x - startX, dy = s.y - startY;
    float distance = std::sqrt(dx * dx + dy * dy);
    bool tap = duration < tapMaxMs && distance < tapMaxDistance;

    controller->endStroke();
    reset();

    if (tap) {
        SDL_LogDebug(GPEN_LOG_INPUT, "tap at (%.1f, %.1f)", s.x, s.y);
        if (onTap) onTap(s.x, s.y);
    }
}

void PointerInput::release() {
    if (!active) return;
    controller->endStroke();
    reset();
}

void PointerInput::cancel() {
    if (!active) return;
    controller->cancelStroke();
    reset();
}
