#include "Config.h"
#include "Log.h"
#include <yaml-cpp/yaml.h>
#include <fstream>

static Uint8 readChannel(const YAML::Node& n) {
    int v = n.as<int>();
    if (v < 0 || v > 255) throw YAML::Exception(n.Mark(), "colour component out of range 0..255");
    return (Uint8)v;
}

static SDL_Color readColor(const YAML::Node& n, SDL_Color fallback) {
    if (!n || !n.IsSequence() || n.size() < 3) return fallback;
    SDL_Color c = fallback;
    c.r = readChannel(n[0]);
    c.g = readChannel(n[1]);
    c.b = readChannel(n[2]);
    c.a = n.size() > 3 ? readChannel(n[3]) : 255;
    return c;
}

static YAML::Node writeColor(SDL_Color c) {
    YAML::Node n;
    n.SetStyle(YAML::EmitterStyle::Flow);
    n.push_back((int)c.r);
    n.push_back((int)c.g);
    n.push_back((int)c.b);
    if (c.a != 255) n.push_back((int)c.a);
    return n;
}

template<typename T> static void readKey(const YAML::Node& root, const char* key, T& out) {
    if (root[key]) out = root[key].as<T>();
}

bool Config::validate() const {
    if (canvasWidth < MIN_CANVAS_W || canvasHeight < MIN_CANVAS_H) return false;
    if (brushSize < MIN_BRUSH_SIZE || brushSize > MAX_BRUSH_SIZE) return false;
    if (stabilityWindow < 1) return false;
    if (smoothingFactor <= 0.f || smoothingFactor > 1.f) return false;
    if (stampSpacing <= 0.f) return false;
    if (pressureWindow < 1) return false;
    if (tapMaxMs < 0 || tapMaxDistance < 0.f || palmContactRadius <= 0.f) return false;
    return true;
}

bool Config::loadFromFile(const std::string& path) {
    Config next = *this;
    try {
        YAML::Node root = YAML::LoadFile(path);
        readKey(root, "canvas_width",        next.canvasWidth);
        readKey(root, "canvas_height",       next.canvasHeight);
        next.background = readColor(root["background"], next.background);
        readKey(root, "brush_size",          next.brushSize);
        next.color = readColor(root["color"], next.color);
        readKey(root, "stability_window",    next.stabilityWindow);
        readKey(root, "smoothing_factor",    next.smoothingFactor);
        readKey(root, "stamp_spacing",       next.stampSpacing);
        readKey(root, "enable_tap_zones",    next.enableTapZones);
        readKey(root, "pressure_window",     next.pressureWindow);
        readKey(root, "tap_max_ms",          next.tapMaxMs);
        readKey(root, "tap_max_distance",    next.tapMaxDistance);
        readKey(root, "palm_contact_radius", next.palmContactRadius);
        readKey(root, "replay_file",         next.replayFile);
        readKey(root, "replay_loop",         next.replayLoop);
        readKey(root, "verbose",             next.verbose);
    } catch (const YAML::Exception& e) {
        SDL_LogError(GPEN_LOG_APP, "Config: failed to load %s: %s", path.c_str(), e.what());
        return false;
    }

    if (!next.validate()) {
        SDL_LogError(GPEN_LOG_APP, "Config: %s has out-of-range values, keeping previous settings",
                     path.c_str());
        return false;
    }
    *this = next;
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    YAML::Node root;
    root["canvas_width"]        = canvasWidth;
    root["canvas_height"]       = canvasHeight;
    root["background"]          = writeColor(background);
    root["brush_size"]          = brushSize;
    root["color"]               = writeColor(color);
    root["stability_window"]    = stabilityWindow;
    root["smoothing_factor"]    = smoothingFactor;
    root["stamp_spacing"]       = stampSpacing;
    root["enable_tap_zones"]    = enableTapZones;
    root["pressure_window"]     = pressureWindow;
    root["tap_max_ms"]          = tapMaxMs;
    root["tap_max_distance"]    = tapMaxDistance;
    root["palm_contact_radius"] = palmContactRadius;
    if (!replayFile.empty()) root["replay_file"] = replayFile;
    root["replay_loop"]         = replayLoop;
    root["verbose"]             = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(GPEN_LOG_APP, "Config: failed to open %s for writing", path.c_str());
        return false;
    }
    file << root << "\n";
    return file.good();
}
