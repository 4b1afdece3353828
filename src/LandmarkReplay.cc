#include "LandmarkReplay.h"
#include "Log.h"
#include <yaml-cpp/yaml.h>
#include <array>

static Handedness parseHandedness(const YAML::Node& n) {
    if (!n) return Handedness::UNKNOWN;
    std::string s = n.as<std::string>();
    if (s == "left"  || s == "Left")  return Handedness::LEFT;
    if (s == "right" || s == "Right") return Handedness::RIGHT;
    return Handedness::UNKNOWN;
}

static HandFrame parseFrame(const YAML::Node& n) {
    HandFrame f;
    if (!n["hand"] || !n["hand"].as<bool>()) return f;

    f.hasHand    = true;
    f.handedness = parseHandedness(n["handedness"]);
    f.confidence = n["confidence"] ? n["confidence"].as<float>() : 1.f;

    const YAML::Node& pts = n["landmarks"];
    if (!pts || !pts.IsSequence()) throw YAML::Exception(n.Mark(), "hand frame without landmarks");

    std::array<Landmark, LANDMARK_COUNT> set;
    f.pointCount = (int)pts.size();
    for (size_t i = 0; i < pts.size() && i < (size_t)LANDMARK_COUNT; i++) {
        const YAML::Node& p = pts[i];
        if (!p.IsSequence() || p.size() < 2) throw YAML::Exception(p.Mark(), "landmark needs [x, y(, z)]");
        set[i].x = p[0].as<float>();
        set[i].y = p[1].as<float>();
        set[i].z = p.size() > 2 ? p[2].as<float>() : 0.f;
    }
    f.landmarks = LandmarkSet(set);
    return f;
}

static bool parseReplay(const YAML::Node& root, std::vector<HandFrame>& frames, bool& loop) {
    const YAML::Node& list = root["frames"];
    if (!list || !list.IsSequence()) {
        SDL_LogError(GPEN_LOG_GESTURE, "LandmarkReplay: missing 'frames' list");
        return false;
    }
    std::vector<HandFrame> parsed;
    parsed.reserve(list.size());
    for (const YAML::Node& n : list) parsed.push_back(parseFrame(n));
    if (root["loop"]) loop = root["loop"].as<bool>();
    frames.swap(parsed);
    return true;
}

bool LandmarkReplay::loadFromFile(const std::string& path) {
    try {
        if (!parseReplay(YAML::LoadFile(path), frames, loop)) return false;
    } catch (const YAML::Exception& e) {
        SDL_LogError(GPEN_LOG_GESTURE, "LandmarkReplay: cannot read %s: %s", path.c_str(), e.what());
        return false;
    }
    cursor = 0;
    SDL_LogInfo(GPEN_LOG_GESTURE, "LandmarkReplay: %d frames from %s", (int)frames.size(), path.c_str());
    return true;
}

bool LandmarkReplay::loadFromString(const std::string& yaml) {
    try {
        if (!parseReplay(YAML::Load(yaml), frames, loop)) return false;
    } catch (const YAML::Exception& e) {
        SDL_LogError(GPEN_LOG_GESTURE, "LandmarkReplay: parse error: %s", e.what());
        return false;
    }
    cursor = 0;
    return true;
}

bool LandmarkReplay::poll(HandFrame& out) {
    if (frames.empty()) return false;
    if (cursor >= frames.size()) {
        if (!loop) return false;
        cursor = 0;
    }
    out = frames[cursor++];
    return true;
}
