#pragma once
#include <string>
#include <vector>
#include "Landmarks.h"

// Plays back recorded hand frames from YAML, one frame per poll():
//
//   loop: true
//   frames:
//     - hand: true
//       handedness: right
//       confidence: 0.93
//       landmarks: [[0.51, 0.82, 0.0], ...]   # 21 entries
//     - hand: false
//
// A frame with a landmark count other than 21 is kept and delivered as
// malformed so the consumer sees exactly what was recorded.
class LandmarkReplay : public ILandmarkProvider {
  public:
    LandmarkReplay() {}

    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& yaml);

    bool poll(HandFrame& out) override;

    void   rewind() { cursor = 0; }
    void   setLoop(bool l) { loop = l; }
    bool   getLoop() const { return loop; }
    size_t frameCount() const { return frames.size(); }
    size_t position()   const { return cursor; }
    bool   finished()   const { return !loop && cursor >= frames.size(); }

  private:
    std::vector<HandFrame> frames;
    size_t cursor = 0;
    bool   loop   = false;
};
