#pragma once

// Maps normalized camera landmarks onto a target rectangle. The x axis is
// mirrored so moving the hand right moves the cursor right, as in a mirror.
namespace LandmarkMapper {
    inline float mirror(float x) { return 1.f - x; }

    inline void toSurface(float nx, float ny, float width, float height, float* sx, float* sy) {
        *sx = mirror(nx) * width;
        *sy = ny * height;
    }
}
