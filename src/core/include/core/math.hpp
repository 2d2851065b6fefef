#pragma once

/**
 * Core math helpers shared by playback, mixing and scheduling.
 */

#include <cmath>
#include <algorithm>

namespace sk::core {

// 3D Vector
struct Vec3 {
    float x, y, z;

    Vec3() : x(0.0f), y(0.0f), z(0.0f) {}
    Vec3(float x_val, float y_val, float z_val) : x(x_val), y(y_val), z(z_val) {}

    Vec3 operator+(const Vec3& other) const { return Vec3(x + other.x, y + other.y, z + other.z); }
    Vec3 operator-(const Vec3& other) const { return Vec3(x - other.x, y - other.y, z - other.z); }
    Vec3 operator*(float scalar) const { return Vec3(x * scalar, y * scalar, z * scalar); }

    Vec3& operator+=(const Vec3& other) { x += other.x; y += other.y; z += other.z; return *this; }

    bool operator==(const Vec3& other) const { return x == other.x && y == other.y && z == other.z; }
    bool operator!=(const Vec3& other) const { return !(*this == other); }
};

// Something a sound can be attached to. Follow behaviours copy `position` every update.
struct Transform {
    Vec3 position;
};

inline float clamp01(float v) { return std::clamp(v, 0.0f, 1.0f); }
inline double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

inline float lerp(float a, float b, float t) { return a + (b - a) * clamp01(t); }

// Position of v inside [a,b], clamped to [0,1]. Degenerate ranges map to 0.
inline float inverse_lerp(float a, float b, float v) {
    if(a == b) return 0.0f;
    return clamp01((v - a) / (b - a));
}

inline bool approximately(float a, float b) {
    const float scale = std::max({1e-6f * std::max(std::fabs(a), std::fabs(b)), 1e-6f});
    return std::fabs(b - a) < scale * 8.0f;
}

} // namespace sk::core
