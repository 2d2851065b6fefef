#pragma once

#include <vector>

namespace sk::timeline {

struct Keyframe {
    float time = 0.0f;
    float value = 0.0f;
    float in_tangent = 0.0f;    ///< slope arriving at this key
    float out_tangent = 0.0f;   ///< slope leaving this key
};

/**
 * @brief Keyframed cubic Hermite curve
 *
 * Outside the key range the curve holds the first/last value. An empty curve is the
 * identity (evaluate(t) == t).
 */
class Curve {
public:
    Curve() = default;
    explicit Curve(std::vector<Keyframe> keys);

    // Straight line from (t0,v0) to (t1,v1); tangents equal the slope.
    static Curve linear(float t0, float v0, float t1, float v1);
    // Flat tangents at both ends.
    static Curve ease_in_out(float t0, float v0, float t1, float v1);
    static Curve constant(float t0, float t1, float value);

    void add_key(const Keyframe& key);

    float evaluate(float t) const;

    const std::vector<Keyframe>& keys() const { return keys_; }
    bool empty() const { return keys_.empty(); }

private:
    std::vector<Keyframe> keys_;   // sorted by time
};

} // namespace sk::timeline
