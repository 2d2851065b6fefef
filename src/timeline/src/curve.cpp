#include "timeline/curve.hpp"
#include <algorithm>

namespace sk::timeline {

namespace {

bool key_before(const Keyframe& a, const Keyframe& b) { return a.time < b.time; }

} // namespace

Curve::Curve(std::vector<Keyframe> keys) : keys_(std::move(keys)) {
    std::stable_sort(keys_.begin(), keys_.end(), key_before);
}

Curve Curve::linear(float t0, float v0, float t1, float v1) {
    const float slope = t1 != t0 ? (v1 - v0) / (t1 - t0) : 0.0f;
    return Curve({Keyframe{t0, v0, 0.0f, slope}, Keyframe{t1, v1, slope, 0.0f}});
}

Curve Curve::ease_in_out(float t0, float v0, float t1, float v1) {
    return Curve({Keyframe{t0, v0, 0.0f, 0.0f}, Keyframe{t1, v1, 0.0f, 0.0f}});
}

Curve Curve::constant(float t0, float t1, float value) {
    return Curve({Keyframe{t0, value, 0.0f, 0.0f}, Keyframe{t1, value, 0.0f, 0.0f}});
}

void Curve::add_key(const Keyframe& key) {
    auto pos = std::upper_bound(keys_.begin(), keys_.end(), key, key_before);
    keys_.insert(pos, key);
}

float Curve::evaluate(float t) const {
    if(keys_.empty()) return t;
    if(keys_.size() == 1 || t <= keys_.front().time) return keys_.front().value;
    if(t >= keys_.back().time) return keys_.back().value;

    auto next = std::upper_bound(keys_.begin(), keys_.end(), t,
                                 [](float time, const Keyframe& k) { return time < k.time; });
    const Keyframe& k1 = *next;
    const Keyframe& k0 = *(next - 1);

    const float dt = k1.time - k0.time;
    if(dt <= 0.0f) return k1.value;

    const float u = (t - k0.time) / dt;
    const float u2 = u * u;
    const float u3 = u2 * u;

    const float h00 = 2.0f * u3 - 3.0f * u2 + 1.0f;
    const float h10 = u3 - 2.0f * u2 + u;
    const float h01 = -2.0f * u3 + 3.0f * u2;
    const float h11 = u3 - u2;

    return h00 * k0.value + h10 * dt * k0.out_tangent + h01 * k1.value + h11 * dt * k1.in_tangent;
}

} // namespace sk::timeline
