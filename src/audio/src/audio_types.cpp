#include "audio/audio_types.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>

namespace sk::audio {

static std::atomic<uint64_t> g_next_bus_id{1};

Bus::Bus(std::string name)
    : name_(std::move(name)), id_(g_next_bus_id.fetch_add(1, std::memory_order_relaxed)) {}

bool Bus::try_get_param(const std::string& param, float& out) const {
    auto it = params_.find(param);
    if(it == params_.end()) return false;
    out = it->second;
    return true;
}

void Bus::set_param(const std::string& param, float value) {
    params_[param] = value;
}

double playback_seconds(const AudioClip& clip, float pitch) {
    const double magnitude = std::max(0.01, static_cast<double>(std::fabs(pitch)));
    return clip.length_seconds / magnitude;
}

} // namespace sk::audio
