#pragma once

#include "core/math.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace sk::audio {

/**
 * @brief Decoded clip as seen by the scheduling core
 *
 * Only identity and length matter here; sample data stays with the backend.
 */
struct AudioClip {
    std::string name;              ///< Asset name used for lookup and diagnostics
    double length_seconds = 0.0;   ///< Length at pitch 1.0
};

using ClipRef = std::shared_ptr<const AudioClip>;

/**
 * @brief Named routing destination exposing named float parameters
 */
class Bus {
public:
    explicit Bus(std::string name);

    const std::string& name() const { return name_; }
    uint64_t id() const { return id_; }

    // Returns false (and leaves `out` alone) when the parameter was never set.
    bool try_get_param(const std::string& param, float& out) const;
    void set_param(const std::string& param, float value);

    const std::unordered_map<std::string, float>& params() const { return params_; }

private:
    std::string name_;
    uint64_t id_;
    std::unordered_map<std::string, float> params_;
};

using BusRef = std::shared_ptr<Bus>;

/**
 * @brief Everything the output primitive needs to render one clip on one channel
 */
struct VoiceParams {
    ClipRef clip;
    float volume = 1.0f;
    float pitch = 1.0f;
    bool loop = false;
    float spatial_blend = 0.0f;    ///< 0 = 2D, 1 = fully positional
    float min_distance = 1.0f;
    float max_distance = 25.0f;
    BusRef bus;
    core::Vec3 position;
};

using VoiceId = uint32_t;

// Real playback duration of a clip at `pitch`; pitch magnitude is floored at 0.01.
double playback_seconds(const AudioClip& clip, float pitch);

} // namespace sk::audio
