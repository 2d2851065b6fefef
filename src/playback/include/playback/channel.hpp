#pragma once

#include "audio/audio_types.hpp"
#include "core/generation.hpp"
#include "core/math.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace sk::playback {

enum class ChannelKind { Effect, Music, Narration };

const char* channel_kind_name(ChannelKind kind);

/**
 * @brief One reusable playback slot owned by the PlaybackEngine
 *
 * Callers receive `const Channel*` handles: enough to inspect what is playing and to pass
 * the channel back into engine calls. Only the engine and its continuations mutate a channel.
 *
 * Two generation lanes guard continuations:
 *  - playback generation: bumped by every play, stop and narration sequence start. Guards
 *    intro-to-loop swaps, narration steps and fade-to-stop.
 *  - volume generation: bumped by every play/stop and by every volume fade. Guards fade steps.
 * A volume fade therefore supersedes an earlier fade without orphaning a pending intro swap.
 */
class Channel {
public:
    Channel(ChannelKind kind, size_t index, audio::VoiceId voice)
        : kind_(kind), index_(index), voice_(voice) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    ChannelKind kind() const { return kind_; }
    size_t index() const { return index_; }               ///< position within its pool / layer index
    audio::VoiceId voice() const { return voice_; }

    const audio::VoiceParams& params() const { return params_; }
    audio::VoiceParams& params() { return params_; }

    const audio::ClipRef& clip() const { return params_.clip; }
    float volume() const { return params_.volume; }
    float pitch() const { return params_.pitch; }
    bool loop() const { return params_.loop; }
    const audio::BusRef& bus() const { return params_.bus; }
    const core::Vec3& position() const { return params_.position; }

    uint64_t generation() const { return generation_.current(); }
    uint64_t volume_generation() const { return volume_generation_.current(); }
    core::Generation& playback_lane() { return generation_; }
    core::Generation& volume_lane() { return volume_generation_; }

    // Supersede everything in flight on this channel.
    core::Epoch bump_all() {
        core::advance(volume_generation_);
        return core::advance(generation_);
    }

    // Follow target; the engine copies its position into the voice every update.
    void set_follow(std::weak_ptr<const core::Transform> target) { follow_ = std::move(target); }
    void clear_follow() { follow_.reset(); }
    std::shared_ptr<const core::Transform> follow_target() const { return follow_.lock(); }
    bool following() const { return !follow_.expired(); }

    // A narration sequence owns the channel while its epoch is still current.
    void begin_sequence(const core::Epoch& epoch) { sequence_value_ = epoch.value; sequence_open_ = true; }
    void end_sequence() { sequence_open_ = false; }
    bool sequence_active() const { return sequence_open_ && generation_.current() == sequence_value_; }

    uint64_t assign_serial() const { return assign_serial_; }
    void set_assign_serial(uint64_t serial) { assign_serial_ = serial; }

private:
    ChannelKind kind_;
    size_t index_;
    audio::VoiceId voice_;
    audio::VoiceParams params_;

    core::Generation generation_;
    core::Generation volume_generation_;

    std::weak_ptr<const core::Transform> follow_;

    uint64_t sequence_value_ = 0;
    bool sequence_open_ = false;

    uint64_t assign_serial_ = 0;   ///< order of last assignment; smallest is reused first
};

} // namespace sk::playback
