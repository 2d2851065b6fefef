#pragma once

#include "playback/channel.hpp"
#include "audio/voice_output.hpp"
#include "core/clock.hpp"
#include "core/random.hpp"
#include "core/task_queue.hpp"
#include "registry/sound_registry.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sk::playback {

struct EngineConfig {
    int effect_pool_size = 24;
    int music_layer_count = 3;
    int narration_pool_size = 2;

    // Used when a definition does not route to a bus of its own
    audio::BusRef default_effect_bus;
    audio::BusRef default_music_bus;
    audio::BusRef default_narration_bus;

    uint32_t random_seed = 0;   ///< 0 = nondeterministic
};

using FollowTarget = std::shared_ptr<const core::Transform>;

/**
 * @brief Pooled playback of effects, music layers and narration
 *
 * Owns three fixed channel sets: an effect pool, one channel per music layer and a small
 * narration pool. Every call is synchronous and fails softly: nullptr/false plus one warning.
 * Long-running work (fades, intro-to-loop swaps, narration sequences) runs as continuations
 * resumed by update(); a newer command on the same channel silently supersedes them.
 */
class PlaybackEngine {
public:
    PlaybackEngine(EngineConfig config, audio::VoiceOutput& output, const core::Clock& clock);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Non-owning; may be null (every name-based call then fails with a warning).
    void set_registry(const registry::SoundRegistry* registry) { registry_ = registry; }
    const registry::SoundRegistry* registry() const { return registry_; }

    const EngineConfig& config() const { return config_; }

    // Effects
    const Channel* play_effect(const std::string& name, const core::Vec3& position,
                               FollowTarget follow = nullptr, float volume_mul = 1.0f,
                               std::optional<bool> loop_override = std::nullopt);
    const Channel* play_effect(const registry::SoundEntryPtr& entry, const core::Vec3& position,
                               FollowTarget follow = nullptr, float volume_mul = 1.0f,
                               std::optional<bool> loop_override = std::nullopt);
    // Stops immediately when fade_seconds <= 0, otherwise fades to zero then stops.
    void stop_effect(const Channel* channel, float fade_seconds = 0.0f);

    // Music (layer 0 unless stated)
    const Channel* play_music(const std::string& name, float volume_mul = 1.0f,
                              std::optional<bool> loop_override = std::nullopt);
    const Channel* play_music(const registry::SoundEntryPtr& entry, float volume_mul = 1.0f,
                              std::optional<bool> loop_override = std::nullopt);
    const Channel* play_music_layer(int layer, const std::string& name, float volume_mul = 1.0f,
                                    std::optional<bool> loop_override = std::nullopt);
    const Channel* play_music_layer(int layer, const registry::SoundEntryPtr& entry, float volume_mul = 1.0f,
                                    std::optional<bool> loop_override = std::nullopt);
    // Plays `clip` with the definition's volume/pitch/bus; no intro handling.
    const Channel* play_music_layer_clip(int layer, const registry::SoundEntryPtr& music, audio::ClipRef clip,
                                         float volume_mul = 1.0f, std::optional<bool> loop_override = std::nullopt);
    void stop_music(float fade_seconds = 0.0f);
    void stop_music_layer(int layer, float fade_seconds = 0.0f);
    bool fade_music_layer_volume(int layer, float target_volume, float fade_seconds);

    // Interpolates from the parameter's current value (or the target when it was never set).
    bool fade_bus_parameter(const audio::BusRef& bus, const std::string& param, float target, float fade_seconds);

    // Narration: group name, "Group.Item" path, group entry or a single clip/variant entry
    const Channel* play_narration(const std::string& name, const core::Vec3& position,
                                  FollowTarget follow = nullptr, float volume_mul = 1.0f);
    const Channel* play_narration(const registry::SoundEntryPtr& entry, const core::Vec3& position,
                                  FollowTarget follow = nullptr, float volume_mul = 1.0f);

    // Direct parameter writes (automation). No generation bump.
    void set_channel_volume(const Channel* channel, float volume);
    void set_channel_pitch(const Channel* channel, float pitch);

    bool is_playing(const Channel* channel) const;

    const Channel* music_layer(int layer) const;
    size_t music_layer_count() const { return music_.size(); }
    size_t effect_pool_size() const { return effects_.size(); }
    size_t narration_pool_size() const { return narration_.size(); }
    const Channel& effect_channel(size_t i) const { return *effects_.at(i); }
    const Channel& narration_channel(size_t i) const { return *narration_.at(i); }

    // Continuations still queued (fades, swaps, sequences)
    size_t pending_tasks() const { return tasks_.size(); }

    /**
     * @brief Per-frame tick: copy follow targets into voices, then resume continuations
     */
    void update();

private:
    const Channel* play_sfx_definition(const registry::SoundEntry& entry, const core::Vec3& position,
                                       FollowTarget follow, float volume_mul, std::optional<bool> loop_override);
    const Channel* play_sfx_group(const registry::SoundEntry& group_entry, const registry::SoundEntryPtr& forced,
                                  bool pitch_from_variant, const core::Vec3& position, FollowTarget follow,
                                  float volume_mul, std::optional<bool> loop_override);
    const Channel* play_sfx_variant(const registry::SoundEntry& variant_entry, const core::Vec3& position,
                                    FollowTarget follow, float volume_mul, std::optional<bool> loop_override);
    const Channel* play_music_definition(int layer, const registry::SoundEntry& entry, float volume_mul,
                                         std::optional<bool> loop_override);
    const Channel* start_narration_sequence(const registry::SoundEntryPtr& group_entry,
                                            const registry::SoundEntryPtr& forced,
                                            const core::Vec3& position, FollowTarget follow, float volume_mul);
    const Channel* play_narration_playable(const registry::SoundEntry& entry, const core::Vec3& position,
                                           FollowTarget follow, float volume_mul);

    void stop_channel(Channel& channel, float fade_seconds);

    Channel* acquire_effect_channel();
    Channel* acquire_narration_channel();
    Channel* layer_channel(int layer);
    Channel* mutable_channel(const Channel* handle);

    void stamp(Channel& channel);
    void hard_stop(Channel& channel);
    void place(Channel& channel, const core::Vec3& position, FollowTarget follow);
    void start_voice(Channel& channel);
    void push(Channel& channel);

    core::Generation& bus_generation(const audio::Bus& bus, const std::string& param);

    EngineConfig config_;
    audio::VoiceOutput& output_;
    const core::Clock& clock_;
    const registry::SoundRegistry* registry_ = nullptr;
    core::Random random_;

    std::vector<std::unique_ptr<Channel>> effects_;
    std::vector<std::unique_ptr<Channel>> music_;
    std::vector<std::unique_ptr<Channel>> narration_;
    uint64_t next_serial_ = 0;

    // Keyed by (bus identity, parameter name); std::map keeps Generation addresses stable.
    std::map<std::pair<uint64_t, std::string>, core::Generation> bus_generations_;

    core::TaskQueue tasks_;
};

/**
 * @brief Weighted pick over variants with a clip and probability > 0
 *
 * Draws uniformly in [0,total) and returns the first variant whose running sum reaches the
 * draw. nullptr when no variant qualifies.
 */
registry::SoundEntryPtr pick_weighted_variant(const registry::SfxVariantGroup& group, core::Random& random);

} // namespace sk::playback
