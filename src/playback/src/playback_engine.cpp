#include "playback/playback_engine.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace sk::playback {

const char* channel_kind_name(ChannelKind kind) {
    switch(kind) {
        case ChannelKind::Effect: return "effect";
        case ChannelKind::Music: return "music";
        case ChannelKind::Narration: return "narration";
    }
    return "unknown";
}

namespace {

using core::TaskState;

void apply_spatial(audio::VoiceParams& params, const registry::SpatialSettings& spatial) {
    params.spatial_blend = spatial.spatial_blend;
    params.min_distance = spatial.min_distance;
    params.max_distance = spatial.max_distance;
}

float fade_progress(double now, double start, double duration) {
    return static_cast<float>(core::clamp01((now - start) / duration));
}

// Linear volume ramp guarded by the volume lane.
class VolumeFade final : public core::Task {
public:
    VolumeFade(Channel& channel, audio::VoiceOutput& output, core::Epoch epoch,
               float target, double start_time, double duration)
        : channel_(channel), output_(output), epoch_(epoch),
          from_(channel.volume()), target_(target), start_time_(start_time), duration_(duration) {}

    TaskState resume(double now) override {
        if(!epoch_.valid()) return TaskState::Done;
        const float t = fade_progress(now, start_time_, duration_);
        channel_.params().volume = t >= 1.0f ? target_ : core::lerp(from_, target_, t);
        output_.apply(channel_.voice(), channel_.params());
        return t >= 1.0f ? TaskState::Done : TaskState::Pending;
    }

private:
    Channel& channel_;
    audio::VoiceOutput& output_;
    core::Epoch epoch_;
    float from_;
    float target_;
    double start_time_;
    double duration_;
};

// Ramp to silence, then hard-stop. Any later play, stop or volume fade supersedes it.
class FadeOutAndStop final : public core::Task {
public:
    FadeOutAndStop(Channel& channel, audio::VoiceOutput& output, core::Epoch playback_epoch,
                   core::Epoch volume_epoch, double start_time, double duration)
        : channel_(channel), output_(output), playback_epoch_(playback_epoch), volume_epoch_(volume_epoch),
          from_(channel.volume()), start_time_(start_time), duration_(duration) {}

    TaskState resume(double now) override {
        if(!playback_epoch_.valid() || !volume_epoch_.valid()) {
            SK_PLAYBACK_TRACE("PlaybackEngine: fade-out superseded on voice " + std::to_string(channel_.voice()));
            return TaskState::Done;
        }
        const float t = fade_progress(now, start_time_, duration_);
        channel_.params().volume = t >= 1.0f ? 0.0f : core::lerp(from_, 0.0f, t);
        output_.apply(channel_.voice(), channel_.params());
        if(t < 1.0f) return TaskState::Pending;

        output_.stop(channel_.voice());
        channel_.clear_follow();
        return TaskState::Done;
    }

private:
    Channel& channel_;
    audio::VoiceOutput& output_;
    core::Epoch playback_epoch_;
    core::Epoch volume_epoch_;
    float from_;
    double start_time_;
    double duration_;
};

class BusParameterFade final : public core::Task {
public:
    BusParameterFade(audio::BusRef bus, std::string param, core::Epoch epoch,
                     float from, float target, double start_time, double duration)
        : bus_(std::move(bus)), param_(std::move(param)), epoch_(epoch),
          from_(from), target_(target), start_time_(start_time), duration_(duration) {}

    TaskState resume(double now) override {
        if(!epoch_.valid()) return TaskState::Done;
        const float t = fade_progress(now, start_time_, duration_);
        bus_->set_param(param_, t >= 1.0f ? target_ : core::lerp(from_, target_, t));
        return t >= 1.0f ? TaskState::Done : TaskState::Pending;
    }

private:
    audio::BusRef bus_;
    std::string param_;
    core::Epoch epoch_;
    float from_;
    float target_;
    double start_time_;
    double duration_;
};

/**
 * Plays a narration group's entries in order on one channel: pre-delay, clip, wait for the
 * clip's real duration, next entry. The epoch is re-checked on every resume.
 */
class NarrationSequence final : public core::Task {
public:
    NarrationSequence(Channel& channel, audio::VoiceOutput& output, core::Random& random, core::Epoch epoch,
                      registry::SoundEntryPtr group, std::vector<registry::SoundEntryPtr> entries,
                      float volume_mul, audio::BusRef fallback_bus)
        : channel_(channel), output_(output), random_(random), epoch_(epoch), group_(std::move(group)),
          entries_(std::move(entries)), volume_mul_(volume_mul), fallback_bus_(std::move(fallback_bus)) {}

    TaskState resume(double now) override {
        for(;;) {
            if(!epoch_.valid()) {
                SK_PLAYBACK_TRACE("PlaybackEngine: narration superseded on voice " + std::to_string(channel_.voice()));
                return TaskState::Done;
            }

            switch(phase_) {
                case Phase::Next: {
                    if(next_ >= entries_.size()) {
                        output_.stop(channel_.voice());
                        channel_.clear_follow();
                        channel_.end_sequence();
                        return TaskState::Done;
                    }
                    current_ = resolve(entries_[next_]);
                    if(!current_) {
                        ++next_;
                        continue;
                    }
                    const auto* playable = registry::as_narration_playable(*current_);
                    due_ = now + std::max(0.0f, playable->pre_delay);
                    phase_ = Phase::PreDelay;
                    continue;
                }
                case Phase::PreDelay:
                    if(now < due_) return TaskState::Pending;
                    play_current(now);
                    phase_ = Phase::Playing;
                    continue;
                case Phase::Playing:
                    if(now < due_) return TaskState::Pending;
                    ++next_;
                    phase_ = Phase::Next;
                    continue;
            }
        }
    }

private:
    enum class Phase { Next, PreDelay, Playing };

    registry::SoundEntryPtr resolve(const registry::SoundEntryPtr& entry) {
        if(!entry) return nullptr;
        registry::SoundEntryPtr candidate = entry;
        if(const auto* variants = entry->as<registry::NarrationVariantGroup>()) {
            candidate = registry::pick_narration_variant(*variants, random_);
            if(!candidate) return nullptr;
        }
        const auto* playable = registry::as_narration_playable(*candidate);
        return playable && playable->clip ? candidate : nullptr;
    }

    void play_current(double now) {
        const auto& group = *group_->as<registry::NarrationGroup>();
        const auto& playable = *registry::as_narration_playable(*current_);

        auto& params = channel_.params();
        params.clip = playable.clip;
        params.volume = core::clamp01(group.volume * playable.volume * volume_mul_);
        params.pitch = random_.range(group.pitch.min, group.pitch.max);
        params.loop = false;
        apply_spatial(params, group.spatial);
        params.bus = group.bus ? group.bus : fallback_bus_;
        output_.start(channel_.voice(), params);

        due_ = now + audio::playback_seconds(*params.clip, params.pitch);
        SK_PLAYBACK_TRACE("PlaybackEngine: narration '" + current_->name + "' on voice " + std::to_string(channel_.voice()));
    }

    Channel& channel_;
    audio::VoiceOutput& output_;
    core::Random& random_;
    core::Epoch epoch_;
    registry::SoundEntryPtr group_;
    std::vector<registry::SoundEntryPtr> entries_;
    float volume_mul_;
    audio::BusRef fallback_bus_;

    Phase phase_ = Phase::Next;
    size_t next_ = 0;
    registry::SoundEntryPtr current_;
    double due_ = 0.0;
};

} // namespace

registry::SoundEntryPtr pick_weighted_variant(const registry::SfxVariantGroup& group, core::Random& random) {
    auto weight_of = [](const registry::SoundEntryPtr& entry) {
        const auto* variant = entry ? entry->as<registry::SfxVariant>() : nullptr;
        if(!variant || !variant->clip || variant->probability <= 0.0f) return 0.0f;
        return variant->probability;
    };

    float total = 0.0f;
    for(const auto& entry : group.variants) total += weight_of(entry);
    if(total <= 0.0f) return nullptr;

    const float pick = random.unit() * total;
    float running = 0.0f;
    for(const auto& entry : group.variants) {
        const float weight = weight_of(entry);
        if(weight <= 0.0f) continue;
        running += weight;
        if(pick <= running) return entry;
    }
    return nullptr;
}

PlaybackEngine::PlaybackEngine(EngineConfig config, audio::VoiceOutput& output, const core::Clock& clock)
    : config_(std::move(config)), output_(output), clock_(clock), random_(config_.random_seed) {
    config_.effect_pool_size = std::max(1, config_.effect_pool_size);
    config_.music_layer_count = std::max(1, config_.music_layer_count);
    config_.narration_pool_size = std::max(1, config_.narration_pool_size);

    audio::VoiceId next_voice = 1;
    auto build = [&next_voice](std::vector<std::unique_ptr<Channel>>& pool, ChannelKind kind, int count) {
        pool.reserve(static_cast<size_t>(count));
        for(int i = 0; i < count; ++i) {
            pool.push_back(std::make_unique<Channel>(kind, static_cast<size_t>(i), next_voice++));
        }
    };
    build(effects_, ChannelKind::Effect, config_.effect_pool_size);
    build(music_, ChannelKind::Music, config_.music_layer_count);
    build(narration_, ChannelKind::Narration, config_.narration_pool_size);

    sk::log::debug("PlaybackEngine: " + std::to_string(effects_.size()) + " effect, " +
                   std::to_string(music_.size()) + " music, " +
                   std::to_string(narration_.size()) + " narration channels");
}

PlaybackEngine::~PlaybackEngine() {
    tasks_.clear();
}

// Effects ------------------------------------------------------------------

const Channel* PlaybackEngine::play_effect(const std::string& name, const core::Vec3& position,
                                           FollowTarget follow, float volume_mul,
                                           std::optional<bool> loop_override) {
    if(!registry_) {
        sk::log::warn("PlaybackEngine: No sound registry assigned.");
        return nullptr;
    }

    if(auto sfx = registry_->get_sfx(name)) {
        return play_sfx_definition(*sfx, position, std::move(follow), volume_mul, loop_override);
    }
    if(auto group = registry_->get_sfx_variant_group(name)) {
        return play_sfx_group(*group, nullptr, true, position, std::move(follow), volume_mul, loop_override);
    }
    if(auto path = registry_->try_resolve_variant_path(name)) {
        return play_sfx_group(*path->group, path->variant, true, position, std::move(follow), volume_mul, loop_override);
    }

    sk::log::warn("PlaybackEngine: Missing effect '" + name + "'.");
    return nullptr;
}

const Channel* PlaybackEngine::play_effect(const registry::SoundEntryPtr& entry, const core::Vec3& position,
                                           FollowTarget follow, float volume_mul,
                                           std::optional<bool> loop_override) {
    if(!entry) {
        sk::log::warn("PlaybackEngine: Missing effect entry.");
        return nullptr;
    }

    switch(entry->kind()) {
        case registry::EntryKind::Sfx:
            return play_sfx_definition(*entry, position, std::move(follow), volume_mul, loop_override);
        case registry::EntryKind::SfxVariantGroup:
            return play_sfx_group(*entry, nullptr, false, position, std::move(follow), volume_mul, loop_override);
        case registry::EntryKind::SfxVariant:
            if(registry_) {
                if(auto owner = registry_->owning_variant_group(*entry)) {
                    return play_sfx_group(*owner, entry, true, position, std::move(follow), volume_mul, loop_override);
                }
            }
            return play_sfx_variant(*entry, position, std::move(follow), volume_mul, loop_override);
        default:
            break;
    }

    sk::log::warn("PlaybackEngine: Entry '" + entry->name + "' is not an effect type.");
    return nullptr;
}

const Channel* PlaybackEngine::play_sfx_definition(const registry::SoundEntry& entry, const core::Vec3& position,
                                                   FollowTarget follow, float volume_mul,
                                                   std::optional<bool> loop_override) {
    const auto& sfx = *entry.as<registry::SfxDefinition>();
    if(!sfx.clip) {
        sk::log::warn("PlaybackEngine: Missing clip for effect '" + entry.name + "'.");
        return nullptr;
    }

    Channel* channel = acquire_effect_channel();
    if(!channel) {
        sk::log::warn("PlaybackEngine: No effect channels available.");
        return nullptr;
    }
    place(*channel, position, std::move(follow));

    auto& params = channel->params();
    params.clip = sfx.clip;
    params.volume = core::clamp01(sfx.volume * volume_mul);
    params.pitch = random_.range(sfx.pitch.min, sfx.pitch.max);
    params.loop = loop_override.value_or(sfx.loop);
    apply_spatial(params, sfx.spatial);
    params.bus = sfx.bus ? sfx.bus : config_.default_effect_bus;
    start_voice(*channel);
    return channel;
}

const Channel* PlaybackEngine::play_sfx_group(const registry::SoundEntry& group_entry,
                                              const registry::SoundEntryPtr& forced, bool pitch_from_variant,
                                              const core::Vec3& position, FollowTarget follow,
                                              float volume_mul, std::optional<bool> loop_override) {
    const auto& group = *group_entry.as<registry::SfxVariantGroup>();
    const registry::SoundEntryPtr chosen = forced ? forced : pick_weighted_variant(group, random_);
    const auto* variant = chosen ? chosen->as<registry::SfxVariant>() : nullptr;
    if(!variant || !variant->clip) {
        sk::log::warn("PlaybackEngine: Missing clip for effect group '" + group_entry.name + "'.");
        return nullptr;
    }

    Channel* channel = acquire_effect_channel();
    if(!channel) {
        sk::log::warn("PlaybackEngine: No effect channels available.");
        return nullptr;
    }
    place(*channel, position, std::move(follow));

    const registry::PitchRange& pitch = pitch_from_variant ? variant->pitch : group.pitch;
    auto& params = channel->params();
    params.clip = variant->clip;
    params.volume = core::clamp01(group.volume * variant->volume * volume_mul);
    params.pitch = random_.range(pitch.min, pitch.max);
    params.loop = loop_override.value_or(group.loop);
    apply_spatial(params, group.spatial);
    params.bus = group.bus ? group.bus : config_.default_effect_bus;
    start_voice(*channel);
    SK_PLAYBACK_TRACE("PlaybackEngine: variant '" + chosen->name + "' of '" + group_entry.name + "'");
    return channel;
}

const Channel* PlaybackEngine::play_sfx_variant(const registry::SoundEntry& variant_entry, const core::Vec3& position,
                                                FollowTarget follow, float volume_mul,
                                                std::optional<bool> loop_override) {
    const auto& variant = *variant_entry.as<registry::SfxVariant>();
    if(!variant.clip) {
        sk::log::warn("PlaybackEngine: Missing clip for effect variant '" + variant_entry.name + "'.");
        return nullptr;
    }

    Channel* channel = acquire_effect_channel();
    if(!channel) {
        sk::log::warn("PlaybackEngine: No effect channels available.");
        return nullptr;
    }
    place(*channel, position, std::move(follow));

    // No owning group known: fully positional with default falloff.
    auto& params = channel->params();
    params.clip = variant.clip;
    params.volume = core::clamp01(variant.volume * volume_mul);
    params.pitch = random_.range(variant.pitch.min, variant.pitch.max);
    params.loop = loop_override.value_or(false);
    apply_spatial(params, registry::SpatialSettings{});
    params.bus = config_.default_effect_bus;
    start_voice(*channel);
    return channel;
}

void PlaybackEngine::stop_effect(const Channel* handle, float fade_seconds) {
    Channel* channel = mutable_channel(handle);
    if(!channel) return;
    stop_channel(*channel, fade_seconds);
}

void PlaybackEngine::stop_channel(Channel& channel, float fade_seconds) {
    if(fade_seconds <= 0.0f) {
        hard_stop(channel);
        return;
    }

    const core::Epoch playback_epoch = channel.bump_all();
    const core::Epoch volume_epoch = core::capture(channel.volume_lane());
    channel.end_sequence();
    tasks_.post(std::make_unique<FadeOutAndStop>(channel, output_, playback_epoch, volume_epoch,
                                                 clock_.now(), fade_seconds));
}

// Music --------------------------------------------------------------------

const Channel* PlaybackEngine::play_music(const std::string& name, float volume_mul, std::optional<bool> loop_override) {
    return play_music_layer(0, name, volume_mul, loop_override);
}

const Channel* PlaybackEngine::play_music(const registry::SoundEntryPtr& entry, float volume_mul,
                                          std::optional<bool> loop_override) {
    return play_music_layer(0, entry, volume_mul, loop_override);
}

const Channel* PlaybackEngine::play_music_layer(int layer, const std::string& name, float volume_mul,
                                                std::optional<bool> loop_override) {
    if(!registry_) {
        sk::log::warn("PlaybackEngine: No sound registry assigned.");
        return nullptr;
    }

    auto music = registry_->get_music(name);
    if(!music) {
        sk::log::warn("PlaybackEngine: Missing music '" + name + "'.");
        return nullptr;
    }
    return play_music_definition(layer, *music, volume_mul, loop_override);
}

const Channel* PlaybackEngine::play_music_layer(int layer, const registry::SoundEntryPtr& entry, float volume_mul,
                                                std::optional<bool> loop_override) {
    if(!entry) {
        sk::log::warn("PlaybackEngine: Missing music entry.");
        return nullptr;
    }
    if(!entry->is<registry::MusicDefinition>()) {
        sk::log::warn("PlaybackEngine: Entry '" + entry->name + "' is not a music type.");
        return nullptr;
    }
    return play_music_definition(layer, *entry, volume_mul, loop_override);
}

const Channel* PlaybackEngine::play_music_definition(int layer, const registry::SoundEntry& entry, float volume_mul,
                                                     std::optional<bool> loop_override) {
    const auto& music = *entry.as<registry::MusicDefinition>();
    if(!music.clip) {
        sk::log::warn("PlaybackEngine: Missing clip for music '" + entry.name + "'.");
        return nullptr;
    }

    Channel* channel = layer_channel(layer);
    if(!channel) {
        sk::log::warn("PlaybackEngine: Invalid music layer " + std::to_string(layer) + ".");
        return nullptr;
    }

    const core::Epoch epoch = channel->bump_all();
    stamp(*channel);

    auto& params = channel->params();
    params.clip = music.clip;
    params.volume = core::clamp01(music.volume * volume_mul);
    params.pitch = random_.range(music.pitch.min, music.pitch.max);
    params.loop = loop_override.value_or(music.loop);
    params.spatial_blend = 0.0f;
    params.bus = music.bus ? music.bus : config_.default_music_bus;

    if(!music.intro_clip || !music.loop_clip) {
        start_voice(*channel);
        return channel;
    }

    params.loop = false;
    params.clip = music.intro_clip;
    start_voice(*channel);

    // Swap to the loop once the intro has really finished playing.
    const double due = clock_.now() + audio::playback_seconds(*music.intro_clip, params.pitch);
    const core::Epoch volume_epoch = core::capture(channel->volume_lane());
    tasks_.post_delayed(due, epoch,
        [this, channel, loop_clip = music.loop_clip, pitch = params.pitch, volume = params.volume,
         bus = params.bus, looping = loop_override.value_or(true), volume_epoch]() {
            auto& p = channel->params();
            p.clip = loop_clip;
            p.pitch = pitch;
            // A fade started after play owns the volume from here on.
            if(volume_epoch.valid()) p.volume = volume;
            p.bus = bus;
            p.loop = looping;
            start_voice(*channel);
            SK_PLAYBACK_TRACE("PlaybackEngine: intro finished, looping '" + loop_clip->name + "'");
        });
    return channel;
}

const Channel* PlaybackEngine::play_music_layer_clip(int layer, const registry::SoundEntryPtr& music_entry,
                                                     audio::ClipRef clip, float volume_mul,
                                                     std::optional<bool> loop_override) {
    const auto* music = music_entry ? music_entry->as<registry::MusicDefinition>() : nullptr;
    if(!music) {
        sk::log::warn("PlaybackEngine: Missing music definition.");
        return nullptr;
    }
    if(!clip) {
        sk::log::warn("PlaybackEngine: Missing clip for music '" + music_entry->name + "'.");
        return nullptr;
    }

    Channel* channel = layer_channel(layer);
    if(!channel) {
        sk::log::warn("PlaybackEngine: Invalid music layer " + std::to_string(layer) + ".");
        return nullptr;
    }

    channel->bump_all();
    stamp(*channel);

    auto& params = channel->params();
    params.clip = std::move(clip);
    params.volume = core::clamp01(music->volume * volume_mul);
    params.pitch = random_.range(music->pitch.min, music->pitch.max);
    params.loop = loop_override.value_or(music->loop);
    params.spatial_blend = 0.0f;
    params.bus = music->bus ? music->bus : config_.default_music_bus;
    start_voice(*channel);
    return channel;
}

void PlaybackEngine::stop_music(float fade_seconds) {
    for(size_t i = 0; i < music_.size(); ++i) {
        stop_channel(*music_[i], fade_seconds);
    }
}

void PlaybackEngine::stop_music_layer(int layer, float fade_seconds) {
    Channel* channel = layer_channel(layer);
    if(!channel) {
        sk::log::warn("PlaybackEngine: Invalid music layer " + std::to_string(layer) + ".");
        return;
    }
    stop_channel(*channel, fade_seconds);
}

bool PlaybackEngine::fade_music_layer_volume(int layer, float target_volume, float fade_seconds) {
    Channel* channel = layer_channel(layer);
    if(!channel) {
        sk::log::warn("PlaybackEngine: Invalid music layer " + std::to_string(layer) + ".");
        return false;
    }

    target_volume = core::clamp01(target_volume);
    const core::Epoch epoch = core::advance(channel->volume_lane());
    if(fade_seconds <= 0.0f) {
        channel->params().volume = target_volume;
        push(*channel);
        return true;
    }

    tasks_.post(std::make_unique<VolumeFade>(*channel, output_, epoch, target_volume, clock_.now(), fade_seconds));
    return true;
}

bool PlaybackEngine::fade_bus_parameter(const audio::BusRef& bus, const std::string& param, float target,
                                        float fade_seconds) {
    if(!bus) {
        sk::log::warn("PlaybackEngine: Missing bus for fade.");
        return false;
    }
    if(std::all_of(param.begin(), param.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
        sk::log::warn("PlaybackEngine: Missing parameter name for fade on bus '" + bus->name() + "'.");
        return false;
    }

    float start = target;
    bus->try_get_param(param, start);

    const core::Epoch epoch = core::advance(bus_generation(*bus, param));
    if(fade_seconds <= 0.0f) {
        bus->set_param(param, target);
        return true;
    }

    tasks_.post(std::make_unique<BusParameterFade>(bus, param, epoch, start, target, clock_.now(), fade_seconds));
    return true;
}

core::Generation& PlaybackEngine::bus_generation(const audio::Bus& bus, const std::string& param) {
    return bus_generations_[std::make_pair(bus.id(), param)];
}

// Narration ----------------------------------------------------------------

const Channel* PlaybackEngine::play_narration(const std::string& name, const core::Vec3& position,
                                              FollowTarget follow, float volume_mul) {
    if(!registry_) {
        sk::log::warn("PlaybackEngine: No sound registry assigned.");
        return nullptr;
    }

    registry::SoundEntryPtr group = registry_->get_narration_group(name);
    registry::SoundEntryPtr forced;
    if(!group) {
        if(auto path = registry_->try_resolve_narration_path(name)) {
            group = path->group;
            forced = path->entry;
        }
    }

    if(!group) {
        sk::log::warn("PlaybackEngine: Missing narration '" + name + "'.");
        return nullptr;
    }
    return start_narration_sequence(group, forced, position, std::move(follow), volume_mul);
}

const Channel* PlaybackEngine::play_narration(const registry::SoundEntryPtr& entry, const core::Vec3& position,
                                              FollowTarget follow, float volume_mul) {
    if(!entry) {
        sk::log::warn("PlaybackEngine: Missing narration entry.");
        return nullptr;
    }
    if(entry->is<registry::NarrationGroup>()) {
        return start_narration_sequence(entry, nullptr, position, std::move(follow), volume_mul);
    }
    if(registry::as_narration_playable(*entry)) {
        return play_narration_playable(*entry, position, std::move(follow), volume_mul);
    }

    sk::log::warn("PlaybackEngine: Entry '" + entry->name + "' is not a narration type.");
    return nullptr;
}

const Channel* PlaybackEngine::start_narration_sequence(const registry::SoundEntryPtr& group_entry,
                                                        const registry::SoundEntryPtr& forced,
                                                        const core::Vec3& position, FollowTarget follow,
                                                        float volume_mul) {
    const auto& group = *group_entry->as<registry::NarrationGroup>();

    std::vector<registry::SoundEntryPtr> entries;
    if(forced) {
        entries.push_back(forced);
    } else {
        entries.assign(group.entries.begin(), group.entries.end());
    }
    if(entries.empty()) {
        sk::log::warn("PlaybackEngine: Narration group '" + group_entry->name + "' has no clips.");
        return nullptr;
    }

    Channel* channel = acquire_narration_channel();
    if(!channel) {
        sk::log::warn("PlaybackEngine: No narration channels available.");
        return nullptr;
    }
    place(*channel, position, std::move(follow));

    const core::Epoch epoch = core::capture(channel->playback_lane());
    channel->begin_sequence(epoch);

    auto sequence = std::make_unique<NarrationSequence>(*channel, output_, random_, epoch, group_entry,
                                                        std::move(entries), volume_mul,
                                                        config_.default_narration_bus);
    // First step runs now so an entry without pre-delay starts in this call.
    if(sequence->resume(clock_.now()) == core::TaskState::Pending) {
        tasks_.post(std::move(sequence));
    }
    return channel;
}

const Channel* PlaybackEngine::play_narration_playable(const registry::SoundEntry& entry, const core::Vec3& position,
                                                       FollowTarget follow, float volume_mul) {
    const auto& playable = *registry::as_narration_playable(entry);
    if(!playable.clip) {
        sk::log::warn("PlaybackEngine: Missing clip for narration '" + entry.name + "'.");
        return nullptr;
    }

    Channel* channel = acquire_narration_channel();
    if(!channel) {
        sk::log::warn("PlaybackEngine: No narration channels available.");
        return nullptr;
    }
    place(*channel, position, std::move(follow));

    auto& params = channel->params();
    params.clip = playable.clip;
    params.volume = core::clamp01(playable.volume * volume_mul);
    params.pitch = 1.0f;
    params.loop = false;
    apply_spatial(params, registry::SpatialSettings{0.0f, 1.0f, 25.0f});
    params.bus = config_.default_narration_bus;
    start_voice(*channel);
    return channel;
}

// Channel control ----------------------------------------------------------

void PlaybackEngine::set_channel_volume(const Channel* handle, float volume) {
    Channel* channel = mutable_channel(handle);
    if(!channel) return;
    channel->params().volume = core::clamp01(volume);
    push(*channel);
}

void PlaybackEngine::set_channel_pitch(const Channel* handle, float pitch) {
    Channel* channel = mutable_channel(handle);
    if(!channel) return;
    channel->params().pitch = pitch;
    push(*channel);
}

bool PlaybackEngine::is_playing(const Channel* handle) const {
    if(!handle) return false;
    return output_.is_playing(handle->voice()) || handle->sequence_active();
}

const Channel* PlaybackEngine::music_layer(int layer) const {
    if(layer < 0 || static_cast<size_t>(layer) >= music_.size()) return nullptr;
    return music_[static_cast<size_t>(layer)].get();
}

Channel* PlaybackEngine::layer_channel(int layer) {
    if(layer < 0 || static_cast<size_t>(layer) >= music_.size()) return nullptr;
    return music_[static_cast<size_t>(layer)].get();
}

Channel* PlaybackEngine::mutable_channel(const Channel* handle) {
    if(!handle) return nullptr;
    std::vector<std::unique_ptr<Channel>>* pool = nullptr;
    switch(handle->kind()) {
        case ChannelKind::Effect: pool = &effects_; break;
        case ChannelKind::Music: pool = &music_; break;
        case ChannelKind::Narration: pool = &narration_; break;
    }
    if(!pool || handle->index() >= pool->size()) return nullptr;
    Channel* channel = (*pool)[handle->index()].get();
    return channel == handle ? channel : nullptr;
}

Channel* PlaybackEngine::acquire_effect_channel() {
    for(auto& channel : effects_) {
        if(!output_.is_playing(channel->voice())) {
            channel->bump_all();
            stamp(*channel);
            return channel.get();
        }
    }

    // Saturated: truncate the least recently assigned sound.
    auto oldest = std::min_element(effects_.begin(), effects_.end(),
        [](const std::unique_ptr<Channel>& a, const std::unique_ptr<Channel>& b) {
            return a->assign_serial() < b->assign_serial();
        });
    if(oldest == effects_.end()) return nullptr;
    SK_PLAYBACK_TRACE("PlaybackEngine: effect pool saturated, reusing channel " + std::to_string((*oldest)->index()));
    hard_stop(**oldest);
    stamp(**oldest);
    return oldest->get();
}

Channel* PlaybackEngine::acquire_narration_channel() {
    for(auto& channel : narration_) {
        if(!output_.is_playing(channel->voice()) && !channel->sequence_active()) {
            channel->bump_all();
            stamp(*channel);
            return channel.get();
        }
    }

    auto oldest = std::min_element(narration_.begin(), narration_.end(),
        [](const std::unique_ptr<Channel>& a, const std::unique_ptr<Channel>& b) {
            return a->assign_serial() < b->assign_serial();
        });
    if(oldest == narration_.end()) return nullptr;
    SK_PLAYBACK_TRACE("PlaybackEngine: narration pool saturated, reusing channel " + std::to_string((*oldest)->index()));
    hard_stop(**oldest);
    stamp(**oldest);
    return oldest->get();
}

void PlaybackEngine::stamp(Channel& channel) {
    channel.set_assign_serial(++next_serial_);
}

void PlaybackEngine::hard_stop(Channel& channel) {
    channel.bump_all();
    channel.end_sequence();
    output_.stop(channel.voice());
    channel.clear_follow();
}

void PlaybackEngine::place(Channel& channel, const core::Vec3& position, FollowTarget follow) {
    channel.params().position = position;
    if(follow) {
        channel.set_follow(follow);
    } else {
        channel.clear_follow();
    }
}

void PlaybackEngine::start_voice(Channel& channel) {
    output_.start(channel.voice(), channel.params());
    SK_PLAYBACK_TRACE(std::string("PlaybackEngine: start ") + channel_kind_name(channel.kind()) + " voice " +
                      std::to_string(channel.voice()) + " gen " + std::to_string(channel.generation()));
}

void PlaybackEngine::push(Channel& channel) {
    output_.apply(channel.voice(), channel.params());
}

void PlaybackEngine::update() {
    const double now = clock_.now();

    auto follow = [this](std::vector<std::unique_ptr<Channel>>& pool) {
        for(auto& channel : pool) {
            auto target = channel->follow_target();
            if(!target || target->position == channel->position()) continue;
            channel->params().position = target->position;
            push(*channel);
        }
    };
    follow(effects_);
    follow(narration_);

    tasks_.tick(now);
}

} // namespace sk::playback
