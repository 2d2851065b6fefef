#include "music/layer_mixer.hpp"
#include "registry/sound_registry.hpp"
#include "core/log.hpp"
#include "core/math.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace sk::music {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void apply_entry_rules(const MixVariable& variable, const VariableEntry& entry, DecisionMap& decisions) {
    for(const auto& rule : entry.rules) {
        if(is_blank(rule.layer_name)) continue;
        auto it = decisions.find(rule.layer_name);
        // Non-strict: among equal priorities the later variable wins.
        if(it == decisions.end() || variable.priority >= it->second.priority) {
            decisions[rule.layer_name] = LayerDecision{variable.priority, rule.play};
        }
    }
}

} // namespace

int resolve_entry_index(const MixVariable& variable) {
    const int count = static_cast<int>(variable.entries.size());
    if(count == 0) return -1;
    if(!std::isfinite(variable.value)) return 0;

    if(variable.is_int) {
        // Round half to even, like the authoring tools.
        const long rounded = std::lrint(variable.value);
        return static_cast<int>(std::clamp<long>(rounded, 0, count - 1));
    }

    if(core::approximately(variable.float_min, variable.float_max)) return 0;

    const float t = core::inverse_lerp(variable.float_min, variable.float_max, variable.value);
    const int mapped = static_cast<int>(std::floor(t * static_cast<float>(count)));
    return std::clamp(mapped, 0, count - 1);
}

LayerMixer::LayerMixer(MixerConfig config, playback::PlaybackEngine& engine, const core::Clock& clock)
    : config_(std::move(config)), engine_(engine), clock_(clock) {}

void LayerMixer::start_music() {
    start_internal(true);
}

void LayerMixer::start_internal(bool apply_start_delay) {
    if(started_) return;
    started_ = true;

    const core::Epoch epoch = core::advance(start_generation_);
    const float delay = apply_start_delay ? std::max(0.0f, config_.start_delay_seconds) : 0.0f;
    if(delay <= 0.0f) {
        start_layers();
        return;
    }
    tasks_.post_delayed(clock_.now() + delay, epoch, [this]() { start_layers(); });
}

void LayerMixer::start_layers() {
    base_volumes_.clear();
    active_state_.clear();

    const int engine_layers = static_cast<int>(engine_.music_layer_count());
    for(size_t i = 0; i < config_.layers.size(); ++i) {
        const auto& layer = config_.layers[i];
        if(is_blank(layer.layer_name)) continue;

        const int index = static_cast<int>(i);
        const playback::Channel* channel = nullptr;
        if(!is_blank(layer.music_name)) {
            channel = engine_.play_music_layer(index, layer.music_name, config_.music_volume, true);
        }
        base_volumes_[layer.layer_name] = channel ? channel->volume() : 0.0f;
        active_state_[layer.layer_name] = false;

        // Hold silent until the forced mix below fades the wanted layers in.
        if(channel && index < engine_layers) engine_.fade_music_layer_volume(index, 0.0f, 0.0f);
    }

    live_ = true;
    sk::log::info("LayerMixer: started " + std::to_string(base_volumes_.size()) + " layers");
    apply_layer_mix(true);
}

void LayerMixer::stop_music() {
    if(!started_) return;
    stop_internal(config_.fade_seconds);
}

void LayerMixer::stop_music_immediate() {
    if(!started_) return;
    stop_internal(0.0f);
}

void LayerMixer::stop_internal(float fade_seconds) {
    started_ = false;
    live_ = false;
    core::advance(start_generation_);

    const size_t engine_layers = engine_.music_layer_count();
    for(size_t i = 0; i < config_.layers.size() && i < engine_layers; ++i) {
        engine_.stop_music_layer(static_cast<int>(i), fade_seconds);
    }

    base_volumes_.clear();
    active_state_.clear();
}

void LayerMixer::restart_after_interruption() {
    const core::Epoch epoch = core::advance(restart_generation_);
    stop_internal(0.0f);

    const float delay = std::max(0.0f, config_.restart_delay_seconds);
    if(delay <= 0.0f) {
        start_internal(false);
        return;
    }
    tasks_.post_delayed(clock_.now() + delay, epoch, [this]() { start_internal(false); });
}

bool LayerMixer::set_variable(const std::string& name, float value) {
    if(is_blank(name)) {
        sk::log::warn("LayerMixer: Missing variable name for set_variable.");
        return false;
    }

    MixVariable* variable = find_variable(name);
    if(!variable) {
        sk::log::warn("LayerMixer: Missing variable '" + name + "'.");
        return false;
    }

    if(!std::isfinite(value)) {
        sk::log::warn("LayerMixer: Ignoring non-finite value for variable '" + variable->name + "'.");
        return false;
    }

    variable->value = value;
    apply_layer_mix(false);
    return true;
}

bool LayerMixer::set_variable(const std::string& name, int value) {
    return set_variable(name, static_cast<float>(value));
}

std::optional<float> LayerMixer::variable_value(const std::string& name) const {
    const MixVariable* variable = find_variable(name);
    if(!variable) return std::nullopt;
    return variable->value;
}

const MixVariable* LayerMixer::find_variable(const std::string& name) const {
    for(const auto& variable : config_.variables) {
        if(registry::iequals(variable.name, name)) return &variable;
    }
    return nullptr;
}

MixVariable* LayerMixer::find_variable(const std::string& name) {
    return const_cast<MixVariable*>(static_cast<const LayerMixer*>(this)->find_variable(name));
}

std::optional<bool> LayerMixer::layer_state(const std::string& layer_name) const {
    auto it = active_state_.find(layer_name);
    if(it == active_state_.end()) return std::nullopt;
    return it->second;
}

float LayerMixer::base_volume(const std::string& layer_name) const {
    auto it = base_volumes_.find(layer_name);
    return it == base_volumes_.end() ? 0.0f : it->second;
}

DecisionMap LayerMixer::build_decisions() const {
    DecisionMap decisions;
    for(const auto& variable : config_.variables) {
        const int index = resolve_entry_index(variable);
        if(index < 0) continue;

        if(variable.play_all_ahead) {
            for(int i = 0; i <= index; ++i) {
                apply_entry_rules(variable, variable.entries[static_cast<size_t>(i)], decisions);
            }
        } else {
            apply_entry_rules(variable, variable.entries[static_cast<size_t>(index)], decisions);
        }
    }
    return decisions;
}

void LayerMixer::apply_layer_mix(bool force) {
    if(!started_ || !live_) return;

    const DecisionMap decisions = build_decisions();
    const int engine_layers = static_cast<int>(engine_.music_layer_count());

    for(size_t i = 0; i < config_.layers.size(); ++i) {
        const auto& layer = config_.layers[i];
        if(is_blank(layer.layer_name)) continue;

        auto decision = decisions.find(layer.layer_name);
        const bool should_play = decision != decisions.end() && decision->second.play;

        auto current = active_state_.find(layer.layer_name);
        if(!force && current != active_state_.end() && current->second == should_play) continue;
        active_state_[layer.layer_name] = should_play;

        const int index = static_cast<int>(i);
        if(index >= engine_layers) continue;
        const float target = should_play ? base_volume(layer.layer_name) : 0.0f;
        engine_.fade_music_layer_volume(index, target, config_.fade_seconds);
    }
}

void LayerMixer::update() {
    tasks_.tick(clock_.now());
}

} // namespace sk::music
