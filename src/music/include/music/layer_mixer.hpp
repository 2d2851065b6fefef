#pragma once

#include "playback/playback_engine.hpp"
#include "core/clock.hpp"
#include "core/generation.hpp"
#include "core/task_queue.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sk::music {

// One configured music layer; `index` in MixerConfig::layers is the engine layer it plays on.
struct MusicLayer {
    std::string layer_name;
    std::string music_name;   ///< registry name; empty leaves the layer silent
};

struct LayerRule {
    std::string layer_name;
    bool play = true;
};

struct VariableEntry {
    std::string entry_name;
    std::vector<LayerRule> rules;
};

/**
 * @brief Named input of the mix
 *
 * The value selects one entry (integer mode rounds, float mode maps [float_min,float_max]
 * onto the entry range). With play_all_ahead the rules of every entry up to the selected
 * one apply.
 */
struct MixVariable {
    std::string name;
    float value = 0.0f;
    bool play_all_ahead = false;
    float float_min = 0.0f;
    float float_max = 1.0f;
    bool is_int = true;
    int priority = 0;
    std::vector<VariableEntry> entries;
};

struct MixerConfig {
    std::vector<MusicLayer> layers;
    std::vector<MixVariable> variables;
    float music_volume = 1.0f;
    float fade_seconds = 1.0f;
    float start_delay_seconds = 1.0f;
    float restart_delay_seconds = 1.0f;
};

struct LayerDecision {
    int priority = 0;
    bool play = false;
};

using DecisionMap = std::unordered_map<std::string, LayerDecision>;

/**
 * @brief Variable-driven on/off mix over the engine's music layers
 *
 * Every set_variable() recomputes all decisions and fades the layers whose decision changed.
 * Conflicting rules for one layer resolve by priority; equal priority lets the variable
 * declared later win.
 */
class LayerMixer {
public:
    LayerMixer(MixerConfig config, playback::PlaybackEngine& engine, const core::Clock& clock);

    LayerMixer(const LayerMixer&) = delete;
    LayerMixer& operator=(const LayerMixer&) = delete;

    // Starts every layer muted after the configured start delay; no-op while started.
    void start_music();
    // Fades every layer out over fade_seconds.
    void stop_music();
    void stop_music_immediate();
    // Stops immediately, waits restart_delay_seconds, starts again without the start delay.
    void restart_after_interruption();

    bool set_variable(const std::string& name, float value);
    bool set_variable(const std::string& name, int value);
    std::optional<float> variable_value(const std::string& name) const;

    bool is_started() const { return started_; }
    bool layers_live() const { return live_; }

    // Last decision pushed to the layer; empty before the layers went live.
    std::optional<bool> layer_state(const std::string& layer_name) const;
    float base_volume(const std::string& layer_name) const;

    DecisionMap build_decisions() const;

    const MixerConfig& config() const { return config_; }

    void update();

private:
    void start_internal(bool apply_start_delay);
    void start_layers();
    void stop_internal(float fade_seconds);
    void apply_layer_mix(bool force);
    const MixVariable* find_variable(const std::string& name) const;
    MixVariable* find_variable(const std::string& name);

    MixerConfig config_;
    playback::PlaybackEngine& engine_;
    const core::Clock& clock_;

    bool started_ = false;
    bool live_ = false;
    std::unordered_map<std::string, float> base_volumes_;
    std::unordered_map<std::string, bool> active_state_;

    core::Generation start_generation_;
    core::Generation restart_generation_;
    core::TaskQueue tasks_;
};

// Entry selected by the variable's current value, or -1 when it has no entries.
int resolve_entry_index(const MixVariable& variable);

} // namespace sk::music
