#pragma once

#include "timeline/curve.hpp"
#include "registry/sound_entry.hpp"
#include "core/math.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sk::timeline {

struct Timeline;
using TimelinePtr = std::shared_ptr<const Timeline>;

enum class TimeMode { Beats, Seconds };

enum class AutomationTarget { SourceVolume, SourcePitch, BusParameter };

// A sound named either by a direct entry (takes precedence) or by registry name.
struct SoundReference {
    std::string name;
    registry::SoundEntryPtr entry;
};

struct PlayEffectEvent {
    SoundReference sound;
    float volume_multiplier = 1.0f;
    bool override_loop = false;
    bool loop = false;
    bool follow_emitter = false;
    bool use_emitter_position = true;
    core::Vec3 position_offset;
};

struct PlayMusicEvent {
    SoundReference music;
    int layer_index = 0;
    float volume_multiplier = 1.0f;
    bool override_loop = true;
    bool loop = true;
    bool align_to_beat = true;   ///< defer the start to the next beat boundary
};

struct PlayNarrationEvent {
    SoundReference narration;
    float volume_multiplier = 1.0f;
    bool follow_emitter = false;
    bool use_emitter_position = true;
    core::Vec3 position_offset;
};

struct AutomationEvent {
    std::string target_event_id;   ///< relative to the enclosing timeline
    AutomationTarget target = AutomationTarget::SourceVolume;
    Curve curve = Curve::linear(0.0f, 0.0f, 1.0f, 1.0f);
    float min_value = 0.0f;
    float max_value = 1.0f;
    audio::BusRef bus;             ///< BusParameter target only
    std::string bus_param;
};

struct BeatMarkerEvent {
    std::string label;
};

struct NestedTimelineEvent {
    TimelinePtr timeline;
    float time_scale = 1.0f;       ///< floored at 0.01 when compiled
    std::string id_prefix;         ///< empty: "<event id>/"
    bool include_child_start_offset = true;
};

using EventPayload = std::variant<PlayEffectEvent, PlayMusicEvent, PlayNarrationEvent,
                                  AutomationEvent, BeatMarkerEvent, NestedTimelineEvent>;

enum class EventKind { PlayEffect, PlayMusic, PlayNarration, Automation, BeatMarker, Nested };

const char* event_kind_name(EventKind kind);

struct TimelineEvent {
    std::string id;
    bool enabled = true;
    TimeMode time_mode = TimeMode::Beats;
    float start = 0.0f;
    float duration = 0.0f;
    EventPayload payload;

    EventKind kind() const { return static_cast<EventKind>(payload.index()); }
    template<typename T> bool is() const { return std::holds_alternative<T>(payload); }
    template<typename T> const T* as() const { return std::get_if<T>(&payload); }
    template<typename T> T* as() { return std::get_if<T>(&payload); }
};

struct TempoSettings {
    float bpm = 120.0f;            ///< <= 0 enables detection (or the 120 default)
    bool auto_detect_bpm = true;
    int beats_per_bar = 4;
    int bars_for_bpm_fallback = 4;
};

struct PlaybackSettings {
    float start_offset_seconds = 0.0f;
    bool loop = false;
    float loop_length_beats = 0.0f;   ///< <= 0: loop over the compiled schedule's end
};

/**
 * @brief Authored timeline: tempo, playback settings and an event list
 *
 * Nested events share child timelines by pointer; the same child may be included any
 * number of times.
 */
struct Timeline {
    std::string name;
    TempoSettings tempo;
    PlaybackSettings playback;
    std::vector<TimelineEvent> events;
};

} // namespace sk::timeline
