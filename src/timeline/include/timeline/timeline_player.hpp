#pragma once

#include "timeline/schedule.hpp"
#include "playback/playback_engine.hpp"
#include "core/clock.hpp"
#include "core/generation.hpp"
#include "core/task_queue.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sk::timeline {

/**
 * @brief Plays a compiled timeline against the engine
 *
 * Elapsed time is re-derived every update as `clock.now() - start`, so frame pacing never
 * accumulates drift. Per update the order is fixed: beat ticks, then due events in
 * schedule order, then automations (ticked newest first).
 */
class TimelinePlayer {
public:
    using BeatListener = std::function<void(int beat, int bar, int beat_in_bar)>;
    using MarkerListener = std::function<void(const std::string& label)>;
    using ListenerId = uint64_t;

    TimelinePlayer(playback::PlaybackEngine& engine, const core::Clock& clock);

    TimelinePlayer(const TimelinePlayer&) = delete;
    TimelinePlayer& operator=(const TimelinePlayer&) = delete;

    void set_timeline(TimelinePtr timeline) { timeline_ = std::move(timeline); }
    const TimelinePtr& timeline() const { return timeline_; }

    // Registry used for name references instead of the engine's; nullptr restores the engine's.
    void set_registry_override(const registry::SoundRegistry* registry) { registry_override_ = registry; }

    // Emitter position is sampled when an event fires; follow-emitter events track it afterwards.
    void set_emitter(std::shared_ptr<const core::Transform> emitter) { emitter_ = std::move(emitter); }
    void set_position_offset(const core::Vec3& offset) { position_offset_ = offset; }

    void set_log_beats(bool enabled) { log_beats_ = enabled; }

    ListenerId add_beat_listener(BeatListener listener);
    ListenerId add_marker_listener(MarkerListener listener);
    bool remove_beat_listener(ListenerId id);
    bool remove_marker_listener(ListenerId id);

    // Compiles the schedule and starts from zero. False when no timeline is set.
    bool play();
    // Drops automations, event channels and deferred starts. Sounds keep playing.
    void stop();
    bool is_playing() const { return playing_; }

    void update();

    const Schedule& schedule() const { return schedule_; }
    double elapsed() const { return elapsed_; }
    double seconds_per_beat() const { return schedule_.seconds_per_beat; }
    double loop_length_seconds() const { return schedule_.loop_length_seconds; }
    size_t next_event_index() const { return next_event_; }
    int last_beat_index() const { return last_beat_; }
    size_t active_automation_count() const { return automations_.size(); }

    // Channel recorded for a fired play event, by fully-qualified id.
    const playback::Channel* event_channel(const std::string& event_id) const;

private:
    struct ActiveAutomation {
        const AutomationEvent* automation = nullptr;
        std::string target_id;
        double start_seconds = 0.0;
        double duration_seconds = 0.0;
    };

    registry::SoundEntryPtr resolve_entry(const SoundReference& reference) const;
    const registry::SoundRegistry* active_registry() const;

    void tick_beats(double elapsed, const core::Epoch& run);
    void fire_due_events(double elapsed, const core::Epoch& run);
    void fire(const ScheduledEvent& scheduled, double elapsed);
    void tick_automations(double elapsed);
    void apply_automation(const AutomationEvent& automation, const std::string& target_id, float t);

    const playback::Channel* play_effect_event(const PlayEffectEvent& event);
    const playback::Channel* play_music_event(const PlayMusicEvent& event);
    const playback::Channel* play_narration_event(const PlayNarrationEvent& event);
    core::Vec3 emission_position(bool use_emitter_position, const core::Vec3& event_offset) const;

    playback::PlaybackEngine& engine_;
    const core::Clock& clock_;
    const registry::SoundRegistry* registry_override_ = nullptr;

    TimelinePtr timeline_;
    std::shared_ptr<const core::Transform> emitter_;
    core::Vec3 position_offset_;
    bool log_beats_ = false;

    Schedule schedule_;
    bool playing_ = false;
    double start_time_ = 0.0;
    double elapsed_ = 0.0;
    size_t next_event_ = 0;
    int last_beat_ = -1;
    std::vector<ActiveAutomation> automations_;
    std::unordered_map<std::string, const playback::Channel*> event_channels_;

    core::Generation play_generation_;
    core::TaskQueue deferred_;

    template<typename Fn>
    struct Listener { ListenerId id; Fn fn; };
    std::vector<Listener<BeatListener>> beat_listeners_;
    std::vector<Listener<MarkerListener>> marker_listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace sk::timeline
