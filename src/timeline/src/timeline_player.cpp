#include "timeline/timeline_player.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <optional>

namespace sk::timeline {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

template<typename List>
bool remove_listener(List& list, uint64_t id) {
    auto it = std::find_if(list.begin(), list.end(), [id](const auto& l) { return l.id == id; });
    if(it == list.end()) return false;
    list.erase(it);
    return true;
}

} // namespace

TimelinePlayer::TimelinePlayer(playback::PlaybackEngine& engine, const core::Clock& clock)
    : engine_(engine), clock_(clock) {}

TimelinePlayer::ListenerId TimelinePlayer::add_beat_listener(BeatListener listener) {
    if(!listener) return 0;
    const ListenerId id = next_listener_id_++;
    beat_listeners_.push_back(Listener<BeatListener>{id, std::move(listener)});
    return id;
}

TimelinePlayer::ListenerId TimelinePlayer::add_marker_listener(MarkerListener listener) {
    if(!listener) return 0;
    const ListenerId id = next_listener_id_++;
    marker_listeners_.push_back(Listener<MarkerListener>{id, std::move(listener)});
    return id;
}

bool TimelinePlayer::remove_beat_listener(ListenerId id) { return remove_listener(beat_listeners_, id); }
bool TimelinePlayer::remove_marker_listener(ListenerId id) { return remove_listener(marker_listeners_, id); }

bool TimelinePlayer::play() {
    if(!timeline_) {
        sk::log::warn("TimelinePlayer: Missing timeline.");
        return false;
    }

    core::advance(play_generation_);
    deferred_.clear();
    automations_.clear();
    event_channels_.clear();
    next_event_ = 0;
    last_beat_ = -1;
    elapsed_ = 0.0;

    schedule_ = build_schedule(timeline_, [this](const SoundReference& reference) { return resolve_entry(reference); });
    start_time_ = clock_.now();
    playing_ = true;

    sk::log::info("TimelinePlayer: Playing '" + timeline_->name + "' (" + std::to_string(schedule_.events.size()) +
                  " events, " + std::to_string(schedule_.bpm) + " bpm)");
    return true;
}

void TimelinePlayer::stop() {
    playing_ = false;
    core::advance(play_generation_);
    deferred_.clear();
    automations_.clear();
    event_channels_.clear();
}

const playback::Channel* TimelinePlayer::event_channel(const std::string& event_id) const {
    if(is_blank(event_id)) return nullptr;
    auto it = event_channels_.find(event_id);
    return it == event_channels_.end() ? nullptr : it->second;
}

void TimelinePlayer::update() {
    if(!playing_ || !schedule_.root) return;
    const TimelinePtr keep_alive = schedule_.root;
    // A listener may call play() or stop(); the rest of this update then belongs to a dead run.
    const core::Epoch run = core::capture(play_generation_);

    const double now = clock_.now();
    double elapsed = now - start_time_;
    if(elapsed < 0.0) return;

    const double loop_length = schedule_.loop_length_seconds;
    if(keep_alive->playback.loop && loop_length > 0.0 && elapsed >= loop_length) {
        while(elapsed >= loop_length) {
            start_time_ += loop_length;
            elapsed -= loop_length;
        }
        next_event_ = 0;
        automations_.clear();
        last_beat_ = -1;
    }
    elapsed_ = elapsed;

    tick_beats(elapsed, run);
    if(!run.valid()) return;
    fire_due_events(elapsed, run);
    if(!run.valid()) return;
    tick_automations(elapsed);
    deferred_.tick(now);
}

void TimelinePlayer::tick_beats(double elapsed, const core::Epoch& run) {
    const double spb = schedule_.seconds_per_beat;
    if(spb <= 0.0) return;

    const int beat = static_cast<int>(std::floor(elapsed / spb));
    if(beat <= last_beat_) return;

    const int beats_per_bar = std::max(1, schedule_.root->tempo.beats_per_bar);
    const auto listeners = beat_listeners_;
    for(int i = last_beat_ + 1; i <= beat; ++i) {
        const int bar = i / beats_per_bar;
        const int beat_in_bar = i % beats_per_bar;
        for(const auto& listener : listeners) {
            listener.fn(i, bar, beat_in_bar);
            if(!run.valid()) return;
        }
        if(log_beats_) {
            sk::log::debug("TimelinePlayer: Beat " + std::to_string(i) + " (bar " + std::to_string(bar) +
                           ", beat " + std::to_string(beat_in_bar) + ").");
        }
    }
    last_beat_ = beat;
}

void TimelinePlayer::fire_due_events(double elapsed, const core::Epoch& run) {
    while(run.valid() && next_event_ < schedule_.events.size() &&
          elapsed >= schedule_.events[next_event_].start_seconds) {
        const ScheduledEvent scheduled = schedule_.events[next_event_];
        ++next_event_;
        fire(scheduled, elapsed);
    }
}

void TimelinePlayer::fire(const ScheduledEvent& scheduled, double elapsed) {
    const TimelineEvent& event = *scheduled.event;

    if(const auto* effect = event.as<PlayEffectEvent>()) {
        if(const auto* channel = play_effect_event(*effect)) event_channels_[scheduled.id] = channel;
        return;
    }

    if(const auto* music = event.as<PlayMusicEvent>()) {
        const double spb = schedule_.seconds_per_beat;
        if(!music->align_to_beat || spb <= 0.0) {
            if(const auto* channel = play_music_event(*music)) event_channels_[scheduled.id] = channel;
            return;
        }

        const double beat_position = elapsed / spb;
        const double whole = std::floor(beat_position);
        const double delay = beat_position - whole < 0.001 ? 0.0 : std::max(0.0, (whole + 1.0) * spb - elapsed);
        deferred_.post_delayed(clock_.now() + delay, core::capture(play_generation_),
            [this, music, id = scheduled.id]() {
                if(const auto* channel = play_music_event(*music)) event_channels_[id] = channel;
            });
        return;
    }

    if(const auto* narration = event.as<PlayNarrationEvent>()) {
        if(const auto* channel = play_narration_event(*narration)) event_channels_[scheduled.id] = channel;
        return;
    }

    if(const auto* automation = event.as<AutomationEvent>()) {
        if(scheduled.duration_seconds <= 0.0) {
            apply_automation(*automation, scheduled.target_id, 1.0f);
        } else {
            automations_.push_back(ActiveAutomation{automation, scheduled.target_id,
                                                    scheduled.start_seconds, scheduled.duration_seconds});
        }
        return;
    }

    if(const auto* marker = event.as<BeatMarkerEvent>()) {
        if(is_blank(marker->label)) return;
        const std::string label = marker->label;
        const auto listeners = marker_listeners_;
        const core::Epoch run = core::capture(play_generation_);
        for(const auto& listener : listeners) {
            listener.fn(label);
            if(!run.valid()) return;
        }
    }
}

void TimelinePlayer::tick_automations(double elapsed) {
    // Newest first; finished entries are erased in place.
    for(size_t i = automations_.size(); i-- > 0;) {
        const ActiveAutomation active = automations_[i];
        const double local = elapsed - active.start_seconds;
        if(local < 0.0) continue;

        const float t = active.duration_seconds <= 0.0
            ? 1.0f
            : static_cast<float>(core::clamp01(local / active.duration_seconds));
        apply_automation(*active.automation, active.target_id, t);
        if(t >= 1.0f && i < automations_.size()) {
            automations_.erase(automations_.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
}

void TimelinePlayer::apply_automation(const AutomationEvent& automation, const std::string& target_id, float t) {
    const float shaped = automation.curve.evaluate(t);
    const float value = core::lerp(automation.min_value, automation.max_value, shaped);

    switch(automation.target) {
        case AutomationTarget::SourceVolume:
            if(const auto* channel = event_channel(target_id)) engine_.set_channel_volume(channel, value);
            break;
        case AutomationTarget::SourcePitch:
            if(const auto* channel = event_channel(target_id)) engine_.set_channel_pitch(channel, value);
            break;
        case AutomationTarget::BusParameter:
            if(automation.bus && !is_blank(automation.bus_param)) automation.bus->set_param(automation.bus_param, value);
            break;
    }
}

const registry::SoundRegistry* TimelinePlayer::active_registry() const {
    return registry_override_ ? registry_override_ : engine_.registry();
}

registry::SoundEntryPtr TimelinePlayer::resolve_entry(const SoundReference& reference) const {
    if(reference.entry) return reference.entry;
    if(is_blank(reference.name)) return nullptr;
    const auto* registry = active_registry();
    return registry ? registry->get_entry(reference.name) : nullptr;
}

core::Vec3 TimelinePlayer::emission_position(bool use_emitter_position, const core::Vec3& event_offset) const {
    if(!use_emitter_position) return position_offset_ + event_offset;
    const core::Vec3 emitter = emitter_ ? emitter_->position : core::Vec3{};
    return emitter + position_offset_ + event_offset;
}

const playback::Channel* TimelinePlayer::play_effect_event(const PlayEffectEvent& event) {
    const auto entry = resolve_entry(event.sound);
    const core::Vec3 position = emission_position(event.use_emitter_position, event.position_offset);
    playback::FollowTarget follow = event.follow_emitter ? emitter_ : nullptr;
    const std::optional<bool> loop_override = event.override_loop ? std::optional<bool>(event.loop) : std::nullopt;

    if(entry) return engine_.play_effect(entry, position, std::move(follow), event.volume_multiplier, loop_override);
    return engine_.play_effect(event.sound.name, position, std::move(follow), event.volume_multiplier, loop_override);
}

const playback::Channel* TimelinePlayer::play_music_event(const PlayMusicEvent& event) {
    const auto entry = resolve_entry(event.music);
    const std::optional<bool> loop_override = event.override_loop ? std::optional<bool>(event.loop) : std::nullopt;

    if(entry && entry->is<registry::MusicDefinition>()) {
        return engine_.play_music_layer(event.layer_index, entry, event.volume_multiplier, loop_override);
    }
    return engine_.play_music_layer(event.layer_index, event.music.name, event.volume_multiplier, loop_override);
}

const playback::Channel* TimelinePlayer::play_narration_event(const PlayNarrationEvent& event) {
    const auto entry = resolve_entry(event.narration);
    const core::Vec3 position = emission_position(event.use_emitter_position, event.position_offset);
    playback::FollowTarget follow = event.follow_emitter ? emitter_ : nullptr;

    if(entry) return engine_.play_narration(entry, position, std::move(follow), event.volume_multiplier);
    return engine_.play_narration(event.narration.name, position, std::move(follow), event.volume_multiplier);
}

} // namespace sk::timeline
