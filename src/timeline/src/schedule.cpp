#include "timeline/schedule.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>

namespace sk::timeline {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

const registry::MusicDefinition* find_first_music(const Timeline& timeline, const EntryResolver& resolve, int depth) {
    if(depth > kMaxNestingDepth) return nullptr;
    for(const auto& event : timeline.events) {
        if(const auto* music = event.as<PlayMusicEvent>()) {
            auto entry = resolve ? resolve(music->music) : music->music.entry;
            if(entry) {
                if(const auto* definition = entry->as<registry::MusicDefinition>()) return definition;
            }
        }
        if(const auto* nested = event.as<NestedTimelineEvent>()) {
            if(nested->timeline) {
                if(const auto* found = find_first_music(*nested->timeline, resolve, depth + 1)) return found;
            }
        }
    }
    return nullptr;
}

struct Compiler {
    double seconds_per_beat;
    std::vector<ScheduledEvent>& out;

    void compile(const Timeline& timeline, const std::string& prefix, double offset, double scale, int depth) {
        if(depth > kMaxNestingDepth) {
            sk::log::warn("TimelinePlayer: Nested timeline '" + timeline.name + "' exceeds depth " +
                          std::to_string(kMaxNestingDepth) + "; skipping.");
            return;
        }

        for(size_t i = 0; i < timeline.events.size(); ++i) {
            const TimelineEvent& event = timeline.events[i];
            if(!event.enabled) continue;

            const std::string id = is_blank(event.id) ? "@" + std::to_string(i) : event.id;
            const double start = offset + to_seconds(event.time_mode, event.start, seconds_per_beat, scale);
            const double duration = to_seconds(event.time_mode, event.duration, seconds_per_beat, scale);

            if(const auto* nested = event.as<NestedTimelineEvent>()) {
                if(!nested->timeline) continue;
                double child_offset = start;
                if(nested->include_child_start_offset) child_offset += nested->timeline->playback.start_offset_seconds;
                const std::string child_prefix = is_blank(nested->id_prefix) ? prefix + id + "/" : prefix + nested->id_prefix;
                compile(*nested->timeline, child_prefix, child_offset,
                        scale * std::max(0.01f, nested->time_scale), depth + 1);
                continue;
            }

            ScheduledEvent scheduled;
            scheduled.event = &event;
            scheduled.id = prefix + id;
            if(const auto* automation = event.as<AutomationEvent>()) {
                if(!is_blank(automation->target_event_id)) scheduled.target_id = prefix + automation->target_event_id;
            }
            scheduled.start_seconds = start;
            scheduled.duration_seconds = duration;
            out.push_back(std::move(scheduled));
        }
    }
};

} // namespace

float resolve_bpm(const Timeline& timeline, const EntryResolver& resolve) {
    if(timeline.tempo.bpm > 0.0f) return timeline.tempo.bpm;
    if(!timeline.tempo.auto_detect_bpm) return kDefaultBpm;

    const auto* music = find_first_music(timeline, resolve, 0);
    if(!music) return kDefaultBpm;

    const audio::ClipRef& clip = music->loop_clip ? music->loop_clip : music->clip;
    if(!clip || clip->length_seconds <= 0.0) return kDefaultBpm;

    const double beats = static_cast<double>(std::max(1, timeline.tempo.beats_per_bar)) *
                         static_cast<double>(std::max(1, timeline.tempo.bars_for_bpm_fallback));
    return static_cast<float>(beats / clip->length_seconds * 60.0);
}

double to_seconds(TimeMode mode, float value, double seconds_per_beat, double time_scale) {
    if(mode == TimeMode::Seconds) return static_cast<double>(value) * time_scale;
    return static_cast<double>(value) * seconds_per_beat * time_scale;
}

Schedule build_schedule(TimelinePtr timeline, const EntryResolver& resolve) {
    Schedule schedule;
    schedule.root = std::move(timeline);
    if(!schedule.root) return schedule;

    const Timeline& root = *schedule.root;
    schedule.bpm = resolve_bpm(root, resolve);
    schedule.seconds_per_beat = 60.0 / std::max(1.0, schedule.bpm);

    Compiler compiler{schedule.seconds_per_beat, schedule.events};
    compiler.compile(root, std::string{}, root.playback.start_offset_seconds, 1.0, 0);

    std::stable_sort(schedule.events.begin(), schedule.events.end(),
                     [](const ScheduledEvent& a, const ScheduledEvent& b) { return a.start_seconds < b.start_seconds; });

    schedule.loop_length_seconds = resolve_loop_length(root, schedule.events, schedule.seconds_per_beat);
    return schedule;
}

double resolve_loop_length(const Timeline& timeline, const std::vector<ScheduledEvent>& events,
                           double seconds_per_beat) {
    if(!timeline.playback.loop) return 0.0;
    if(timeline.playback.loop_length_beats > 0.0f) {
        return static_cast<double>(timeline.playback.loop_length_beats) * seconds_per_beat;
    }

    double max_end = 0.0;
    for(const auto& scheduled : events) {
        max_end = std::max(max_end, scheduled.start_seconds + std::max(0.0, scheduled.duration_seconds));
    }
    return max_end;
}

} // namespace sk::timeline
