#pragma once

#include "timeline/timeline.hpp"
#include <functional>
#include <string>
#include <vector>

namespace sk::timeline {

// Nested timelines deeper than this are logged and skipped.
constexpr int kMaxNestingDepth = 32;

constexpr float kDefaultBpm = 120.0f;

struct ScheduledEvent {
    const TimelineEvent* event = nullptr;   ///< into Schedule::root's tree
    std::string id;                         ///< ancestor prefixes + own id
    std::string target_id;                  ///< automation target, prefixed; empty otherwise
    double start_seconds = 0.0;
    double duration_seconds = 0.0;
};

/**
 * @brief Flat, start-sorted compilation of a (possibly nested) timeline
 */
struct Schedule {
    TimelinePtr root;                 ///< keeps every referenced event alive
    double bpm = kDefaultBpm;
    double seconds_per_beat = 0.5;
    double loop_length_seconds = 0.0; ///< 0 when the root does not loop
    std::vector<ScheduledEvent> events;
};

using EntryResolver = std::function<registry::SoundEntryPtr(const SoundReference&)>;

/**
 * @brief Tempo for one play
 *
 * Explicit bpm wins. Otherwise, with detection on, the first resolvable music definition
 * (depth-first through nested timelines, loop clip preferred) is assumed to span
 * beats_per_bar * bars_for_bpm_fallback beats. Falls back to 120.
 */
float resolve_bpm(const Timeline& timeline, const EntryResolver& resolve);

double to_seconds(TimeMode mode, float value, double seconds_per_beat, double time_scale);

/**
 * @brief Compile `timeline` into absolute seconds
 *
 * Events without an id get "@<index>" so every compiled id stays unique. Disabled events
 * are dropped. Ties in start time keep declaration order.
 */
Schedule build_schedule(TimelinePtr timeline, const EntryResolver& resolve);

double resolve_loop_length(const Timeline& timeline, const std::vector<ScheduledEvent>& events,
                           double seconds_per_beat);

} // namespace sk::timeline
