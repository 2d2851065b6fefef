#include "timeline/timeline.hpp"

namespace sk::timeline {

const char* event_kind_name(EventKind kind) {
    switch(kind) {
        case EventKind::PlayEffect: return "play_effect";
        case EventKind::PlayMusic: return "play_music";
        case EventKind::PlayNarration: return "play_narration";
        case EventKind::Automation: return "automation";
        case EventKind::BeatMarker: return "beat_marker";
        case EventKind::Nested: return "nested";
    }
    return "unknown";
}

} // namespace sk::timeline
