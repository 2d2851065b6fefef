#include "audio/simulated_output.hpp"
#include <algorithm>

namespace sk::audio {

void SimulatedOutput::start(VoiceId voice, const VoiceParams& params) {
    auto& state = voices_[voice];
    state.params = params;
    state.started_at = clock_.now();
    state.active = params.clip != nullptr;
    record({EventKind::Start, voice, state.started_at, params.clip ? params.clip->name : std::string{}, params.volume});
}

void SimulatedOutput::stop(VoiceId voice) {
    auto it = voices_.find(voice);
    if(it == voices_.end() || !it->second.active) return;
    it->second.active = false;
    record({EventKind::Stop, voice, clock_.now(), {}, 0.0f});
}

void SimulatedOutput::apply(VoiceId voice, const VoiceParams& params) {
    auto it = voices_.find(voice);
    if(it == voices_.end()) return;
    it->second.params = params;
}

bool SimulatedOutput::is_playing(VoiceId voice) const {
    auto it = voices_.find(voice);
    if(it == voices_.end() || !it->second.active) return false;
    const auto& state = it->second;
    if(state.params.loop) return true;
    if(!state.params.clip) return false;
    return clock_.now() - state.started_at < playback_seconds(*state.params.clip, state.params.pitch);
}

const VoiceParams* SimulatedOutput::params(VoiceId voice) const {
    auto it = voices_.find(voice);
    return it == voices_.end() ? nullptr : &it->second.params;
}

size_t SimulatedOutput::start_count() const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                             [](const Event& e) { return e.kind == EventKind::Start; }));
}

void SimulatedOutput::record(Event ev) {
    events_.push_back(ev);
    if(event_callback_) event_callback_(events_.back());
}

} // namespace sk::audio
