#pragma once

#include "audio/voice_output.hpp"
#include "core/clock.hpp"
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace sk::audio {

/**
 * @brief Clock-driven stand-in for a device backend
 *
 * A started voice reports playing until `length / |pitch|` seconds of clock time have
 * passed, or forever when looping. Used by the simulator tool and the tests.
 */
class SimulatedOutput final : public VoiceOutput {
public:
    enum class EventKind { Start, Stop };

    struct Event {
        EventKind kind;
        VoiceId voice;
        double time;
        std::string clip;     ///< Clip name for Start events
        float volume = 0.0f;
    };

    using EventCallback = std::function<void(const Event&)>;

    explicit SimulatedOutput(const core::Clock& clock) : clock_(clock) {}

    void start(VoiceId voice, const VoiceParams& params) override;
    void stop(VoiceId voice) override;
    void apply(VoiceId voice, const VoiceParams& params) override;
    bool is_playing(VoiceId voice) const override;

    // Last parameters pushed for the voice; nullptr if it never started
    const VoiceParams* params(VoiceId voice) const;

    const std::vector<Event>& events() const { return events_; }
    size_t start_count() const;
    void clear_events() { events_.clear(); }

    void set_event_callback(EventCallback cb) { event_callback_ = std::move(cb); }

private:
    struct VoiceState {
        VoiceParams params;
        double started_at = 0.0;
        bool active = false;
    };

    void record(Event ev);

    const core::Clock& clock_;
    std::unordered_map<VoiceId, VoiceState> voices_;
    std::vector<Event> events_;
    EventCallback event_callback_;
};

} // namespace sk::audio
