#pragma once

#include "audio/audio_types.hpp"

namespace sk::audio {

/**
 * @brief Output primitive the playback engine drives
 *
 * Implementations render (or pretend to render) one clip per voice. The engine owns the
 * decision of which clip plays on which voice and when; the output only executes it.
 */
class VoiceOutput {
public:
    virtual ~VoiceOutput() = default;

    /**
     * @brief Start `params.clip` from the beginning, replacing whatever the voice played
     */
    virtual void start(VoiceId voice, const VoiceParams& params) = 0;

    /**
     * @brief Hard-stop the voice
     */
    virtual void stop(VoiceId voice) = 0;

    /**
     * @brief Push changed volume/pitch/position/bus to a voice without restarting it
     */
    virtual void apply(VoiceId voice, const VoiceParams& params) = 0;

    /**
     * @brief True while the voice is audible (looping, or not yet past its clip end)
     */
    virtual bool is_playing(VoiceId voice) const = 0;
};

} // namespace sk::audio
