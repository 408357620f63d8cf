/**
 * AudioSink.hpp - Outbound transport seam
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

namespace volley::audio {

class AudioSink {
public:
    virtual ~AudioSink() = default;

    // Frames arrive in order at the session's output rate and channel count
    virtual void sendFrame(const AudioFrame& frame) = 0;
};

} // namespace volley::audio
