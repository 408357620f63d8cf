/**
 * Synthesizer.hpp - Text-to-speech collaborator interface
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

#include <string>
#include <vector>

namespace volley::tts {

class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    // Throws CollaboratorError on failure
    virtual audio::Waveform synthesize(const std::string& text) = 0;
};

/**
 * Split at sentence punctuation (. ! ?), keeping the punctuation with its
 * sentence. Text without punctuation comes back as a single sentence.
 */
std::vector<std::string> splitSentences(const std::string& text);

} // namespace volley::tts
