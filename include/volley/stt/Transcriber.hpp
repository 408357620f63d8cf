/**
 * Transcriber.hpp - Speech-to-text collaborator interface
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace volley::stt {

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * @param wav mono 16-bit PCM WAV payload
     * @return transcript; blank means no speech. Throws CollaboratorError on failure.
     */
    virtual std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) = 0;
};

} // namespace volley::stt
