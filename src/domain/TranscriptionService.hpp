/**
 * @file TranscriptionService.hpp
 * @brief Interface for audio-to-text transcription.
 */

#pragma once

#include "domain/Failure.hpp"
#include "domain/Settings.hpp"

#include <string>

namespace whisperim::domain {

/**
 * @class TranscriptionService
 * @brief Abstract interface for recognizers that turn a finished audio file into text.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes an audio file. Blocks until the recognizer finishes or times out.
     * @param audioPath Path to the input WAV file.
     * @param settings Backend, model, language and thread count to use.
     * @param transcript Receives the recognizer output verbatim.
     * @param failure Filled when false is returned.
     * @return True on success.
     */
    virtual bool transcribe(const std::string& audioPath,
                            const Settings& settings,
                            std::string& transcript,
                            Failure& failure) = 0;
};

} // namespace whisperim::domain
