/**
 * @file AudioRecorder.hpp
 * @brief Interface for microphone capture backends.
 */

#pragma once

#include "domain/Failure.hpp"
#include "domain/RecordingSession.hpp"

#include <optional>
#include <string>

namespace whisperim::domain {

/**
 * @class AudioRecorder
 * @brief Captures audio into a temporary file. One recording at a time.
 */
class AudioRecorder {
public:
    virtual ~AudioRecorder() = default;

    /**
     * @brief Starts capturing into a fresh temporary file. Does not block.
     * @return False with a StartError/ToolNotFound failure if capture cannot start.
     */
    virtual bool start(Failure& failure) = 0;

    /**
     * @brief Ends the capture.
     * @return Path of the finished audio file, or nullopt with an EmptyRecording failure.
     */
    virtual std::optional<std::string> stop(Failure& failure) = 0;

    /**
     * @brief Non-blocking check on the capture process.
     * @return False once the capture process has exited on its own.
     */
    virtual bool poll() = 0;

    /** @brief The current (or last) session. */
    virtual const RecordingSession& session() const = 0;
};

} // namespace whisperim::domain
