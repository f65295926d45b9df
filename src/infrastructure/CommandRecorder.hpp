/**
 * @file CommandRecorder.hpp
 * @brief AudioRecorder backed by an external capture command (arecord by default).
 */

#pragma once

#include "domain/AudioRecorder.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

namespace whisperim::infrastructure {

/**
 * @struct CaptureCommand
 * @brief Capture program and its arguments. The output file is appended as the last argument.
 */
struct CaptureCommand {
    std::string program = "arecord";
    std::vector<std::string> args = {"-f", "cd", "-d", "0"};
};

/**
 * @struct RecordingLimits
 * @brief Below these a capture counts as empty.
 */
struct RecordingLimits {
    std::uintmax_t minimumBytes = 1000;                 ///< A WAV header alone is 44 bytes.
    std::chrono::milliseconds minimumDuration{250};
    std::chrono::milliseconds stopGracePeriod{2000};   ///< SIGTERM to SIGKILL delay.
};

class CommandRecorder : public domain::AudioRecorder {
public:
    explicit CommandRecorder(CaptureCommand command = CaptureCommand{}, RecordingLimits limits = RecordingLimits{});
    ~CommandRecorder() override;

    CommandRecorder(const CommandRecorder&) = delete;
    CommandRecorder& operator=(const CommandRecorder&) = delete;

    bool start(domain::Failure& failure) override;
    std::optional<std::string> stop(domain::Failure& failure) override;
    bool poll() override;
    const domain::RecordingSession& session() const override { return m_session; }

private:
    void discardFile();

    CaptureCommand m_command;
    RecordingLimits m_limits;
    domain::RecordingSession m_session;
    pid_t m_pid = -1;
};

} // namespace whisperim::infrastructure
