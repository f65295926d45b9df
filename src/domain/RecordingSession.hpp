#pragma once

#include <chrono>
#include <string>

namespace whisperim::domain {

enum class RecordingState {
    Idle,
    Recording,
    Stopped
};

struct RecordingSession {
    std::string audioFilePath;
    std::chrono::steady_clock::time_point startedAt{};
    RecordingState state = RecordingState::Idle;

    std::chrono::milliseconds elapsed(std::chrono::steady_clock::time_point now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - startedAt);
    }
};

} // namespace whisperim::domain
