/**
 * @file Failure.hpp
 * @brief Error taxonomy shared by the recorder, transcriber and clipboard.
 */

#pragma once

#include <string>

namespace whisperim::domain {

/**
 * @enum FailureKind
 * @brief Categories of failures a dictation session can run into.
 */
enum class FailureKind {
    None,
    ConfigError,        ///< Malformed configuration. Recovered with defaults.
    StartError,         ///< Capture process could not be launched.
    ToolNotFound,       ///< An external executable is missing.
    ModelNotFound,      ///< Model weights (or the OpenVINO encoder pair) are missing.
    EmptyRecording,     ///< Capture too short or no audio file produced.
    TranscriptionError, ///< Recognizer exited nonzero or timed out.
    ClipboardError      ///< Clipboard tool missing or failed.
};

/**
 * @struct Failure
 * @brief Filled by operations that return false or an empty optional.
 */
struct Failure {
    FailureKind kind = FailureKind::None;
    std::string message;

    bool isSet() const { return kind != FailureKind::None; }
    void clear() {
        kind = FailureKind::None;
        message.clear();
    }
};

inline const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::ConfigError: return "config error";
        case FailureKind::StartError: return "start error";
        case FailureKind::ToolNotFound: return "tool not found";
        case FailureKind::ModelNotFound: return "model not found";
        case FailureKind::EmptyRecording: return "empty recording";
        case FailureKind::TranscriptionError: return "transcription error";
        case FailureKind::ClipboardError: return "clipboard error";
    }
    return "unknown";
}

} // namespace whisperim::domain
