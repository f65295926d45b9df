/**
 * @file DictationService.hpp
 * @brief Session state machine: record, transcribe, normalize, copy.
 */

#pragma once

#include "domain/AudioRecorder.hpp"
#include "domain/ClipboardWriter.hpp"
#include "domain/Failure.hpp"
#include "domain/Settings.hpp"
#include "domain/TextNormalizer.hpp"
#include "domain/TranscriptionService.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace whisperim::application {

/**
 * @enum SessionState
 * @brief Idle -> Recording -> Transcribing -> Closed. Failures and empty results go back to Idle.
 */
enum class SessionState {
    Idle,
    Recording,
    Transcribing,
    Closed
};

enum class OutcomeKind {
    Completed,      ///< Text is on the clipboard.
    EmptyRecording, ///< Capture too short, nothing was transcribed.
    NoText,         ///< The recognizer produced only whitespace.
    Failed          ///< See SessionOutcome::failure.
};

/**
 * @struct SessionOutcome
 * @brief How a session ended. Handed to the UI thread by Poll().
 */
struct SessionOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    std::string text;          ///< Normalized transcript, also set on ClipboardError.
    domain::Failure failure;
    std::string retainedAudio; ///< Audio kept on disk after a TranscriptionError.
};

/**
 * @class DictationService
 * @brief Drives one dictation session at a time.
 *
 * The recorder is used on the calling (UI) thread only. Transcription,
 * normalization and the clipboard write run on a single std::async worker;
 * its result is collected by Poll().
 */
class DictationService {
public:
    using LogSink = std::function<void(const std::string&)>;

    DictationService(std::unique_ptr<domain::AudioRecorder> recorder,
                     std::unique_ptr<domain::TranscriptionService> transcriber,
                     std::unique_ptr<domain::ClipboardWriter> clipboard,
                     LogSink log = nullptr);
    ~DictationService();

    DictationService(const DictationService&) = delete;
    DictationService& operator=(const DictationService&) = delete;

    /**
     * @brief Starts recording. The settings are snapshotted for the whole session.
     * @return False (state unchanged) if a session is active or capture failed.
     */
    bool Start(const domain::Settings& settings, domain::Failure& failure);

    /**
     * @brief Stops recording and hands the audio to the worker.
     * An empty capture ends the session; its outcome is reported by the next Poll().
     */
    bool Stop(domain::Failure& failure);

    /** @brief Start when idle, stop when recording. Ignored while transcribing. */
    bool Toggle(const domain::Settings& settings, domain::Failure& failure);

    /**
     * @brief Called once per frame. Notices a capture process that died and
     * collects the worker's result.
     * @return The outcome of a session that just ended, if any.
     */
    std::optional<SessionOutcome> Poll();

    /** @brief Discards an active recording and waits for a running transcription. */
    void Shutdown();

    SessionState GetState() const { return m_state; }
    const domain::Settings& GetSessionSettings() const { return m_sessionSettings; }
    std::chrono::milliseconds GetRecordingElapsed() const;

    /** @brief Trims ASCII whitespace (including newlines) from both ends. */
    static std::string Trim(const std::string& text);

private:
    SessionOutcome RunPipeline(const std::string& audioPath, const domain::Settings& settings);
    void Log(const std::string& message) const;

    std::unique_ptr<domain::AudioRecorder> m_recorder;
    std::unique_ptr<domain::TranscriptionService> m_transcriber;
    std::unique_ptr<domain::ClipboardWriter> m_clipboard;
    domain::TextNormalizer m_normalizer;
    LogSink m_log;

    SessionState m_state = SessionState::Idle;
    domain::Settings m_sessionSettings;
    std::future<SessionOutcome> m_worker;
    std::optional<SessionOutcome> m_pendingOutcome;
};

} // namespace whisperim::application
