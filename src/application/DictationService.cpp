/**
 * @file DictationService.cpp
 * @brief Implementation of DictationService.
 */

#include "application/DictationService.hpp"

#include <filesystem>
#include <iostream>

namespace whisperim::application {

namespace {

void RemoveAudio(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

DictationService::DictationService(std::unique_ptr<domain::AudioRecorder> recorder,
                                   std::unique_ptr<domain::TranscriptionService> transcriber,
                                   std::unique_ptr<domain::ClipboardWriter> clipboard,
                                   LogSink log)
    : m_recorder(std::move(recorder))
    , m_transcriber(std::move(transcriber))
    , m_clipboard(std::move(clipboard))
    , m_log(std::move(log))
{}

DictationService::~DictationService() {
    Shutdown();
}

bool DictationService::Start(const domain::Settings& settings, domain::Failure& failure) {
    if (m_state != SessionState::Idle) {
        failure = {domain::FailureKind::StartError, "A session is already active."};
        return false;
    }

    m_sessionSettings = settings;
    m_pendingOutcome.reset();
    if (!m_recorder->start(failure)) {
        Log("[Dictation] Cannot start recording: " + failure.message);
        return false;
    }

    m_state = SessionState::Recording;
    Log("[Dictation] Recording started");
    return true;
}

bool DictationService::Stop(domain::Failure& failure) {
    if (m_state != SessionState::Recording) {
        failure = {domain::FailureKind::EmptyRecording, "Not recording."};
        return false;
    }

    domain::Failure stopFailure;
    auto audioPath = m_recorder->stop(stopFailure);
    if (!audioPath) {
        Log("[Dictation] " + stopFailure.message);
        m_state = SessionState::Idle;
        SessionOutcome outcome;
        outcome.kind = OutcomeKind::EmptyRecording;
        outcome.failure = stopFailure;
        m_pendingOutcome = outcome;
        return true;
    }

    Log("[Dictation] Recording stopped, transcribing " + *audioPath);
    m_state = SessionState::Transcribing;
    m_worker = std::async(std::launch::async, [this, path = *audioPath, settings = m_sessionSettings]() {
        return RunPipeline(path, settings);
    });
    return true;
}

bool DictationService::Toggle(const domain::Settings& settings, domain::Failure& failure) {
    switch (m_state) {
        case SessionState::Idle: return Start(settings, failure);
        case SessionState::Recording: return Stop(failure);
        case SessionState::Transcribing:
        case SessionState::Closed: break;
    }
    return false;
}

std::optional<SessionOutcome> DictationService::Poll() {
    if (m_state == SessionState::Recording && !m_recorder->poll()) {
        Log("[Dictation] Capture process ended unexpectedly");
        domain::Failure failure;
        if (!Stop(failure)) {
            Log("[Dictation] " + failure.message);
        }
    }

    if (m_pendingOutcome) {
        auto outcome = std::move(m_pendingOutcome);
        m_pendingOutcome.reset();
        return outcome;
    }

    if (m_state != SessionState::Transcribing || !m_worker.valid()) {
        return std::nullopt;
    }
    if (m_worker.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }

    SessionOutcome outcome;
    try {
        outcome = m_worker.get();
    } catch (const std::exception& e) {
        outcome.kind = OutcomeKind::Failed;
        outcome.failure = {domain::FailureKind::TranscriptionError, e.what()};
    }

    m_state = (outcome.kind == OutcomeKind::Completed) ? SessionState::Closed : SessionState::Idle;
    return outcome;
}

void DictationService::Shutdown() {
    if (m_state == SessionState::Recording) {
        domain::Failure failure;
        if (auto audioPath = m_recorder->stop(failure)) {
            RemoveAudio(*audioPath);
        }
        Log("[Dictation] Recording discarded");
        m_state = SessionState::Idle;
    }

    if (m_worker.valid()) {
        Log("[Dictation] Waiting for transcription to finish...");
        m_worker.wait();
        try {
            m_worker.get();
        } catch (const std::exception& e) {
            std::cerr << "[Dictation] Transcription failed during shutdown: " << e.what() << std::endl;
        }
        m_state = SessionState::Idle;
    }
}

std::chrono::milliseconds DictationService::GetRecordingElapsed() const {
    if (m_state != SessionState::Recording) return std::chrono::milliseconds(0);
    return m_recorder->session().elapsed(std::chrono::steady_clock::now());
}

std::string DictationService::Trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

SessionOutcome DictationService::RunPipeline(const std::string& audioPath, const domain::Settings& settings) {
    SessionOutcome outcome;

    std::string transcript;
    if (!m_transcriber->transcribe(audioPath, settings, transcript, outcome.failure)) {
        outcome.kind = OutcomeKind::Failed;
        if (outcome.failure.kind == domain::FailureKind::TranscriptionError) {
            outcome.retainedAudio = audioPath;
            Log("[Dictation] Transcription failed, audio kept at " + audioPath);
        } else {
            RemoveAudio(audioPath);
        }
        Log("[Dictation] " + outcome.failure.message);
        return outcome;
    }
    RemoveAudio(audioPath);

    if (domain::ShouldNormalizeChinese(settings.language)) {
        transcript = m_normalizer.normalize(transcript);
    }
    outcome.text = Trim(transcript);

    if (outcome.text.empty()) {
        outcome.kind = OutcomeKind::NoText;
        Log("[Dictation] No text detected");
        return outcome;
    }

    if (!m_clipboard->write(outcome.text, outcome.failure)) {
        outcome.kind = OutcomeKind::Failed;
        Log("[Dictation] Clipboard: " + outcome.failure.message);
        return outcome;
    }

    outcome.kind = OutcomeKind::Completed;
    Log("[Dictation] Copied to clipboard: " + outcome.text);
    return outcome;
}

void DictationService::Log(const std::string& message) const {
    std::cout << message << std::endl;
    if (m_log) m_log(message);
}

} // namespace whisperim::application
