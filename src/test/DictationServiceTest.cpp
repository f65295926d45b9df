#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include "application/DictationService.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace whisperim;
using application::DictationService;
using application::OutcomeKind;
using application::SessionOutcome;
using application::SessionState;

namespace {

const fs::path kTestRoot = "test_root_dictation";

// Recorder that writes a file instead of capturing.
class FakeRecorder : public domain::AudioRecorder {
public:
    bool failStart = false;
    bool emptyOnStop = false;
    bool alive = true;
    int counter = 0;

    bool start(domain::Failure& failure) override {
        if (failStart) {
            failure = {domain::FailureKind::StartError, "arecord not found."};
            return false;
        }
        m_session.audioFilePath = (kTestRoot / ("audio-" + std::to_string(counter++) + ".wav")).string();
        std::ofstream(m_session.audioFilePath) << std::string(4096, '\0');
        m_session.startedAt = std::chrono::steady_clock::now();
        m_session.state = domain::RecordingState::Recording;
        return true;
    }

    std::optional<std::string> stop(domain::Failure& failure) override {
        m_session.state = domain::RecordingState::Stopped;
        if (emptyOnStop) {
            fs::remove(m_session.audioFilePath);
            failure = {domain::FailureKind::EmptyRecording, "Recording too short."};
            return std::nullopt;
        }
        return m_session.audioFilePath;
    }

    bool poll() override { return alive; }
    const domain::RecordingSession& session() const override { return m_session; }

private:
    domain::RecordingSession m_session;
};

class FakeTranscriber : public domain::TranscriptionService {
public:
    std::string transcript;
    domain::Failure failure;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
    domain::Settings lastSettings;

    bool transcribe(const std::string& audioPath, const domain::Settings& settings, std::string& out,
                    domain::Failure& outFailure) override {
        ++calls;
        lastSettings = settings;
        assert(fs::exists(audioPath));
        std::this_thread::sleep_for(delay);
        if (failure.isSet()) {
            outFailure = failure;
            return false;
        }
        out = transcript;
        return true;
    }
};

class FakeClipboard : public domain::ClipboardWriter {
public:
    bool fail = false;
    std::string text;
    int writes = 0;

    bool write(const std::string& value, domain::Failure& failure) override {
        ++writes;
        if (fail) {
            failure = {domain::FailureKind::ClipboardError, "wl-copy not found."};
            return false;
        }
        text = value;
        return true;
    }
};

struct Harness {
    FakeRecorder* recorder;
    FakeTranscriber* transcriber;
    FakeClipboard* clipboard;
    std::vector<std::string> logLines;
    std::unique_ptr<DictationService> service;

    Harness() {
        auto r = std::make_unique<FakeRecorder>();
        auto t = std::make_unique<FakeTranscriber>();
        auto c = std::make_unique<FakeClipboard>();
        recorder = r.get();
        transcriber = t.get();
        clipboard = c.get();
        service = std::make_unique<DictationService>(std::move(r), std::move(t), std::move(c),
                                                      [this](const std::string& line) { logLines.push_back(line); });
    }
};

SessionOutcome WaitForOutcome(DictationService& service) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto outcome = service.Poll()) return *outcome;
        std::this_thread::sleep_for(5ms);
    }
    assert(false && "No outcome within 5 seconds.");
    return {};
}

} // namespace

int main() {
    std::cout << "[Test] Starting DictationService Test..." << std::endl;
    fs::remove_all(kTestRoot);
    fs::create_directories(kTestRoot);

    // Happy path: normalized, trimmed, copied, closed.
    {
        Harness h;
        h.transcriber->transcript = "  這是測試\n";
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        assert(h.service->GetState() == SessionState::Recording);
        const std::string audio = h.recorder->session().audioFilePath;

        assert(h.service->Stop(failure));
        assert(h.service->GetState() == SessionState::Transcribing);

        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Completed);
        assert(outcome.text == "这是测试");
        assert(h.clipboard->text == "这是测试");
        assert(h.service->GetState() == SessionState::Closed);
        assert(!fs::exists(audio));

        // A closed session does not restart.
        assert(!h.service->Start(domain::Settings{}, failure));
        assert(!h.logLines.empty());
    }
    std::cout << "[PASS] Success ends in Closed with text on the clipboard." << std::endl;

    // Japanese sessions are not normalized.
    {
        Harness h;
        h.transcriber->transcript = "日本語";
        domain::Settings settings;
        settings.language = "ja";
        domain::Failure failure;
        assert(h.service->Toggle(settings, failure));
        assert(h.service->Toggle(settings, failure));
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Completed);
        assert(outcome.text == "日本語");
    }
    std::cout << "[PASS] Normalization follows the session language." << std::endl;

    // Empty recording goes back to Idle without transcribing.
    {
        Harness h;
        h.recorder->emptyOnStop = true;
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        assert(h.service->Stop(failure));
        assert(h.service->GetState() == SessionState::Idle);
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::EmptyRecording);
        assert(h.transcriber->calls == 0);
        assert(h.clipboard->writes == 0);
    }
    std::cout << "[PASS] EmptyRecording skips transcription." << std::endl;

    // Start failure leaves the service idle.
    {
        Harness h;
        h.recorder->failStart = true;
        domain::Failure failure;
        assert(!h.service->Start(domain::Settings{}, failure));
        assert(failure.kind == domain::FailureKind::StartError);
        assert(h.service->GetState() == SessionState::Idle);
    }
    std::cout << "[PASS] StartError stays Idle." << std::endl;

    // Transcription failure keeps the audio.
    {
        Harness h;
        h.transcriber->failure = {domain::FailureKind::TranscriptionError, "Whisper error:\nboom"};
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        const std::string audio = h.recorder->session().audioFilePath;
        assert(h.service->Stop(failure));
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Failed);
        assert(outcome.failure.kind == domain::FailureKind::TranscriptionError);
        assert(outcome.retainedAudio == audio);
        assert(fs::exists(audio));
        assert(h.clipboard->writes == 0);
        assert(h.service->GetState() == SessionState::Idle);

        // Next session can start.
        assert(h.service->Start(domain::Settings{}, failure));
        h.service->Shutdown();
    }
    std::cout << "[PASS] TranscriptionError returns to Idle and keeps the audio." << std::endl;

    // Missing tool removes the audio.
    {
        Harness h;
        h.transcriber->failure = {domain::FailureKind::ToolNotFound, "whisper-cli not found."};
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        const std::string audio = h.recorder->session().audioFilePath;
        assert(h.service->Stop(failure));
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.failure.kind == domain::FailureKind::ToolNotFound);
        assert(outcome.retainedAudio.empty());
        assert(!fs::exists(audio));
    }
    std::cout << "[PASS] ToolNotFound discards the audio." << std::endl;

    // Clipboard failure keeps the transcript for manual copy.
    {
        Harness h;
        h.transcriber->transcript = "hello";
        h.clipboard->fail = true;
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        assert(h.service->Stop(failure));
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Failed);
        assert(outcome.failure.kind == domain::FailureKind::ClipboardError);
        assert(outcome.text == "hello");
        assert(h.service->GetState() == SessionState::Idle);
    }
    std::cout << "[PASS] ClipboardError keeps the transcript." << std::endl;

    // Whitespace-only transcript.
    {
        Harness h;
        h.transcriber->transcript = " \n\t\n";
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        assert(h.service->Stop(failure));
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::NoText);
        assert(h.clipboard->writes == 0);
        assert(h.service->GetState() == SessionState::Idle);
    }
    std::cout << "[PASS] No text detected." << std::endl;

    // Settings are snapshotted at start; toggle is ignored while transcribing.
    {
        Harness h;
        h.transcriber->transcript = "ok";
        h.transcriber->delay = 300ms;
        domain::Settings settings;
        settings.model = "small";
        domain::Failure failure;
        assert(h.service->Start(settings, failure));
        settings.model = "tiny";
        assert(h.service->Toggle(settings, failure));
        assert(h.service->GetState() == SessionState::Transcribing);
        assert(!h.service->Toggle(settings, failure));

        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Completed);
        assert(h.transcriber->lastSettings.model == "small");
    }
    std::cout << "[PASS] Settings snapshot and busy toggle." << std::endl;

    // Capture process dying ends the recording.
    {
        Harness h;
        h.transcriber->transcript = "ok";
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        h.recorder->alive = false;
        SessionOutcome outcome = WaitForOutcome(*h.service);
        assert(outcome.kind == OutcomeKind::Completed);
        assert(h.transcriber->calls == 1);
    }
    std::cout << "[PASS] Capture exit triggers transcription." << std::endl;

    // Shutdown discards an active recording.
    {
        Harness h;
        domain::Failure failure;
        assert(h.service->Start(domain::Settings{}, failure));
        const std::string audio = h.recorder->session().audioFilePath;
        h.service->Shutdown();
        assert(h.service->GetState() == SessionState::Idle);
        assert(!fs::exists(audio));
        assert(h.transcriber->calls == 0);
    }
    std::cout << "[PASS] Shutdown discards the recording." << std::endl;

    assert(DictationService::Trim("\n  a b \r\n") == "a b");
    assert(DictationService::Trim("   ").empty());
    std::cout << "[PASS] Trim." << std::endl;

    fs::remove_all(kTestRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
