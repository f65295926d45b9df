#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include "ui/AppState.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace whisperim;
using ui::AppState;
using ui::StatusTone;

namespace {

const fs::path kTestRoot = "test_root_appstate";

class FakeRecorder : public domain::AudioRecorder {
public:
    bool failStart = false;
    bool emptyOnStop = false;

    bool start(domain::Failure& failure) override {
        if (failStart) {
            failure = {domain::FailureKind::StartError, "arecord not found."};
            return false;
        }
        m_session.audioFilePath = (kTestRoot / ("take-" + std::to_string(m_counter++) + ".wav")).string();
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

    bool poll() override { return true; }
    const domain::RecordingSession& session() const override { return m_session; }

private:
    domain::RecordingSession m_session;
    int m_counter = 0;
};

class FakeTranscriber : public domain::TranscriptionService {
public:
    std::string transcript;
    domain::Failure failure;

    bool transcribe(const std::string&, const domain::Settings&, std::string& out,
                    domain::Failure& outFailure) override {
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

    bool write(const std::string&, domain::Failure& failure) override {
        if (fail) {
            failure = {domain::FailureKind::ClipboardError, "wl-copy not found."};
            return false;
        }
        return true;
    }
};

struct Fixture {
    FakeRecorder* recorder = nullptr;
    FakeTranscriber* transcriber = nullptr;
    FakeClipboard* clipboard = nullptr;
    AppState state;

    Fixture() {
        auto r = std::make_unique<FakeRecorder>();
        auto t = std::make_unique<FakeTranscriber>();
        auto c = std::make_unique<FakeClipboard>();
        recorder = r.get();
        transcriber = t.get();
        clipboard = c.get();

        application::AppServices services;
        services.dictationService = std::make_unique<application::DictationService>(
            std::move(r), std::move(t), std::move(c),
            [this](const std::string& line) { state.AppendLog(line + "\n"); });
        state.InjectServices(std::move(services));
    }

    ~Fixture() { state.Shutdown(); }

    // Records, stops, and pumps Update() until the session has ended.
    void RunSession() {
        state.ToggleRecording();
        assert(state.IsRecording());
        state.ToggleRecording();

        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (state.IsTranscribing() || state.IsRecording()) {
            assert(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(5ms);
            state.Update();
        }
        state.Update();
    }
};

} // namespace

int main() {
    std::cout << "[Test] Starting AppState Test..." << std::endl;
    fs::remove_all(kTestRoot);
    fs::create_directories(kTestRoot);

    // First launch writes config.json with the defaults.
    {
        AppState state;
        state.config.path = kTestRoot / "config" / "whisper-im" / "config.json";
        assert(!fs::exists(state.config.path));
        state.LoadConfig();
        assert(fs::exists(state.config.path));
        assert(state.config.settings == domain::Settings{});
        assert(state.GetLogSnapshot().find("Created") != std::string::npos);
    }
    std::cout << "[PASS] LoadConfig creates the file on first run." << std::endl;

    // Completed: transcript shown, status Done, exit scheduled.
    {
        Fixture f;
        f.transcriber->transcript = "你好";
        f.state.ToggleRecording();
        assert(f.state.IsRecording());
        assert(f.state.ui.statusTone == StatusTone::Recording);
        f.state.Update();
        assert(f.state.ui.statusText.rfind("Recording... ", 0) == 0);

        f.state.ToggleRecording();
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!f.state.ui.exitAt) {
            assert(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(5ms);
            f.state.Update();
        }
        assert(f.state.ui.resultText == "你好");
        assert(f.state.ui.statusText == "Done");
        assert(f.state.ui.statusTone == StatusTone::Success);
        assert(!f.state.ui.requestExit);

        // A closed session ignores further toggles.
        f.state.ToggleRecording();
        assert(!f.state.IsRecording());

        std::this_thread::sleep_for(600ms);
        f.state.Update();
        assert(f.state.ui.requestExit);
    }
    std::cout << "[PASS] Completed session schedules the exit." << std::endl;

    // ClipboardError keeps the transcript for manual copy and does not exit.
    {
        Fixture f;
        f.transcriber->transcript = "hello";
        f.clipboard->fail = true;
        f.RunSession();
        assert(f.state.ui.resultText == "hello");
        assert(f.state.ui.statusTone == StatusTone::Error);
        assert(f.state.ui.statusText == "wl-copy not found.");
        assert(!f.state.ui.exitAt);
    }
    std::cout << "[PASS] ClipboardError keeps the result text." << std::endl;

    // Whitespace-only transcript.
    {
        Fixture f;
        f.transcriber->transcript = "  \n ";
        f.RunSession();
        assert(f.state.ui.statusText == "No text detected");
        assert(f.state.ui.statusTone == StatusTone::Warning);
        assert(f.state.ui.resultText.empty());
        assert(!f.state.ui.exitAt);
    }
    std::cout << "[PASS] NoText shows a warning." << std::endl;

    // Transcription failure: error status, retained audio logged, ready for another take.
    {
        Fixture f;
        f.transcriber->failure = {domain::FailureKind::TranscriptionError, "Whisper error:\nbad model"};
        f.RunSession();
        assert(f.state.ui.statusTone == StatusTone::Error);
        assert(f.state.ui.statusText == "Whisper error:\nbad model");
        assert(f.state.GetLogSnapshot().find("Audio kept for inspection") != std::string::npos);
        assert(!f.state.ui.exitAt);

        f.state.ToggleRecording();
        assert(f.state.IsRecording());
        assert(f.state.ui.resultText.empty());
    }
    std::cout << "[PASS] TranscriptionError allows a retry." << std::endl;

    // Empty recording returns to Ready quietly.
    {
        Fixture f;
        f.recorder->emptyOnStop = true;
        f.state.ToggleRecording();
        f.state.ToggleRecording();
        f.state.Update();
        assert(!f.state.IsRecording());
        assert(f.state.ui.statusText == "Ready");
        assert(f.state.ui.statusTone == StatusTone::Ready);
    }
    std::cout << "[PASS] EmptyRecording returns to Ready." << std::endl;

    // Start failure is shown and nothing records.
    {
        Fixture f;
        f.recorder->failStart = true;
        f.state.ToggleRecording();
        assert(!f.state.IsRecording());
        assert(f.state.ui.statusText == "arecord not found.");
        assert(f.state.ui.statusTone == StatusTone::Error);
    }
    std::cout << "[PASS] StartError is reported on the status line." << std::endl;

    fs::remove_all(kTestRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
