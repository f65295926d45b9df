#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "infrastructure/CommandRecorder.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using whisperim::domain::Failure;
using whisperim::domain::FailureKind;
using whisperim::domain::RecordingState;
using whisperim::infrastructure::CaptureCommand;
using whisperim::infrastructure::CommandRecorder;
using whisperim::infrastructure::RecordingLimits;

namespace {

// The output file arrives as $0 of the script.
CaptureCommand Script(const std::string& body) {
    CaptureCommand command;
    command.program = "sh";
    command.args = {"-c", body};
    return command;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CommandRecorder Test..." << std::endl;

    // Missing capture binary.
    {
        CaptureCommand command;
        command.program = "whisper-im-no-such-recorder";
        CommandRecorder recorder(command);
        Failure failure;
        assert(!recorder.start(failure));
        assert(failure.kind == FailureKind::StartError);
        assert(recorder.session().state == RecordingState::Idle);
    }
    std::cout << "[PASS] Missing recorder yields StartError." << std::endl;

    // Stop without start.
    {
        CommandRecorder recorder(Script("exec sleep 30"));
        Failure failure;
        assert(!recorder.stop(failure));
        assert(failure.kind == FailureKind::EmptyRecording);
    }
    std::cout << "[PASS] Stop without start." << std::endl;

    // Tiny file: empty recording, file discarded.
    {
        CommandRecorder recorder(Script("printf abc > \"$0\"; exec sleep 30"));
        Failure failure;
        assert(recorder.start(failure));
        const std::string path = recorder.session().audioFilePath;
        assert(!path.empty());
        assert(fs::exists(path));
        assert(recorder.session().state == RecordingState::Recording);
        assert(recorder.poll());

        Failure second;
        assert(!recorder.start(second));
        assert(second.kind == FailureKind::StartError);

        std::this_thread::sleep_for(400ms);
        assert(!recorder.stop(failure));
        assert(failure.kind == FailureKind::EmptyRecording);
        assert(!fs::exists(path));
        assert(recorder.session().state == RecordingState::Stopped);
    }
    std::cout << "[PASS] Short capture yields EmptyRecording." << std::endl;

    // Real-sized capture.
    {
        CommandRecorder recorder(Script("head -c 4000 /dev/zero > \"$0\"; exec sleep 30"));
        Failure failure;
        assert(recorder.start(failure));
        std::this_thread::sleep_for(400ms);
        auto path = recorder.stop(failure);
        assert(path);
        assert(!failure.isSet());
        assert(fs::file_size(*path) == 4000);
        fs::remove(*path);
    }
    std::cout << "[PASS] Capture returns the audio file." << std::endl;

    // Enough bytes but too brief.
    {
        RecordingLimits limits;
        limits.minimumDuration = 10s;
        CommandRecorder recorder(Script("head -c 4000 /dev/zero > \"$0\"; exec sleep 30"), limits);
        Failure failure;
        assert(recorder.start(failure));
        std::this_thread::sleep_for(300ms);
        assert(!recorder.stop(failure));
        assert(failure.kind == FailureKind::EmptyRecording);
    }
    std::cout << "[PASS] Duration threshold." << std::endl;

    // Capture process that exits on its own.
    {
        CommandRecorder recorder(Script("exit 1"));
        Failure failure;
        assert(recorder.start(failure));
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (recorder.poll() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(20ms);
        }
        assert(!recorder.poll());
        assert(!recorder.stop(failure));
        assert(failure.kind == FailureKind::EmptyRecording);
    }
    std::cout << "[PASS] Capture exit noticed by poll()." << std::endl;

    // Destruction mid-recording removes the file.
    {
        std::string path;
        {
            CommandRecorder recorder(Script("exec sleep 30"));
            Failure failure;
            assert(recorder.start(failure));
            path = recorder.session().audioFilePath;
            assert(fs::exists(path));
        }
        assert(!fs::exists(path));
    }
    std::cout << "[PASS] Destructor terminates capture." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
