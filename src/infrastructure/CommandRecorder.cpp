#include "infrastructure/CommandRecorder.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <filesystem>
#include <iostream>

namespace whisperim::infrastructure {

namespace fs = std::filesystem;

CommandRecorder::CommandRecorder(CaptureCommand command, RecordingLimits limits)
    : m_command(std::move(command))
    , m_limits(limits)
{}

CommandRecorder::~CommandRecorder() {
    if (m_pid > 0) {
        ProcessRunner::Terminate(m_pid, m_limits.stopGracePeriod);
        m_pid = -1;
    }
    // Nobody received the path of an unfinished capture.
    if (m_session.state == domain::RecordingState::Recording) {
        discardFile();
    }
}

bool CommandRecorder::start(domain::Failure& failure) {
    if (m_session.state == domain::RecordingState::Recording) {
        failure = {domain::FailureKind::StartError, "A recording is already in progress."};
        return false;
    }

    if (!PathUtils::FindExecutable(m_command.program)) {
        failure = {domain::FailureKind::StartError,
                   m_command.program + " not found.\nInstall it or add it to PATH."};
        return false;
    }

    auto audioFile = PathUtils::CreateTempFile("whisper-im-", ".wav");
    if (!audioFile) {
        failure = {domain::FailureKind::StartError, "Cannot create a temporary audio file."};
        return false;
    }

    std::vector<std::string> args = m_command.args;
    args.push_back(audioFile->string());

    pid_t pid = -1;
    std::string error;
    if (!ProcessRunner::Spawn(m_command.program, args, pid, error)) {
        std::error_code ec;
        fs::remove(*audioFile, ec);
        failure = {domain::FailureKind::StartError, error};
        return false;
    }

    m_pid = pid;
    m_session.audioFilePath = audioFile->string();
    m_session.startedAt = std::chrono::steady_clock::now();
    m_session.state = domain::RecordingState::Recording;
    std::cout << "[Recorder] Capturing to " << m_session.audioFilePath << " (pid " << m_pid << ")" << std::endl;
    return true;
}

std::optional<std::string> CommandRecorder::stop(domain::Failure& failure) {
    if (m_session.state != domain::RecordingState::Recording) {
        failure = {domain::FailureKind::EmptyRecording, "No recording in progress."};
        return std::nullopt;
    }

    const auto duration = m_session.elapsed(std::chrono::steady_clock::now());
    if (m_pid > 0) {
        const int exitCode = ProcessRunner::Terminate(m_pid, m_limits.stopGracePeriod);
        std::cout << "[Recorder] Capture stopped (status " << exitCode << ")" << std::endl;
        m_pid = -1;
    }
    m_session.state = domain::RecordingState::Stopped;

    std::error_code ec;
    const auto size = fs::file_size(m_session.audioFilePath, ec);
    if (ec || size <= m_limits.minimumBytes || duration < m_limits.minimumDuration) {
        std::cout << "[Recorder] Recording too short (" << duration.count() << " ms, "
                  << (ec ? 0 : size) << " bytes), discarded" << std::endl;
        discardFile();
        failure = {domain::FailureKind::EmptyRecording, "Recording too short."};
        return std::nullopt;
    }
    return m_session.audioFilePath;
}

bool CommandRecorder::poll() {
    if (m_pid <= 0) return false;

    int exitCode = -1;
    if (ProcessRunner::IsRunning(m_pid, exitCode)) return true;

    std::cerr << "[Recorder] Capture process exited on its own (status " << exitCode << ")" << std::endl;
    m_pid = -1;
    return false;
}

void CommandRecorder::discardFile() {
    if (m_session.audioFilePath.empty()) return;
    std::error_code ec;
    fs::remove(m_session.audioFilePath, ec);
}

} // namespace whisperim::infrastructure
