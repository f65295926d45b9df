#include "infrastructure/WlCopyClipboard.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <iostream>

namespace whisperim::infrastructure {

WlCopyClipboard::WlCopyClipboard(std::string program, std::chrono::milliseconds timeout)
    : m_program(std::move(program))
    , m_timeout(timeout)
{}

bool WlCopyClipboard::write(const std::string& text, domain::Failure& failure) {
    if (!PathUtils::FindExecutable(m_program)) {
        failure = {domain::FailureKind::ClipboardError,
                   m_program + " not found.\nInstall wl-clipboard to copy automatically."};
        return false;
    }

    // wl-copy forks a daemon that keeps serving the selection, which would hold
    // captured pipes open until the next copy.
    ProcessOptions options;
    options.standardInput = text;
    options.captureOutput = false;
    options.timeout = m_timeout;

    ProcessResult result;
    std::string error;
    if (!ProcessRunner::Run(m_program, {}, options, result, error)) {
        failure = {domain::FailureKind::ClipboardError, error};
        return false;
    }
    if (result.timedOut) {
        failure = {domain::FailureKind::ClipboardError, m_program + " did not finish in time."};
        return false;
    }
    if (result.exitCode != 0) {
        failure = {domain::FailureKind::ClipboardError,
                   m_program + " failed with code " + std::to_string(result.exitCode) + "."};
        return false;
    }

    std::cout << "[Clipboard] Copied " << text.size() << " bytes" << std::endl;
    return true;
}

} // namespace whisperim::infrastructure
