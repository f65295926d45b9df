#include "infrastructure/WhisperCliAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <iostream>

namespace whisperim::infrastructure {

namespace fs = std::filesystem;

namespace {

bool IsFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

fs::path EncoderFile(const fs::path& modelsDir, const std::string& model, const char* extension) {
    return modelsDir / ("ggml-" + model + "-encoder-openvino" + extension);
}

} // namespace

WhisperCliAdapter::WhisperCliAdapter(WhisperCliOptions options)
    : m_options(std::move(options))
{}

std::optional<fs::path> WhisperCliAdapter::LocateExecutable() const {
    if (auto found = PathUtils::FindExecutable(m_options.executableName)) {
        return found;
    }
    if (!m_options.fallbackExecutable.empty() && PathUtils::IsExecutableFile(m_options.fallbackExecutable)) {
        return fs::path(m_options.fallbackExecutable);
    }
    return std::nullopt;
}

std::optional<fs::path> WhisperCliAdapter::ResolveModel(const domain::Settings& settings,
                                                        domain::Failure& failure) const {
    const std::string fileName = "ggml-" + settings.model + ".bin";

    std::vector<fs::path> dirs;
    if (!settings.modelsDir.empty()) dirs.emplace_back(settings.modelsDir);
    if (settings.modelsDir != m_options.defaultModelsDir) dirs.emplace_back(m_options.defaultModelsDir);

    for (const auto& dir : dirs) {
        const fs::path modelPath = dir / fileName;
        if (!IsFile(modelPath)) continue;

        if (settings.backend == domain::Backend::OpenVINO) {
            const fs::path xml = EncoderFile(dir, settings.model, ".xml");
            const fs::path bin = EncoderFile(dir, settings.model, ".bin");
            if (!IsFile(xml) || !IsFile(bin)) {
                failure = {domain::FailureKind::ModelNotFound,
                           "OpenVINO encoder not found:\n" + xml.string() + "\n" + bin.string() +
                               "\n\nConfigure models directory in Settings."};
                return std::nullopt;
            }
        }
        return modelPath;
    }

    const fs::path expected = fs::path(dirs.empty() ? m_options.defaultModelsDir : dirs.front().string()) / fileName;
    failure = {domain::FailureKind::ModelNotFound,
               "Model not found:\n" + expected.string() + "\n\nConfigure models directory in Settings."};
    return std::nullopt;
}

std::vector<std::string> WhisperCliAdapter::BuildArguments(const fs::path& modelPath,
                                                          const domain::Settings& settings,
                                                          const std::string& audioPath) {
    std::vector<std::string> args = {
        "-m", modelPath.string(),
        "-l", settings.language,
        "-t", std::to_string(settings.threads),
        "-nt",
        "-np",
    };
    if (settings.backend == domain::Backend::OpenVINO) {
        args.push_back("-oved");
        args.push_back("CPU");
    }
    args.push_back("-f");
    args.push_back(audioPath);
    return args;
}

bool WhisperCliAdapter::transcribe(const std::string& audioPath,
                                   const domain::Settings& settings,
                                   std::string& transcript,
                                   domain::Failure& failure) {
    const auto executable = LocateExecutable();
    if (!executable) {
        failure = {domain::FailureKind::ToolNotFound,
                   m_options.executableName + " not found.\nInstall whisper.cpp or add it to PATH."};
        return false;
    }

    const auto modelPath = ResolveModel(settings, failure);
    if (!modelPath) {
        return false;
    }

    if (!IsFile(audioPath)) {
        failure = {domain::FailureKind::TranscriptionError, "Audio file not found: " + audioPath};
        return false;
    }

    const auto args = BuildArguments(*modelPath, settings, audioPath);
    std::cout << "[Whisper] Running " << executable->string() << " (" << domain::ToString(settings.backend)
              << ", " << settings.model << ", " << settings.language << ", " << settings.threads
              << " threads)" << std::endl;

    ProcessOptions options;
    options.timeout = m_options.timeout;

    ProcessResult result;
    std::string error;
    if (!ProcessRunner::Run(executable->string(), args, options, result, error)) {
        failure = {domain::FailureKind::TranscriptionError, "Whisper error:\n" + error};
        return false;
    }
    if (result.timedOut) {
        failure = {domain::FailureKind::TranscriptionError, "Transcribe timeout"};
        return false;
    }
    if (result.exitCode != 0) {
        failure = {domain::FailureKind::TranscriptionError, "Whisper error:\n" + result.standardError};
        return false;
    }

    transcript = result.standardOutput;
    std::cout << "[Whisper] Done, " << transcript.size() << " bytes of text" << std::endl;
    return true;
}

} // namespace whisperim::infrastructure
