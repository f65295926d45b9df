#pragma once

#include "domain/TranscriptionService.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace whisperim::infrastructure {

/**
 * @struct WhisperCliOptions
 * @brief Where to look for whisper.cpp and how long to wait for it.
 */
struct WhisperCliOptions {
    std::string executableName = "whisper-cli";
    std::string fallbackExecutable = "whisper.cpp/build/bin/whisper-cli";
    std::string defaultModelsDir = "whisper.cpp/models";
    std::chrono::milliseconds timeout{120000};
};

/**
 * @class WhisperCliAdapter
 * @brief Runs the whisper.cpp command line tool on a finished recording.
 * stdout (with -nt, no timestamps) is the transcript.
 */
class WhisperCliAdapter : public domain::TranscriptionService {
public:
    explicit WhisperCliAdapter(WhisperCliOptions options = WhisperCliOptions{});
    ~WhisperCliAdapter() override = default;

    bool transcribe(const std::string& audioPath,
                    const domain::Settings& settings,
                    std::string& transcript,
                    domain::Failure& failure) override;

    /** @brief PATH lookup first, then the fallback build location. */
    std::optional<std::filesystem::path> LocateExecutable() const;

    /**
     * @brief Finds ggml-<model>.bin in the configured directory, then the default one.
     * For OpenVINO the encoder pair must sit next to the model.
     */
    std::optional<std::filesystem::path> ResolveModel(const domain::Settings& settings,
                                                      domain::Failure& failure) const;

    static std::vector<std::string> BuildArguments(const std::filesystem::path& modelPath,
                                                   const domain::Settings& settings,
                                                   const std::string& audioPath);

private:
    WhisperCliOptions m_options;
};

} // namespace whisperim::infrastructure
