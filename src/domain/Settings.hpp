/**
 * @file Settings.hpp
 * @brief User preferences for the transcription pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace whisperim::domain {

/**
 * @enum Backend
 * @brief Transcription execution mode.
 */
enum class Backend {
    Default,  ///< Plain whisper.cpp.
    OpenVINO  ///< whisper.cpp with the OpenVINO encoder.
};

/**
 * @struct Settings
 * @brief The persisted configuration. Every field always holds a valid value.
 */
struct Settings {
    Backend backend = Backend::Default;
    std::string modelsDir = "whisper.cpp/models";
    std::string model = "base";
    std::string language = "zh";
    int threads = 4;

    bool operator==(const Settings& other) const {
        return backend == other.backend && modelsDir == other.modelsDir && model == other.model &&
               language == other.language && threads == other.threads;
    }
    bool operator!=(const Settings& other) const { return !(*this == other); }
};

const char* ToString(Backend backend);
std::optional<Backend> ParseBackend(const std::string& value);

/** @brief Models selectable for a backend. OpenVINO has no encoder for "large". */
const std::vector<std::string>& ModelsFor(Backend backend);
const std::vector<std::string>& SupportedLanguages();
const std::vector<int>& SupportedThreadCounts();

bool IsValidModel(Backend backend, const std::string& model);
bool IsValidLanguage(const std::string& language);
bool IsValidThreadCount(int threads);

/**
 * @brief True when the transcript should go through Traditional to Simplified conversion.
 * Japanese and Korean text keep their own character forms.
 */
bool ShouldNormalizeChinese(const std::string& language);

} // namespace whisperim::domain
