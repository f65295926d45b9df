#include "domain/Settings.hpp"

#include <algorithm>

namespace whisperim::domain {

const char* ToString(Backend backend) {
    switch (backend) {
        case Backend::OpenVINO: return "openvino";
        case Backend::Default: break;
    }
    return "default";
}

std::optional<Backend> ParseBackend(const std::string& value) {
    if (value == "default") return Backend::Default;
    if (value == "openvino") return Backend::OpenVINO;
    return std::nullopt;
}

const std::vector<std::string>& ModelsFor(Backend backend) {
    static const std::vector<std::string> defaultModels = {"tiny", "base", "small", "medium", "large"};
    static const std::vector<std::string> openvinoModels = {"tiny", "base", "small", "medium"};
    return backend == Backend::OpenVINO ? openvinoModels : defaultModels;
}

const std::vector<std::string>& SupportedLanguages() {
    static const std::vector<std::string> languages = {"auto", "zh", "en", "ja", "ko"};
    return languages;
}

const std::vector<int>& SupportedThreadCounts() {
    static const std::vector<int> threads = {1, 2, 4, 8, 16};
    return threads;
}

bool IsValidModel(Backend backend, const std::string& model) {
    const auto& models = ModelsFor(backend);
    return std::find(models.begin(), models.end(), model) != models.end();
}

bool IsValidLanguage(const std::string& language) {
    const auto& languages = SupportedLanguages();
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

bool IsValidThreadCount(int threads) {
    const auto& counts = SupportedThreadCounts();
    return std::find(counts.begin(), counts.end(), threads) != counts.end();
}

bool ShouldNormalizeChinese(const std::string& language) {
    return language == "zh" || language == "auto";
}

} // namespace whisperim::domain
