/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <chrono>
#include <climits>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace whisperim::infrastructure {

namespace fs = std::filesystem;

namespace {

void Note(domain::Failure* failure, const std::string& message) {
    std::cerr << "[ConfigLoader] " << message << std::endl;
    if (!failure) return;
    if (failure->isSet()) {
        failure->message += "\n" + message;
    } else {
        failure->kind = domain::FailureKind::ConfigError;
        failure->message = message;
    }
}

std::optional<std::string> ReadString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Threads were stored as strings ("4") by earlier releases.
std::optional<int> ReadThreads(const nlohmann::json& j) {
    auto it = j.find("threads");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        return value > static_cast<std::uint64_t>(INT_MAX) ? -1 : static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        return (value < INT_MIN || value > INT_MAX) ? -1 : static_cast<int>(value);
    }
    if (it->is_string()) {
        const std::string value = it->get<std::string>();
        try {
            std::size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::exception&) {
        }
    }
    return -1;
}

} // namespace

domain::Settings ConfigLoader::Load(const fs::path& path, domain::Failure* failure) {
    domain::Settings settings;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            Note(failure, "Cannot open " + path.string() + ", using defaults");
            return settings;
        }
        f >> j;
    } catch (const std::exception& e) {
        Note(failure, "Error reading " + path.string() + ": " + e.what() + ", using defaults");
        return settings;
    }

    if (!j.is_object()) {
        Note(failure, "Expected a JSON object in " + path.string() + ", using defaults");
        return settings;
    }

    if (auto backend = ReadString(j, "backend")) {
        if (auto parsed = domain::ParseBackend(*backend)) {
            settings.backend = *parsed;
        } else {
            Note(failure, "Unknown backend '" + *backend + "', using default");
        }
    } else if (j.contains("backend")) {
        Note(failure, "Invalid backend, using default");
    }

    auto modelsDir = ReadString(j, "modelsDir");
    if (!modelsDir) modelsDir = ReadString(j, "models_dir");
    if (modelsDir && !modelsDir->empty()) {
        settings.modelsDir = *modelsDir;
    } else if (modelsDir || j.contains("modelsDir")) {
        Note(failure, "Invalid modelsDir, using default");
    }

    if (auto model = ReadString(j, "model")) {
        if (domain::IsValidModel(settings.backend, *model)) {
            settings.model = *model;
        } else {
            Note(failure, "Model '" + *model + "' is not available for backend " +
                              domain::ToString(settings.backend) + ", using " + settings.model);
        }
    } else if (j.contains("model")) {
        Note(failure, "Invalid model, using default");
    }

    if (auto language = ReadString(j, "language")) {
        if (domain::IsValidLanguage(*language)) {
            settings.language = *language;
        } else {
            Note(failure, "Unknown language '" + *language + "', using default");
        }
    } else if (j.contains("language")) {
        Note(failure, "Invalid language, using default");
    }

    if (auto threads = ReadThreads(j)) {
        if (domain::IsValidThreadCount(*threads)) {
            settings.threads = *threads;
        } else {
            Note(failure, "Invalid thread count, using default");
        }
    }

    return settings;
}

bool ConfigLoader::Save(const fs::path& path, const domain::Settings& settings, std::string& error) {
    nlohmann::json j;
    j["backend"] = domain::ToString(settings.backend);
    j["modelsDir"] = settings.modelsDir;
    j["model"] = settings.model;
    j["language"] = settings.language;
    j["threads"] = settings.threads;

    std::string content;
    try {
        content = j.dump(2);
    } catch (const std::exception& e) {
        error = std::string("Cannot serialize settings: ") + e.what();
        return false;
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "Cannot create " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            error = "Cannot open " + tempPath.string() + " for writing";
            return false;
        }
        ofs << content << "\n";
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed: " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        error = "Rename failed: " + ec.message();
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }
    return true;
}

domain::Settings ConfigLoader::LoadOrCreate(const fs::path& path, domain::Failure* failure, bool* created) {
    if (created) *created = false;

    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    domain::Settings settings = Load(path, failure);
    if (exists || ec) {
        return settings;
    }

    std::string error;
    if (!Save(path, settings, error)) {
        Note(failure, "Cannot create " + path.string() + ": " + error);
        return settings;
    }
    std::cout << "[ConfigLoader] Created " << path.string() << " with defaults" << std::endl;
    if (created) *created = true;
    return settings;
}

} // namespace whisperim::infrastructure
