/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the user configuration (config.json).
 *
 * Every field falls back to its default on its own, so a partially broken
 * file never costs the user the rest of their preferences.
 */

#pragma once

#include "domain/Failure.hpp"
#include "domain/Settings.hpp"

#include <filesystem>
#include <string>

namespace whisperim::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * A missing file yields the defaults silently.
     * @param path Location of config.json.
     * @param failure Optional. Receives a ConfigError if the file was malformed
     *        or a field had to be replaced by its default.
     * @return Settings with a valid value in every field.
     */
    static domain::Settings Load(const std::filesystem::path& path, domain::Failure* failure = nullptr);

    /**
     * @brief Like Load, but writes the defaults when no file exists yet.
     * An existing file is never rewritten, even if it is malformed.
     * @param created Optional. Set to true if the file was written.
     */
    static domain::Settings LoadOrCreate(const std::filesystem::path& path,
                                         domain::Failure* failure = nullptr,
                                         bool* created = nullptr);

    /**
     * @brief Writes settings atomically (temp file + rename), creating parent directories.
     * @param error Populated on failure.
     * @return True if the file was replaced.
     */
    static bool Save(const std::filesystem::path& path, const domain::Settings& settings, std::string& error);
};

} // namespace whisperim::infrastructure
