// PathUtils Header
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace whisperim::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief ~/.config/whisper-im/config.json (XDG aware). */
    static std::filesystem::path GetConfigFile();

    /**
     * @brief Looks an executable up the way a shell does.
     * Names containing a slash are checked as paths; others are searched in $PATH.
     */
    static std::optional<std::filesystem::path> FindExecutable(const std::string& name);
    static bool IsExecutableFile(const std::filesystem::path& path);

    /**
     * @brief Creates an empty, uniquely named file in the temp directory.
     * @return Its path, or nullopt if the file could not be created.
     */
    static std::optional<std::filesystem::path> CreateTempFile(const std::string& prefix, const std::string& suffix);

    /** @brief Prepends directories that are missing from $PATH. */
    static void PrependToSearchPath(const std::vector<std::filesystem::path>& dirs);
};

} // namespace whisperim::infrastructure
