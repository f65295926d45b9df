#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>

namespace whisperim::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetConfigFile() {
    return GetConfigHome() / "whisper-im" / "config.json";
}

bool PathUtils::IsExecutableFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> PathUtils::FindExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return fs::path(name);
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) return std::nullopt;

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> PathUtils::CreateTempFile(const std::string& prefix, const std::string& suffix) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";

    std::string pattern = (dir / (prefix + "XXXXXX" + suffix)).string();
    int fd = ::mkstemps(pattern.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::nullopt;
    }
    ::close(fd);
    return fs::path(pattern);
}

void PathUtils::PrependToSearchPath(const std::vector<fs::path>& dirs) {
    const char* pathEnv = std::getenv("PATH");
    std::string current = pathEnv ? pathEnv : "";

    std::string prefix;
    for (const auto& dir : dirs) {
        const std::string entry = dir.string();
        const std::string padded = ":" + current + ":";
        if (padded.find(":" + entry + ":") != std::string::npos) continue;
        if (!prefix.empty()) prefix += ":";
        prefix += entry;
    }
    if (prefix.empty()) return;

    std::string updated = current.empty() ? prefix : prefix + ":" + current;
    ::setenv("PATH", updated.c_str(), 1);
}

} // namespace whisperim::infrastructure
