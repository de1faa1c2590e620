#include "resources.hpp"
#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(_WIN32)
    #include <windows.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

static fs::path executableDir() {
#if defined(_WIN32)
    char buffer[MAX_PATH];
    DWORD n = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
    if (n > 0 && n < MAX_PATH) return fs::path(buffer).parent_path();
#elif defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) return fs::path(buffer).parent_path();
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe.parent_path();
#endif
    return {};
}

std::vector<fs::path> resourceCandidates() {
    std::vector<fs::path> out;

    if (const char* env = std::getenv("VOICEATC_RESOURCES")) {
        if (*env) out.emplace_back(env);
    }

    fs::path exeDir = executableDir();
    if (!exeDir.empty()) out.push_back(exeDir / "resources");

#if !defined(VOICEATC_PORTABLE_ONLY)
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        out.push_back(cwd.parent_path() / "resources");
        out.push_back(cwd / "resources");
    }
#endif
    return out;
}

// -------------------------------------------------------------
// Resource root
// -------------------------------------------------------------
std::string getResourcePath() {
    const std::vector<fs::path> candidates = resourceCandidates();
    std::error_code ec;

    for (const auto& dir : candidates) {
        if (fs::exists(dir / VOICEATC_CONFIG_FILE, ec)) {
            LOG_DEBUG("Resources", "Using resource path: " + dir.string());
            return dir.string();
        }
    }
    for (const auto& dir : candidates) {
        if (fs::is_directory(dir, ec)) {
            LOG_DEBUG("Resources", "Using resource path without config: " + dir.string());
            return dir.string();
        }
    }

#if defined(VOICEATC_PORTABLE_ONLY)
    fs::path fallback = executableDir();
#else
    fs::path fallback = fs::current_path(ec);
#endif
    LOG_DEBUG("Resources", "No resources folder found, using: " + fallback.string());
    return fallback.string();
}

std::string defaultConfigPath() {
    return (fs::path(getResourcePath()) / VOICEATC_CONFIG_FILE).string();
}

std::string loadTextResource(const std::string& filename) {
    fs::path filePath = fs::path(getResourcePath()) / filename;
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        LOG_DEBUG("Resources", "Resource not found: " + filePath.string());
        return {};
    }

    LOG_DEBUG("Resources", "Loaded text resource: " + filename);
    return { std::istreambuf_iterator<char>(file),
             std::istreambuf_iterator<char>() };
}
