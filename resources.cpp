#include "resources.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::string getResourcePath() {
#if defined(COMPREHEND_PORTABLE_ONLY)
    // Portable mode: resources live next to executable
    fs::path exePath;
    std::error_code ec;
    exePath = fs::canonical("/proc/self/exe", ec).parent_path();
    if (ec) exePath = fs::current_path();
    return (exePath / "resources").string();
#else
    // Installed mode: use system data directory set by CMake
    return std::string(COMPREHEND_DATA_DIR) + "/resources";
#endif
}

std::string getModelPath(const std::string& modelName) {
    fs::path candidate(modelName);
    if (candidate.is_absolute()) return candidate.string();
    return (fs::path(getResourcePath()) / "models" / modelName).string();
}
