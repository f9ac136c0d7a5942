#include "config.h"

#include <filesystem>
#include <stdexcept>

namespace Config {

// internal storage for the output directory
static std::string outputDir;

void SetOutputDir(const std::string& dir) {
    if (dir.empty()) {
        throw std::invalid_argument("Output directory cannot be empty");
    }
    outputDir = dir;
}

void ResetOutputDir() { outputDir.clear(); }

std::string GetArtifactPath(const std::string& source, const std::string& suffix) {
    if (outputDir.empty()) {
        return source + suffix;
    }

    std::filesystem::path name = std::filesystem::path(source).filename();
    return (std::filesystem::path(outputDir) / name).string() + suffix;
}

}  // namespace Config
