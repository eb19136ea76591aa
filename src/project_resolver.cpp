#include "project_resolver.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace {

const std::string kModuleDirective = "module ";
const std::string kSourceRootMarker = "/src/";

// Number of segments after the source root that make up a module path
constexpr size_t MODULE_PATH_SEGMENTS = 3;

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

ProjectResolver::ProjectResolver(int maxDepth)
    : maxDepth_(maxDepth) {
}

std::string ProjectResolver::resolve(const fs::path& filePath) const {
    std::string absPath = filePath.string();
    if (!filePath.is_absolute()) {
        std::error_code ec;
        const auto cwd = fs::current_path(ec);
        if (!ec) {
            absPath = (cwd / filePath).string();
        }
    }

    // Look for go.mod in every ancestor directory
    std::string dir = absPath;
    for (int depth = 0; depth < maxDepth_; ++depth) {
        const auto lastSlash = dir.find_last_of('/');
        if (lastSlash == std::string::npos || lastSlash == 0) {
            break;
        }
        dir.erase(lastSlash);

        std::string module = readModulePath(fs::path(dir) / "go.mod");
        if (!module.empty()) {
            return module;
        }
    }

    return inferFromSourcePath(filePath.string());
}

std::string ProjectResolver::readModulePath(const fs::path& goModPath) {
    std::ifstream file(goModPath);
    if (!file) {
        return "";
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.compare(0, kModuleDirective.size(), kModuleDirective) == 0) {
            return trim(line.substr(kModuleDirective.size()));
        }
    }

    return "";
}

std::string ProjectResolver::inferFromSourcePath(const std::string& filePath) {
    const auto marker = filePath.find(kSourceRootMarker);
    if (marker == std::string::npos) {
        return "";
    }

    const std::string rest = filePath.substr(marker + kSourceRootMarker.size());
    std::vector<std::string> segments;
    std::stringstream ss(rest);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        segments.push_back(segment);
    }

    if (segments.size() < MODULE_PATH_SEGMENTS) {
        return "";
    }

    return segments[0] + "/" + segments[1] + "/" + segments[2];
}
