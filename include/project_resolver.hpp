#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief Derives the module path of the project a Go file belongs to
 *
 * Walks up from the file looking for a go.mod and reads its module
 * directive. When no go.mod is found within the depth limit, falls back to
 * the GOPATH layout (".../src/host/owner/repo/...").
 */
class ProjectResolver {
public:
    explicit ProjectResolver(int maxDepth = 20);

    // Returns the module path, or an empty string when it cannot be determined
    std::string resolve(const fs::path& filePath) const;

    // Read the module directive of a go.mod file (empty if none)
    static std::string readModulePath(const fs::path& goModPath);

    // GOPATH fallback: first three segments after "/src/"
    static std::string inferFromSourcePath(const std::string& filePath);

private:
    int maxDepth_;
};
