#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <mutex>
#include <thread>
#include <queue>
#include <utility>
#include "pattern_matcher.hpp"
#include "import_grouper.hpp"

namespace fs = std::filesystem;

// Per-run settings handed to every file transform
struct FormatterConfig {
    std::vector<std::string> orgPrefixes;   // Ordered organization prefixes
    std::string currentProject;             // Empty: resolve from go.mod
    bool inPlace = false;                   // Write results back to the files
};

class FileProcessor {
public:
    struct FileResult {
        fs::path path;
        std::string output;             // Rewritten source (the input when nothing changed)
        std::string importsOnly;        // Package clause and import block of the output
        std::string projectPrefix;      // Project prefix used for classification
        size_t importCount = 0;         // Imports after de-duplication
        std::vector<std::pair<std::string, size_t>> groups;   // Imports per group, in emission order
        std::string error;              // Error message if processing failed
        bool processed = false;         // Flag to indicate successful processing
        bool changed = false;           // Output differs from the input
        bool written = false;           // Output was written back to disk
    };

    struct BatchResult {
        std::vector<FileResult> files;  // Same order as the input paths
        size_t successCount = 0;
        size_t failureCount = 0;
    };

    explicit FileProcessor(const PatternMatcher& patternMatcher,
                           unsigned int numThreads = std::thread::hardware_concurrency());
    ~FileProcessor();

    // Group the imports of a single file. Never throws; failures are
    // reported through FileResult::error.
    FileResult processFile(const fs::path& filePath, const FormatterConfig& config) const;

    // Process files independently on worker threads
    BatchResult processBatch(const std::vector<fs::path>& filePaths, const FormatterConfig& config);

    // Recursively collect the Go files below a directory, sorted by path
    std::vector<fs::path> collectFiles(const fs::path& dir) const;

    // Rewrite source text with the given grouping rules, throws on failure
    std::string transform(const std::string& source, const ImportGrouper& grouper) const;

private:
    const PatternMatcher& patternMatcher_;
    unsigned int numThreads_;
    std::vector<std::thread> workers_;
    std::queue<size_t> fileQueue_;
    std::mutex queueMutex_;

    // Thread worker function
    void workerThread(const std::vector<fs::path>& filePaths,
                      const FormatterConfig& config,
                      std::vector<FileResult>& results);

    // Parse, group and re-emit; fills output, importsOnly, importCount and changed
    void rewrite(const std::string& source, const ImportGrouper& grouper, FileResult& result) const;

    // Project prefix from the configuration or the nearest go.mod
    std::string resolveProjectPrefix(const fs::path& filePath, const FormatterConfig& config) const;

    // Maximum file size to process (100 MB)
    static constexpr size_t MAX_FILE_SIZE = 100 * 1024 * 1024;

    std::string readFile(const fs::path& filePath) const;

    // Write through a temporary sibling file so the target is replaced whole
    void writeFileAtomically(const fs::path& filePath, const std::string& content) const;
};
