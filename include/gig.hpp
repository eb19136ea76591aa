#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include <chrono>
#include <thread>
#include "file_processor.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

struct GigOptions {
    fs::path inputPath;                     // Go file or directory
    std::vector<std::string> orgs;          // Organization prefixes, in group order
    std::string currentProject;             // Empty: resolve per file from go.mod
    bool inPlace = false;
    bool fullOutput = false;                // Single file on stdout: print the whole file, not only package + imports
    bool verbose = false;
    unsigned int numThreads = std::thread::hardware_concurrency();
    std::string excludePatterns;            // Comma-separated list of glob patterns to skip
    fs::path reportFile;                    // JSON report destination (optional)
};

class Gig {
public:
    Gig(const GigOptions& options);

    // Run on the configured path. Returns false if any file failed.
    bool run();

    // Get the summary of the processed files
    std::string getSummary() const;

    // JSON report of the last run
    std::string getReport() const;

    const FileProcessor::BatchResult& getBatchResult() const { return batch_; }

private:
    GigOptions options_;
    std::unique_ptr<PatternMatcher> patternMatcher_;
    std::unique_ptr<FileProcessor> fileProcessor_;
    FileProcessor::BatchResult batch_;

    // Timing info
    std::chrono::milliseconds duration_{0};

    FormatterConfig makeConfig() const;
    bool runFile();
    bool runDirectory();
    void writeReport() const;
};
