#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob based filter for directory walks.
//
// Paths are given relative to the walk root. A pattern without '/' matches
// any single path component ("vendor", "*.go"); a pattern containing '/'
// matches the whole relative path ("internal/gen/**"). A trailing '/' limits
// a pattern to directories.
class PatternMatcher {
public:
    // Default constructor: include *.go, skip vendor/ and hidden directories
    PatternMatcher();

    // Add a new ignore pattern
    void addIgnorePattern(const std::string& pattern);

    // Add include patterns (files that match these will be processed)
    void addIncludePattern(const std::string& pattern);

    // Add exclude patterns from a comma-separated string (e.g., "*_gen.go,testdata/")
    void setExcludePatterns(const std::string& patternsStr);

    // Check if a file should be processed (matches include patterns and doesn't match ignore patterns)
    bool shouldProcess(const fs::path& relativePath) const;

    // Check if a file matches any ignore pattern
    bool isIgnored(const fs::path& relativePath) const;

    // Check if a directory should be skipped entirely
    bool isIgnoredDirectory(const fs::path& relativeDir) const;

    // Check if a file matches any include pattern
    bool isIncluded(const fs::path& relativePath) const;

private:
    struct Rule {
        std::string pattern;
        std::regex regex;
        bool directoryOnly = false;   // Pattern ended with '/'
        bool wholePath = false;       // Pattern contains '/', match the relative path
    };

    std::vector<Rule> ignoreRules_;
    std::vector<Rule> includeRules_;

    // Helper methods
    Rule makeRule(const std::string& pattern) const;
    bool matches(const Rule& rule, const fs::path& relativePath, bool isDirectory) const;
    std::regex patternToRegex(const std::string& pattern) const;
    std::vector<std::string> splitPatternString(const std::string& patternsStr) const;
};
