#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

PatternMatcher::PatternMatcher() {
    // Go sources only, test files included
    addIncludePattern("*.go");

    // Dependencies and hidden directories (.git, .idea, ...)
    addIgnorePattern("vendor/");
    addIgnorePattern(".*/");
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignoreRules_.push_back(makeRule(pattern));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includeRules_.push_back(makeRule(pattern));
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) const {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        // Trim whitespace
        pattern.erase(pattern.begin(), std::find_if(pattern.begin(), pattern.end(),
            [](unsigned char ch) { return !std::isspace(ch); }));
        pattern.erase(std::find_if(pattern.rbegin(), pattern.rend(),
            [](unsigned char ch) { return !std::isspace(ch); }).base(), pattern.end());

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (isIgnored(relativePath)) {
        return false;
    }
    return isIncluded(relativePath);
}

bool PatternMatcher::isIgnored(const fs::path& relativePath) const {
    return std::any_of(ignoreRules_.begin(), ignoreRules_.end(), [&](const Rule& rule) {
        return matches(rule, relativePath, false);
    });
}

bool PatternMatcher::isIgnoredDirectory(const fs::path& relativeDir) const {
    return std::any_of(ignoreRules_.begin(), ignoreRules_.end(), [&](const Rule& rule) {
        return matches(rule, relativeDir, true);
    });
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    // If no include patterns, everything is included
    if (includeRules_.empty()) {
        return true;
    }

    return std::any_of(includeRules_.begin(), includeRules_.end(), [&](const Rule& rule) {
        return matches(rule, relativePath, false);
    });
}

PatternMatcher::Rule PatternMatcher::makeRule(const std::string& pattern) const {
    Rule rule;
    rule.pattern = pattern;

    std::string glob = pattern;
    if (!glob.empty() && glob.back() == '/') {
        rule.directoryOnly = true;
        glob.pop_back();
    }
    if (!glob.empty() && glob.front() == '/') {
        glob.erase(0, 1);
        rule.wholePath = true;
    }
    if (glob.find('/') != std::string::npos) {
        rule.wholePath = true;
    }

    rule.regex = patternToRegex(glob);
    return rule;
}

bool PatternMatcher::matches(const Rule& rule, const fs::path& relativePath, bool isDirectory) const {
    const std::string pathStr = relativePath.generic_string();

    if (rule.wholePath) {
        if (rule.directoryOnly && !isDirectory) {
            // Directory rule applied to a file: check its parent directories
            for (fs::path parent = relativePath.parent_path(); !parent.empty(); parent = parent.parent_path()) {
                if (std::regex_match(parent.generic_string(), rule.regex)) {
                    return true;
                }
            }
            return false;
        }
        return std::regex_match(pathStr, rule.regex);
    }

    // Single component pattern: test every component; a directory-only rule
    // skips the file name itself
    std::vector<std::string> components;
    for (const auto& part : relativePath) {
        const std::string name = part.string();
        if (!name.empty() && name != "." && name != "/") {
            components.push_back(name);
        }
    }
    if (rule.directoryOnly && !isDirectory && !components.empty()) {
        components.pop_back();
    }

    return std::any_of(components.begin(), components.end(), [&](const std::string& name) {
        return std::regex_match(name, rule.regex);
    });
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) const {
    std::string regexStr;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // Just ** matches anything
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            // ? matches any single character except directory separator
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                   c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            // Escape special regex characters
            regexStr += '\\';
            regexStr += c;
        } else {
            // Other characters match literally
            regexStr += c;
        }
    }

    return std::regex(regexStr);
}
