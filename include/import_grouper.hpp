#pragma once

#include <map>
#include <string>
#include <vector>
#include "go_syntax.hpp"

// Semantic group of an import.
// Groups are totally ordered: Standard < ThirdParty < Organization(0) <
// Organization(1) < ... < Project, which is also the emission order.
class ImportGroup {
public:
    enum class Kind {
        Standard,
        ThirdParty,
        Organization,
        Project
    };

    ImportGroup() = default;

    static ImportGroup standard() { return ImportGroup(Kind::Standard, 0); }
    static ImportGroup thirdParty() { return ImportGroup(Kind::ThirdParty, 0); }
    static ImportGroup organization(size_t index) { return ImportGroup(Kind::Organization, index); }
    static ImportGroup project() { return ImportGroup(Kind::Project, 0); }

    Kind kind() const { return kind_; }
    bool isOrganization() const { return kind_ == Kind::Organization; }

    // Position of the matching prefix in the configured list (Organization only)
    size_t orgIndex() const { return orgIndex_; }

    // Name used in the JSON report ("std", "third-party", "org[1]", "project")
    std::string name() const;

    bool operator==(const ImportGroup& other) const {
        return kind_ == other.kind_ && orgIndex_ == other.orgIndex_;
    }
    bool operator!=(const ImportGroup& other) const { return !(*this == other); }
    bool operator<(const ImportGroup& other) const;

private:
    ImportGroup(Kind kind, size_t orgIndex) : kind_(kind), orgIndex_(orgIndex) {}

    Kind kind_ = Kind::ThirdParty;
    size_t orgIndex_ = 0;
};

// A single import, as classified for re-emission
struct Import {
    std::string alias;            // "" for none, "_" and "." kept verbatim
    std::string path;
    std::string comment;
    ImportGroup group;
    std::string subProjectName;   // Path segment after the organization prefix

    // Organization index, or -1 for any other group
    int orgIndex() const {
        return group.isOrganization() ? static_cast<int>(group.orgIndex()) : -1;
    }
};

// Imports bucketed by group; iteration order is emission order
using GroupedImports = std::map<ImportGroup, std::vector<Import>>;

// Organization match for an import path
struct OrgInfo {
    int index = -1;
    std::string subProjectName;
};

// Read the imports of a parsed file, dropping repeated paths (first wins)
std::vector<Import> extractImports(const SyntaxTree& tree);

class ImportGrouper {
public:
    ImportGrouper(std::vector<std::string> orgPrefixes, std::string projectPrefix);

    // Decide the group of an import path (first matching rule wins)
    ImportGroup classify(const std::string& importPath) const;

    // Organization index and sub-project of an import path
    OrgInfo orgInfo(const std::string& importPath) const;

    // Classify, bucket and sort a set of imports
    GroupedImports group(std::vector<Import> imports) const;

    // Sort imports of one group in place
    static void sortGroup(std::vector<Import>& imports, const ImportGroup& group);

    // Check whether prefix matches importPath on a path segment boundary
    static bool hasPathPrefix(const std::string& importPath, const std::string& prefix);

private:
    std::vector<std::string> orgPrefixes_;
    std::string projectPrefix_;
};
