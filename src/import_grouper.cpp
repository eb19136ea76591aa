#include "import_grouper.hpp"
#include <algorithm>
#include <tuple>
#include <unordered_set>
#include "std_packages.hpp"

std::string ImportGroup::name() const {
    switch (kind_) {
        case Kind::Standard:
            return "std";
        case Kind::ThirdParty:
            return "third-party";
        case Kind::Organization:
            return "org[" + std::to_string(orgIndex_) + "]";
        case Kind::Project:
            return "project";
    }
    return "unknown";
}

bool ImportGroup::operator<(const ImportGroup& other) const {
    return std::make_tuple(static_cast<int>(kind_), orgIndex_) <
           std::make_tuple(static_cast<int>(other.kind_), other.orgIndex_);
}

std::vector<Import> extractImports(const SyntaxTree& tree) {
    std::vector<Import> imports;
    std::unordered_set<std::string> seen;

    for (const auto& decl : tree.declarations) {
        if (!decl.isImport()) {
            continue;
        }
        for (const auto& spec : decl.specs) {
            if (!seen.insert(spec.path).second) {
                continue;
            }

            Import imp;
            imp.alias = spec.alias;
            imp.path = spec.path;
            imp.comment = spec.comment;
            imports.push_back(std::move(imp));
        }
    }

    return imports;
}

ImportGrouper::ImportGrouper(std::vector<std::string> orgPrefixes, std::string projectPrefix)
    : orgPrefixes_(std::move(orgPrefixes)),
      projectPrefix_(std::move(projectPrefix)) {
}

bool ImportGrouper::hasPathPrefix(const std::string& importPath, const std::string& prefix) {
    if (prefix.empty() || importPath.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (importPath.size() == prefix.size() || prefix.back() == '/') {
        return true;
    }
    return importPath[prefix.size()] == '/';
}

ImportGroup ImportGrouper::classify(const std::string& importPath) const {
    if (isStandardPackage(importPath)) {
        return ImportGroup::standard();
    }

    if (hasPathPrefix(importPath, projectPrefix_)) {
        return ImportGroup::project();
    }

    for (size_t i = 0; i < orgPrefixes_.size(); ++i) {
        if (importPath.compare(0, orgPrefixes_[i].size(), orgPrefixes_[i]) == 0) {
            return ImportGroup::organization(i);
        }
    }

    return ImportGroup::thirdParty();
}

OrgInfo ImportGrouper::orgInfo(const std::string& importPath) const {
    OrgInfo info;

    for (size_t i = 0; i < orgPrefixes_.size(); ++i) {
        const auto& org = orgPrefixes_[i];
        if (importPath.compare(0, org.size(), org) != 0) {
            continue;
        }

        std::string remaining = importPath.substr(org.size());
        if (!remaining.empty() && remaining.front() == '/') {
            remaining.erase(0, 1);
        }

        info.index = static_cast<int>(i);
        info.subProjectName = remaining.substr(0, remaining.find('/'));
        break;
    }

    return info;
}

GroupedImports ImportGrouper::group(std::vector<Import> imports) const {
    GroupedImports grouped;

    for (auto& imp : imports) {
        imp.group = classify(imp.path);
        imp.subProjectName.clear();
        if (imp.group.isOrganization()) {
            imp.subProjectName = orgInfo(imp.path).subProjectName;
        }
        grouped[imp.group].push_back(std::move(imp));
    }

    for (auto& [key, members] : grouped) {
        sortGroup(members, key);
    }

    return grouped;
}

void ImportGrouper::sortGroup(std::vector<Import>& imports, const ImportGroup& group) {
    if (group.isOrganization()) {
        // Keep each sub-project contiguous, then order by path
        std::stable_sort(imports.begin(), imports.end(), [](const Import& a, const Import& b) {
            if (a.subProjectName != b.subProjectName) {
                return a.subProjectName < b.subProjectName;
            }
            return a.path < b.path;
        });
    } else {
        std::stable_sort(imports.begin(), imports.end(), [](const Import& a, const Import& b) {
            return a.path < b.path;
        });
    }
}
