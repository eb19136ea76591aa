#include "import_emitter.hpp"
#include <sstream>

namespace {

// Blank line between the package clause and the import block, and between
// the import block and the first declaration
const std::string kBlockSeparator = "\n\n";

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string trimLeft(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    return first == std::string::npos ? "" : str.substr(first);
}

} // namespace

SyntaxTree ImportEmitter::rebuild(const SyntaxTree& tree, const GroupedImports& grouped) const {
    SyntaxTree result;
    result.header = tree.header;
    result.packageName = tree.packageName;
    result.trailer = tree.trailer;

    const std::vector<Import> ordered = flatten(grouped);
    if (!ordered.empty()) {
        Declaration importDecl;
        importDecl.kind = Declaration::Kind::Import;
        importDecl.leading = kBlockSeparator;
        importDecl.text = renderImportBlock(ordered);
        for (const auto& imp : ordered) {
            importDecl.specs.push_back(ImportSpec{imp.alias, imp.path, imp.comment});
        }
        result.declarations.push_back(std::move(importDecl));
    }

    // Comments written around removed import declarations, and free-standing
    // comments inside their lists, move down to the next kept declaration
    std::string carried;
    bool firstKept = true;

    for (const auto& decl : tree.declarations) {
        if (decl.isImport()) {
            std::vector<std::string> comments = {trim(decl.leading)};
            comments.insert(comments.end(), decl.detachedComments.begin(), decl.detachedComments.end());
            for (const auto& comment : comments) {
                if (!comment.empty()) {
                    carried += carried.empty() ? comment : "\n" + comment;
                }
            }
            continue;
        }

        // A blank line keeps carried comments apart from the declaration's
        // own doc comment
        Declaration kept = decl;
        if ((firstKept && !ordered.empty()) || !carried.empty()) {
            kept.leading = kBlockSeparator;
            if (!carried.empty()) {
                kept.leading += carried + kBlockSeparator;
            }
            kept.leading += trimLeft(decl.leading);
        }
        carried.clear();
        firstKept = false;

        result.declarations.push_back(std::move(kept));
    }

    if (!carried.empty()) {
        result.trailer = kBlockSeparator + carried + "\n" + trimLeft(tree.trailer);
    }

    return result;
}

std::string ImportEmitter::renderImportBlock(const std::vector<Import>& ordered) const {
    std::ostringstream out;
    out << "import (\n";
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (i > 0 && needsSeparator(ordered[i - 1], ordered[i])) {
            out << "\n";
        }
        out << "\t" << formatImport(ordered[i]) << "\n";
    }
    out << ")";
    return out.str();
}

std::string ImportEmitter::renderImportsOnly(const SyntaxTree& tree) const {
    std::string out = "package " + tree.packageName + "\n";
    for (const auto& decl : tree.declarations) {
        if (decl.isImport()) {
            out += "\n" + decl.text + "\n";
            break;
        }
    }
    return out;
}

std::string ImportEmitter::formatImport(const Import& imp) {
    std::string line;
    if (!imp.alias.empty()) {
        line += imp.alias + " ";
    }
    line += "\"" + imp.path + "\"";

    const std::string comment = trim(imp.comment);
    if (comment.find('\n') != std::string::npos) {
        line += " /* " + comment + " */";
    } else if (!comment.empty()) {
        line += " // " + comment;
    }
    return line;
}

bool ImportEmitter::needsSeparator(const Import& previous, const Import& current) {
    if (previous.group != current.group) {
        return true;
    }

    // Sub-projects of one organization get their own cluster. An import of
    // the organization root (empty sub-project) never starts a new one.
    return current.group.isOrganization() &&
           !previous.subProjectName.empty() &&
           !current.subProjectName.empty() &&
           previous.subProjectName != current.subProjectName;
}

std::vector<Import> ImportEmitter::flatten(const GroupedImports& grouped) {
    std::vector<Import> ordered;
    for (const auto& entry : grouped) {
        ordered.insert(ordered.end(), entry.second.begin(), entry.second.end());
    }
    return ordered;
}
