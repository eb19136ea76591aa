#pragma once

#include <string>
#include <vector>
#include "go_syntax.hpp"
#include "import_grouper.hpp"

// Writes grouped imports back into a syntax tree as a single import block
class ImportEmitter {
public:
    // Build a new tree: every import declaration removed, one grouped block
    // placed right after the package clause. Other declarations keep their text.
    SyntaxTree rebuild(const SyntaxTree& tree, const GroupedImports& grouped) const;

    // "import (" ... ")" with blank lines at group and sub-project boundaries
    std::string renderImportBlock(const std::vector<Import>& ordered) const;

    // Package clause and import block only, used for stdout previews
    std::string renderImportsOnly(const SyntaxTree& tree) const;

    // [alias ]"path"[ // comment]
    static std::string formatImport(const Import& imp);

    // Whether a blank line goes between two adjacent imports
    static bool needsSeparator(const Import& previous, const Import& current);

    // Imports of all groups in emission order
    static std::vector<Import> flatten(const GroupedImports& grouped);
};
