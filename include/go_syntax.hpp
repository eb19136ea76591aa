#pragma once

#include <string>
#include <vector>
#include <memory>

// One entry of an import declaration as written in the source
struct ImportSpec {
    std::string alias;      // Package name, "_" or "." (empty if none)
    std::string path;       // Import path without quotes
    std::string comment;    // Trailing comment without markers, trimmed
};

// A top-level declaration after the package clause
struct Declaration {
    enum class Kind {
        Import,
        Other
    };

    Kind kind = Kind::Other;
    std::string leading;             // Whitespace and comments since the previous node
    std::string text;                // Exact source text of the declaration
    std::vector<ImportSpec> specs;   // Only filled for import declarations
    std::vector<std::string> detachedComments;   // Raw comments inside an import list not trailing a spec

    bool isImport() const { return kind == Kind::Import; }
};

// Immutable view of a Go source file, split at top-level declarations.
// printSource() on an unmodified tree gives back the original bytes.
struct SyntaxTree {
    std::string header;                     // Everything up to the end of the package clause
    std::string packageName;
    std::vector<Declaration> declarations;
    std::string trailer;                    // Everything after the last top-level node

    // Total number of import specs across all import declarations
    size_t importCount() const;
};

// Parses Go sources with tree-sitter
class GoParser {
public:
    GoParser();
    ~GoParser();

    GoParser(const GoParser&) = delete;
    GoParser& operator=(const GoParser&) = delete;

    // Parse source text, throws std::runtime_error on syntax errors
    SyntaxTree parse(const std::string& source) const;

    // Check whether source text parses without error nodes
    bool isValid(const std::string& source) const;

private:
    struct TreeSitterImpl;
    std::unique_ptr<TreeSitterImpl> impl_;
};

// Render a tree back to source text
std::string printSource(const SyntaxTree& tree);

// Strip comment markers ("//", "/* */") and surrounding whitespace
std::string commentText(const std::string& rawComment);
