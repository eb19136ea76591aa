#include "go_syntax.hpp"
#include <cstring>
#include <stdexcept>
#include <sstream>
#include <tree_sitter/api.h>

// Go grammar entry point provided by the tree-sitter-go library
extern "C" {
    const TSLanguage* tree_sitter_go(void);
}

namespace {

std::string nodeText(const std::string& source, TSNode node) {
    const uint32_t start = ts_node_start_byte(node);
    const uint32_t end = ts_node_end_byte(node);
    return source.substr(start, end - start);
}

bool hasType(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Remove the quotes of an interpreted ("...") or raw (`...`) string literal
std::string unquote(const std::string& literal) {
    if (literal.size() >= 2 &&
        (literal.front() == '"' || literal.front() == '`') &&
        literal.back() == literal.front()) {
        return literal.substr(1, literal.size() - 2);
    }
    return literal;
}

// Comment that follows a node on the same source line, if any
bool trailingComment(TSNode node, TSNode& comment) {
    TSNode next = ts_node_next_named_sibling(node);
    if (ts_node_is_null(next) || !hasType(next, "comment")) {
        return false;
    }
    if (ts_node_start_point(next).row != ts_node_end_point(node).row) {
        return false;
    }
    comment = next;
    return true;
}

// Comments of an import list that do not trail a spec on its line
std::vector<std::string> collectDetachedComments(const std::string& source, TSNode importDecl) {
    std::vector<std::string> comments;

    const uint32_t count = ts_node_named_child_count(importDecl);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode list = ts_node_named_child(importDecl, i);
        if (!hasType(list, "import_spec_list")) {
            continue;
        }

        const uint32_t entries = ts_node_named_child_count(list);
        for (uint32_t j = 0; j < entries; ++j) {
            TSNode entry = ts_node_named_child(list, j);
            if (!hasType(entry, "comment")) {
                continue;
            }
            TSNode prev = ts_node_prev_named_sibling(entry);
            const bool trailsSpec = !ts_node_is_null(prev) && hasType(prev, "import_spec") &&
                                    ts_node_end_point(prev).row == ts_node_start_point(entry).row;
            if (!trailsSpec) {
                comments.push_back(nodeText(source, entry));
            }
        }
    }

    return comments;
}

// Depth-first search for the first error or missing node
bool findError(TSNode node, TSNode& errorNode) {
    if (ts_node_is_error(node) || ts_node_is_missing(node)) {
        errorNode = node;
        return true;
    }
    const uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (ts_node_has_error(child) && findError(child, errorNode)) {
            return true;
        }
    }
    return false;
}

using TreePtr = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

} // namespace

size_t SyntaxTree::importCount() const {
    size_t count = 0;
    for (const auto& decl : declarations) {
        if (decl.isImport()) {
            count += decl.specs.size();
        }
    }
    return count;
}

struct GoParser::TreeSitterImpl {
    TSParser* parser = nullptr;
    TSQuery* importQuery = nullptr;

    TreeSitterImpl() {
        parser = ts_parser_new();
        if (!ts_parser_set_language(parser, tree_sitter_go())) {
            ts_parser_delete(parser);
            throw std::runtime_error("tree-sitter-go grammar is incompatible with the tree-sitter runtime");
        }

        const char* import_spec_query = "(import_spec) @import.spec";
        uint32_t error_offset;
        TSQueryError error_type;
        importQuery = ts_query_new(tree_sitter_go(), import_spec_query,
                                   static_cast<uint32_t>(strlen(import_spec_query)),
                                   &error_offset, &error_type);
        if (!importQuery) {
            ts_parser_delete(parser);
            throw std::runtime_error("Invalid import query at offset " + std::to_string(error_offset));
        }
    }

    ~TreeSitterImpl() {
        if (importQuery) {
            ts_query_delete(importQuery);
        }
        if (parser) {
            ts_parser_delete(parser);
        }
    }

    TreePtr parse(const std::string& source) const {
        return TreePtr(ts_parser_parse_string(parser, nullptr, source.c_str(),
                                              static_cast<uint32_t>(source.size())),
                       ts_tree_delete);
    }

    // Collect the import specs below an import declaration in source order
    std::vector<ImportSpec> extractSpecs(const std::string& source, TSNode declaration) const {
        std::vector<ImportSpec> specs;

        TSQueryCursor* cursor = ts_query_cursor_new();
        ts_query_cursor_exec(cursor, importQuery, declaration);

        TSQueryMatch match;
        while (ts_query_cursor_next_match(cursor, &match)) {
            for (uint16_t i = 0; i < match.capture_count; ++i) {
                TSNode specNode = match.captures[i].node;

                ImportSpec spec;
                TSNode nameNode = ts_node_child_by_field_name(specNode, "name", 4);
                if (!ts_node_is_null(nameNode)) {
                    spec.alias = nodeText(source, nameNode);
                }
                TSNode pathNode = ts_node_child_by_field_name(specNode, "path", 4);
                if (!ts_node_is_null(pathNode)) {
                    spec.path = unquote(nodeText(source, pathNode));
                }
                TSNode commentNode;
                if (trailingComment(specNode, commentNode)) {
                    spec.comment = commentText(nodeText(source, commentNode));
                }

                specs.push_back(std::move(spec));
            }
        }

        ts_query_cursor_delete(cursor);
        return specs;
    }
};

GoParser::GoParser()
    : impl_(std::make_unique<TreeSitterImpl>()) {
}

GoParser::~GoParser() = default;

SyntaxTree GoParser::parse(const std::string& source) const {
    TreePtr tree = impl_->parse(source);
    if (!tree) {
        throw std::runtime_error("tree-sitter did not produce a syntax tree");
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        TSNode errorNode = root;
        findError(root, errorNode);
        const TSPoint point = ts_node_start_point(errorNode);
        std::ostringstream msg;
        msg << "syntax error at line " << point.row + 1 << ", column " << point.column + 1;
        throw std::runtime_error(msg.str());
    }

    SyntaxTree result;
    bool packageSeen = false;
    uint32_t cursor = 0;

    const uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = ts_node_named_child(root, i);

        // Build constraints and file comments stay in the header
        if (!packageSeen) {
            if (hasType(node, "package_clause")) {
                cursor = ts_node_end_byte(node);
                result.header = source.substr(0, cursor);
                for (uint32_t j = 0; j < ts_node_named_child_count(node); ++j) {
                    result.packageName = nodeText(source, ts_node_named_child(node, j));
                }
                packageSeen = true;
            }
            continue;
        }

        // Free-standing comments become leading trivia of the next declaration
        if (hasType(node, "comment")) {
            continue;
        }

        Declaration decl;
        const uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);

        if (hasType(node, "import_declaration")) {
            decl.kind = Declaration::Kind::Import;
            decl.specs = impl_->extractSpecs(source, node);
            decl.detachedComments = collectDetachedComments(source, node);

            // import "fmt" // comment
            TSNode commentNode;
            if (trailingComment(node, commentNode)) {
                const bool singleSpec = ts_node_named_child_count(node) > 0 &&
                                        hasType(ts_node_named_child(node, 0), "import_spec");
                if (singleSpec && decl.specs.size() == 1 && decl.specs.front().comment.empty()) {
                    decl.specs.front().comment = commentText(nodeText(source, commentNode));
                } else {
                    decl.detachedComments.push_back(nodeText(source, commentNode));
                }
                end = ts_node_end_byte(commentNode);
                ++i;
            }
        }

        decl.leading = source.substr(cursor, start - cursor);
        decl.text = source.substr(start, end - start);
        cursor = end;

        result.declarations.push_back(std::move(decl));
    }

    if (!packageSeen) {
        throw std::runtime_error("missing package clause");
    }

    result.trailer = source.substr(cursor);
    return result;
}

bool GoParser::isValid(const std::string& source) const {
    TreePtr tree = impl_->parse(source);
    if (!tree) {
        return false;
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        return false;
    }

    const uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        if (hasType(ts_node_named_child(root, i), "package_clause")) {
            return true;
        }
    }
    return false;
}

std::string printSource(const SyntaxTree& tree) {
    std::string out = tree.header;
    for (const auto& decl : tree.declarations) {
        out += decl.leading;
        out += decl.text;
    }
    out += tree.trailer;
    return out;
}

std::string commentText(const std::string& rawComment) {
    std::string text = rawComment;
    if (text.compare(0, 2, "//") == 0) {
        text = text.substr(2);
    } else if (text.size() >= 4 && text.compare(0, 2, "/*") == 0 &&
               text.compare(text.size() - 2, 2, "*/") == 0) {
        text = text.substr(2, text.size() - 4);
    }
    return trim(text);
}
