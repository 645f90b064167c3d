#include <codegraph/extraction/tree_sitter_parser.h>

#include <spdlog/spdlog.h>
#include <array>

#include <codegraph/extraction/symbol_extractor.h>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codegraph::extraction {

namespace {

// Inner nodes whose full text the extractor reads.
constexpr std::array<std::string_view, 6> kTextNodeTypes = {
    "string", "dotted_name", "attribute", "relative_import", "member_expression", "template_string"};

bool keepsText(std::string_view type) {
    for (auto t : kTextNodeTypes) {
        if (t == type)
            return true;
    }
    return false;
}

SyntaxNode convertNode(TSTreeCursor* cursor, std::string_view content) {
    TSNode node = ts_tree_cursor_current_node(cursor);

    SyntaxNode out;
    out.type = ts_node_type(node);
    if (const char* field = ts_tree_cursor_current_field_name(cursor)) {
        out.fieldName = field;
    }
    out.named = ts_node_is_named(node);
    const TSPoint start = ts_node_start_point(node);
    const TSPoint end = ts_node_end_point(node);
    out.start = SyntaxPoint{start.row, start.column};
    out.end = SyntaxPoint{end.row, end.column};

    if (ts_node_named_child_count(node) == 0 || keepsText(out.type)) {
        const uint32_t start_byte = ts_node_start_byte(node);
        const uint32_t end_byte = ts_node_end_byte(node);
        if (start_byte < end_byte && end_byte <= content.size()) {
            out.text = std::string(content.substr(start_byte, end_byte - start_byte));
        }
    }

    if (ts_tree_cursor_goto_first_child(cursor)) {
        do {
            out.children.push_back(convertNode(cursor, content));
        } while (ts_tree_cursor_goto_next_sibling(cursor));
        ts_tree_cursor_goto_parent(cursor);
    }
    return out;
}

} // namespace

TreeSitterParser::TreeSitterParser(std::shared_ptr<GrammarLoader> loader)
    : loader_(std::move(loader)) {}

bool TreeSitterParser::supports(model::Language language) const {
    return SymbolExtractor::supports(language) && loader_ && loader_->grammarExists(language);
}

Result<SyntaxNode> TreeSitterParser::parse(std::string_view content, model::Language language) {
    if (!loader_) {
        return Error{ErrorCode::InvalidState, "TreeSitterParser has no grammar loader"};
    }
    auto grammar = loader_->loadGrammar(language);
    if (!grammar) {
        return grammar.error();
    }

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser{ts_parser_new(),
                                                                  ts_parser_delete};
    if (!parser || !ts_parser_set_language(parser.get(), grammar.value())) {
        return Error{ErrorCode::ParseError,
                     fmt::format("Incompatible grammar for '{}'", model::toString(language))};
    }

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree{
        ts_parser_parse_string(parser.get(), nullptr, content.data(),
                               static_cast<uint32_t>(content.size())),
        ts_tree_delete};
    if (!tree) {
        return Error{ErrorCode::ParseError, "tree-sitter returned no tree"};
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        spdlog::debug("[TreeSitterParser] syntax errors in {} input, continuing with partial tree",
                      model::toString(language));
    }

    TSTreeCursor cursor = ts_tree_cursor_new(root);
    auto converted = convertNode(&cursor, content);
    ts_tree_cursor_delete(&cursor);
    return converted;
}

} // namespace codegraph::extraction
