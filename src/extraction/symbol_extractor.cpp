#include <codegraph/extraction/symbol_extractor.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <optional>

#include <codegraph/core/ids.h>

namespace codegraph::extraction {

using model::Edge;
using model::EdgeKind;
using model::Language;
using model::SourceSpan;
using model::Symbol;
using model::SymbolKind;

namespace {

constexpr size_t MaxNodeTypes = 6;

template <size_t N> struct ConstList {
    std::array<std::string_view, N> items{};
    size_t count = 0;

    constexpr bool contains(std::string_view value) const noexcept {
        for (size_t i = 0; i < count; ++i) {
            if (items[i] == value)
                return true;
        }
        return false;
    }
};

using NodeTypeList = ConstList<MaxNodeTypes>;

template <typename... Args> constexpr NodeTypeList makeNodeTypes(Args... args) {
    NodeTypeList result;
    result.count = sizeof...(args);
    size_t i = 0;
    ((result.items[i++] = args), ...);
    return result;
}

enum class ImportStyle { Python, EcmaScript };

// Node vocabulary of one grammar
struct LanguageConfig {
    std::string_view name;
    ImportStyle import_style = ImportStyle::Python;

    NodeTypeList function_types;
    NodeTypeList class_types;
    NodeTypeList method_types;
    // Wrapper nodes around definitions (decorators, export) and the field
    // that holds the wrapped definition
    NodeTypeList wrapper_types;
    std::string_view wrapper_field;

    NodeTypeList identifier_types;
    NodeTypeList parameter_types; // typed/default parameter nodes carrying a name
    NodeTypeList string_types;
    std::string_view expression_statement;

    NodeTypeList import_types;
    NodeTypeList call_types;
    std::string_view call_function_field;
    NodeTypeList member_types;
    std::string_view member_name_field;
};

inline constexpr LanguageConfig lang_python = {
    .name = "python",
    .import_style = ImportStyle::Python,
    .function_types = makeNodeTypes("function_definition"),
    .class_types = makeNodeTypes("class_definition"),
    .method_types = makeNodeTypes("function_definition"),
    .wrapper_types = makeNodeTypes("decorated_definition"),
    .wrapper_field = "definition",
    .identifier_types = makeNodeTypes("identifier"),
    .parameter_types =
        makeNodeTypes("typed_parameter", "default_parameter", "typed_default_parameter"),
    .string_types = makeNodeTypes("string"),
    .expression_statement = "expression_statement",
    .import_types = makeNodeTypes("import_statement", "import_from_statement"),
    .call_types = makeNodeTypes("call"),
    .call_function_field = "function",
    .member_types = makeNodeTypes("attribute"),
    .member_name_field = "attribute",
};

inline constexpr LanguageConfig lang_typescript = {
    .name = "typescript",
    .import_style = ImportStyle::EcmaScript,
    .function_types = makeNodeTypes("function_declaration", "generator_function_declaration"),
    .class_types = makeNodeTypes("class_declaration", "abstract_class_declaration"),
    .method_types = makeNodeTypes("method_definition"),
    .wrapper_types = makeNodeTypes("export_statement"),
    .wrapper_field = "declaration",
    .identifier_types = makeNodeTypes("identifier", "property_identifier"),
    .parameter_types = makeNodeTypes("required_parameter", "optional_parameter",
                                     "assignment_pattern", "rest_pattern"),
    .string_types = makeNodeTypes("string"),
    .expression_statement = "expression_statement",
    .import_types = makeNodeTypes("import_statement"),
    .call_types = makeNodeTypes("call_expression"),
    .call_function_field = "function",
    .member_types = makeNodeTypes("member_expression"),
    .member_name_field = "property",
};

const LanguageConfig* getLanguageConfig(Language language) noexcept {
    switch (language) {
        case Language::Python:
            return &lang_python;
        case Language::TypeScript:
        case Language::JavaScript:
            return &lang_typescript;
        default:
            return nullptr;
    }
}

SourceSpan spanOf(const SyntaxNode& node) {
    return SourceSpan{node.start.row + 1, node.start.column + 1, node.end.row + 1,
                      node.end.column + 1};
}

// Remove an optional string prefix (r, b, u, f) and the surrounding quotes.
std::string stripQuotes(std::string_view text) {
    size_t prefix = 0;
    while (prefix < text.size() && prefix < 2 &&
           std::string_view("rRbBuUfF").find(text[prefix]) != std::string_view::npos) {
        ++prefix;
    }
    if (prefix < text.size() && (text[prefix] == '"' || text[prefix] == '\'')) {
        text.remove_prefix(prefix);
    }
    for (std::string_view q : {"\"\"\"", "'''", "\"", "'", "`"}) {
        if (text.size() >= 2 * q.size() && text.starts_with(q) && text.ends_with(q)) {
            return std::string(text.substr(q.size(), text.size() - 2 * q.size()));
        }
    }
    return std::string(text);
}

struct ExtractionContext {
    const LanguageConfig& config;
    std::string_view file_path;
    std::string_view repo_id;
    Language language;
    ExtractionResult& result;

    void skip(const SyntaxNode& node, const Error& error) const {
        ++result.stats.skipped_nodes;
        spdlog::warn("[SymbolExtractor] skipping {} at {}:{}: {}", node.type, file_path,
                     node.start.row + 1, error.message);
    }

    std::string symbolId(SymbolKind kind, std::string_view name, const SourceSpan& span) const {
        return core::stableId("sym", {repo_id, file_path, model::toString(kind), name,
                                      std::to_string(span.startLine),
                                      std::to_string(span.startColumn)});
    }

    void addEdge(EdgeKind kind, const Symbol& source, std::optional<std::string> target,
                 nlohmann::json attributes, std::string_view discriminator) {
        Edge edge;
        edge.kind = kind;
        edge.sourceId = source.id;
        edge.id = core::stableId("edge", {repo_id, model::toString(kind), source.id,
                                          target ? std::string_view(*target) : std::string_view{},
                                          discriminator});
        edge.targetId = std::move(target);
        edge.attributes = std::move(attributes);
        edge.repoId = std::string(repo_id);
        result.edges.push_back(std::move(edge));
    }
};

const SyntaxNode& unwrapDefinition(const SyntaxNode& node, const LanguageConfig& config) {
    if (!config.wrapper_types.contains(node.type))
        return node;
    if (const auto* inner = node.childByField(config.wrapper_field))
        return *inner;
    for (const auto& child : node.children) {
        if (config.function_types.contains(child.type) || config.class_types.contains(child.type))
            return child;
    }
    return node;
}

Result<std::string> nodeName(const SyntaxNode& node) {
    const auto* nameNode = node.childByField("name");
    if (!nameNode) {
        return Error{ErrorCode::InvalidData, "missing name child"};
    }
    if (nameNode->text.empty()) {
        return Error{ErrorCode::InvalidData, "empty name"};
    }
    return nameNode->text;
}

std::vector<std::string> collectParameters(const SyntaxNode* params,
                                           const LanguageConfig& config) {
    std::vector<std::string> out;
    if (!params)
        return out;
    for (const auto& child : params->children) {
        if (config.identifier_types.contains(child.type)) {
            out.push_back(child.text);
            continue;
        }
        if (!config.parameter_types.contains(child.type))
            continue;
        const SyntaxNode* nameNode = child.childByField("name");
        if (!nameNode)
            nameNode = child.childByField("pattern");
        if (!nameNode || !config.identifier_types.contains(nameNode->type)) {
            nameNode = nullptr;
            for (const auto& inner : child.children) {
                if (config.identifier_types.contains(inner.type)) {
                    nameNode = &inner;
                    break;
                }
            }
        }
        if (nameNode && config.identifier_types.contains(nameNode->type))
            out.push_back(nameNode->text);
    }
    return out;
}

std::optional<std::string> extractDocstring(const SyntaxNode* body,
                                            const LanguageConfig& config) {
    if (!body)
        return std::nullopt;
    const SyntaxNode* first = nullptr;
    for (const auto& child : body->children) {
        if (!child.named || child.type == "comment")
            continue;
        first = &child;
        break;
    }
    if (!first || first->type != config.expression_statement || first->children.empty())
        return std::nullopt;
    const auto& expr = first->children.front();
    if (!config.string_types.contains(expr.type))
        return std::nullopt;
    return stripQuotes(expr.text);
}

Result<Symbol> makeFunctionSymbol(const ExtractionContext& ctx, const SyntaxNode& node,
                                  const Symbol* parent) {
    auto name = nodeName(node);
    if (!name)
        return name.error();

    auto params = collectParameters(node.childByField("parameters"), ctx.config);

    Symbol symbol;
    symbol.name = std::move(name).value();
    symbol.kind = parent ? SymbolKind::Method : SymbolKind::Function;
    symbol.filePath = std::string(ctx.file_path);
    symbol.language = ctx.language;
    symbol.span = spanOf(node);
    symbol.docstring = extractDocstring(node.childByField("body"), ctx.config);

    std::string signature = symbol.name + "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            signature += ", ";
        signature += params[i];
    }
    signature += ")";
    symbol.signature = std::move(signature);

    if (parent)
        symbol.parentId = parent->id;
    symbol.attributes = nlohmann::json{{"parameters", params}};
    symbol.repoId = std::string(ctx.repo_id);
    symbol.id = ctx.symbolId(symbol.kind, symbol.name, symbol.span);
    return symbol;
}

std::vector<std::string> collectSuperclasses(const SyntaxNode& classNode,
                                             const LanguageConfig& config) {
    std::vector<std::string> out;
    auto addFrom = [&](const SyntaxNode& list) {
        for (const auto& child : list.children) {
            if (config.identifier_types.contains(child.type) ||
                config.member_types.contains(child.type) || child.type == "type_identifier") {
                out.push_back(child.text);
            }
        }
    };

    if (config.import_style == ImportStyle::Python) {
        if (const auto* args = classNode.childByField("superclasses"))
            addFrom(*args);
        return out;
    }

    // TypeScript: class_heritage > extends_clause. JavaScript: class_heritage > expression.
    if (const auto* heritage = classNode.firstChildOfType("class_heritage")) {
        if (const auto* extends = heritage->firstChildOfType("extends_clause"))
            addFrom(*extends);
        else
            addFrom(*heritage);
    }
    return out;
}

Result<Symbol> makeClassSymbol(const ExtractionContext& ctx, const SyntaxNode& node) {
    auto name = nodeName(node);
    if (!name)
        return name.error();

    Symbol symbol;
    symbol.name = std::move(name).value();
    symbol.kind = SymbolKind::Class;
    symbol.filePath = std::string(ctx.file_path);
    symbol.language = ctx.language;
    symbol.span = spanOf(node);
    symbol.docstring = extractDocstring(node.childByField("body"), ctx.config);
    symbol.attributes = nlohmann::json{{"superclasses", collectSuperclasses(node, ctx.config)}};
    symbol.repoId = std::string(ctx.repo_id);
    symbol.id = ctx.symbolId(symbol.kind, symbol.name, symbol.span);
    return symbol;
}

void extractFunctions(ExtractionContext& ctx, const SyntaxNode& root) {
    for (const auto& child : root.children) {
        const auto& node = unwrapDefinition(child, ctx.config);
        if (!ctx.config.function_types.contains(node.type))
            continue;
        auto symbol = makeFunctionSymbol(ctx, node, nullptr);
        if (!symbol) {
            ctx.skip(node, symbol.error());
            continue;
        }
        ctx.result.symbols.push_back(std::move(symbol).value());
    }
}

void extractClasses(ExtractionContext& ctx, const SyntaxNode& root) {
    for (const auto& child : root.children) {
        const auto& node = unwrapDefinition(child, ctx.config);
        if (!ctx.config.class_types.contains(node.type))
            continue;
        auto classResult = makeClassSymbol(ctx, node);
        if (!classResult) {
            ctx.skip(node, classResult.error());
            continue;
        }
        ctx.result.symbols.push_back(std::move(classResult).value());
        // Copy: push_back below may reallocate the vector.
        const Symbol classSymbol = ctx.result.symbols.back();

        const auto* body = node.childByField("body");
        if (!body)
            continue;
        for (const auto& member : body->children) {
            const auto& method = unwrapDefinition(member, ctx.config);
            if (!ctx.config.method_types.contains(method.type))
                continue;
            auto methodResult = makeFunctionSymbol(ctx, method, &classSymbol);
            if (!methodResult) {
                ctx.skip(method, methodResult.error());
                continue;
            }
            auto methodSymbol = std::move(methodResult).value();
            ctx.addEdge(EdgeKind::Contains, classSymbol, methodSymbol.id, nlohmann::json::object(),
                        {});
            ctx.result.symbols.push_back(std::move(methodSymbol));
        }
    }
}

// Plain import: every top-level function and class imports the module.
void addModuleImport(ExtractionContext& ctx, const std::string& module, const SyntaxNode& stmt) {
    const auto line = std::to_string(stmt.start.row + 1);
    const size_t count = ctx.result.symbols.size();
    for (size_t i = 0; i < count; ++i) {
        const auto symbol = ctx.result.symbols[i];
        if (symbol.kind != SymbolKind::Function && symbol.kind != SymbolKind::Class)
            continue;
        ctx.addEdge(EdgeKind::Imports, symbol, std::nullopt, nlohmann::json{{"module", module}},
                    module + "@" + line);
    }
}

// from-import: only symbols named like an imported identifier.
void addNamedImport(ExtractionContext& ctx, const std::string& module, const std::string& name,
                    const SyntaxNode& stmt) {
    const auto line = std::to_string(stmt.start.row + 1);
    const size_t count = ctx.result.symbols.size();
    for (size_t i = 0; i < count; ++i) {
        const auto symbol = ctx.result.symbols[i];
        if (symbol.name != name)
            continue;
        ctx.addEdge(EdgeKind::Imports, symbol, std::nullopt,
                    nlohmann::json{{"module", module}, {"name", name}},
                    module + ":" + name + "@" + line);
    }
}

void extractPythonImport(ExtractionContext& ctx, const SyntaxNode& stmt) {
    if (stmt.type == "import_statement") {
        for (const auto& child : stmt.children) {
            if (child.fieldName != "name")
                continue;
            const SyntaxNode* dotted = &child;
            if (child.type == "aliased_import") {
                dotted = child.childByField("name");
            }
            if (!dotted || dotted->text.empty()) {
                ctx.skip(child, Error{ErrorCode::InvalidData, "import without module name"});
                continue;
            }
            addModuleImport(ctx, dotted->text, stmt);
        }
        return;
    }

    const auto* moduleNode = stmt.childByField("module_name");
    if (!moduleNode || moduleNode->text.empty()) {
        ctx.skip(stmt, Error{ErrorCode::InvalidData, "from-import without module name"});
        return;
    }
    for (const auto& child : stmt.children) {
        if (child.fieldName != "name")
            continue;
        const SyntaxNode* nameNode = &child;
        if (child.type == "aliased_import") {
            nameNode = child.childByField("name");
        }
        if (!nameNode || nameNode->text.empty())
            continue;
        addNamedImport(ctx, moduleNode->text, nameNode->text, stmt);
    }
}

void extractEcmaScriptImport(ExtractionContext& ctx, const SyntaxNode& stmt) {
    const auto* source = stmt.childByField("source");
    if (!source || source->text.empty()) {
        ctx.skip(stmt, Error{ErrorCode::InvalidData, "import without source"});
        return;
    }
    const auto module = stripQuotes(source->text);

    const auto* clause = stmt.firstChildOfType("import_clause");
    if (!clause) {
        // Side-effect import: import "./polyfill"
        addModuleImport(ctx, module, stmt);
        return;
    }
    bool wholeModule = false;
    for (const auto& part : clause->children) {
        if (part.type == "identifier" || part.type == "namespace_import") {
            wholeModule = true;
        } else if (part.type == "named_imports") {
            for (const auto& spec : part.childrenOfType("import_specifier")) {
                if (const auto* nameNode = spec->childByField("name"))
                    addNamedImport(ctx, module, nameNode->text, stmt);
            }
        }
    }
    if (wholeModule)
        addModuleImport(ctx, module, stmt);
}

void extractImports(ExtractionContext& ctx, const SyntaxNode& root) {
    for (const auto& child : root.children) {
        if (!ctx.config.import_types.contains(child.type))
            continue;
        if (ctx.config.import_style == ImportStyle::Python) {
            extractPythonImport(ctx, child);
        } else {
            extractEcmaScriptImport(ctx, child);
        }
    }
}

void extractCalls(ExtractionContext& ctx, const SyntaxNode& root) {
    const auto& symbols = ctx.result.symbols;
    auto callerIt = std::find_if(symbols.begin(), symbols.end(), [](const Symbol& s) {
        return s.kind == SymbolKind::Function || s.kind == SymbolKind::Method;
    });
    if (callerIt == symbols.end())
        return;
    const Symbol caller = *callerIt;

    struct CallSite {
        std::string callee;
        bool member;
        SyntaxPoint at;
    };
    std::vector<CallSite> sites;
    root.walk([&](const SyntaxNode& node) {
        if (!ctx.config.call_types.contains(node.type))
            return;
        const auto* fn = node.childByField(ctx.config.call_function_field);
        if (!fn)
            return;
        if (ctx.config.identifier_types.contains(fn->type)) {
            sites.push_back({fn->text, false, node.start});
        } else if (ctx.config.member_types.contains(fn->type)) {
            if (const auto* member = fn->childByField(ctx.config.member_name_field))
                sites.push_back({member->text, true, node.start});
        }
    });

    for (const auto& site : sites) {
        if (site.callee.empty())
            continue;
        const auto position =
            fmt::format("{}:{}", site.at.row + 1, site.at.column + 1);
        nlohmann::json attrs{{"callee", site.callee},
                             {"line", site.at.row + 1},
                             {"column", site.at.column + 1},
                             {"form", site.member ? "attribute" : "identifier"}};

        std::vector<std::string> targets;
        for (const auto& s : ctx.result.symbols) {
            if (s.name != site.callee)
                continue;
            if (s.kind == SymbolKind::Method ||
                (!site.member && s.kind == SymbolKind::Function)) {
                targets.push_back(s.id);
            }
        }

        if (targets.empty()) {
            ctx.addEdge(EdgeKind::Calls, caller, std::nullopt, attrs, site.callee + "@" + position);
            continue;
        }
        for (auto& target : targets) {
            ctx.addEdge(EdgeKind::Calls, caller, std::move(target), attrs, position);
        }
    }
}

} // namespace

void ExtractionResult::calculate_stats() noexcept {
    const auto skipped = stats.skipped_nodes;
    stats = Stats{};
    stats.skipped_nodes = skipped;
    for (const auto& s : symbols) {
        if (s.kind == SymbolKind::Function)
            ++stats.functions;
        else if (s.kind == SymbolKind::Method)
            ++stats.methods;
        else if (s.kind == SymbolKind::Class)
            ++stats.classes;
    }
    for (const auto& e : edges) {
        if (e.kind == EdgeKind::Contains)
            ++stats.contains;
        else if (e.kind == EdgeKind::Imports)
            ++stats.imports;
        else if (e.kind == EdgeKind::Calls) {
            ++stats.calls;
            if (!e.isResolved())
                ++stats.unresolved_calls;
        }
    }
}

std::string ExtractionResult::summary() const {
    return fmt::format("Extraction: {} symbols ({} functions, {} methods, {} classes), {} edges "
                       "({} calls, {} unresolved, {} imports), {} skipped",
                       symbols.size(), stats.functions, stats.methods, stats.classes,
                       edges.size(), stats.calls, stats.unresolved_calls, stats.imports,
                       stats.skipped_nodes);
}

bool SymbolExtractor::supports(Language language) noexcept {
    return getLanguageConfig(language) != nullptr;
}

ExtractionResult SymbolExtractor::extract(const SyntaxNode& root, std::string_view filePath,
                                          Language language, std::string_view repoId) const {
    ExtractionResult result;
    const auto* config = getLanguageConfig(language);
    if (!config) {
        spdlog::debug("[SymbolExtractor] no rules for language '{}' ({})",
                      model::toString(language), filePath);
        return result;
    }

    ExtractionContext ctx{*config, filePath, repoId, language, result};
    extractFunctions(ctx, root);
    extractClasses(ctx, root);
    extractImports(ctx, root);
    extractCalls(ctx, root);

    result.calculate_stats();
    spdlog::debug("[SymbolExtractor] {}: {}", filePath, result.summary());
    return result;
}

Result<ExtractionResult::Stats> SymbolExtractor::extractInto(model::ParseUnit& unit) const {
    if (!unit.tree) {
        return Error{ErrorCode::InvalidArgument, "Parse unit has no syntax tree: " + unit.path};
    }
    auto result = extract(*unit.tree, unit.path, unit.language, unit.repoId);
    unit.symbols = std::move(result.symbols);
    unit.edges = std::move(result.edges);
    return result.stats;
}

} // namespace codegraph::extraction
