#include <codegraph/model/code_model.h>

#include <fmt/format.h>

#include <array>
#include <utility>

namespace codegraph::model {

namespace {

constexpr std::array<std::pair<Language, std::string_view>, 9> kLanguages{{
    {Language::Python, "python"},
    {Language::TypeScript, "typescript"},
    {Language::JavaScript, "javascript"},
    {Language::Java, "java"},
    {Language::Go, "go"},
    {Language::Rust, "rust"},
    {Language::C, "c"},
    {Language::Cpp, "cpp"},
    {Language::CSharp, "csharp"},
}};

constexpr std::array<std::pair<SymbolKind, std::string_view>, 13> kSymbolKinds{{
    {SymbolKind::Function, "function"},
    {SymbolKind::Method, "method"},
    {SymbolKind::Class, "class"},
    {SymbolKind::Interface, "interface"},
    {SymbolKind::Variable, "variable"},
    {SymbolKind::Constant, "constant"},
    {SymbolKind::Module, "module"},
    {SymbolKind::Package, "package"},
    {SymbolKind::Parameter, "parameter"},
    {SymbolKind::Type, "type"},
    {SymbolKind::Enum, "enum"},
    {SymbolKind::Struct, "struct"},
    {SymbolKind::Trait, "trait"},
}};

constexpr std::array<std::pair<EdgeKind, std::string_view>, 14> kEdgeKinds{{
    {EdgeKind::Contains, "contains"},
    {EdgeKind::Calls, "calls"},
    {EdgeKind::Imports, "imports"},
    {EdgeKind::Inherits, "inherits"},
    {EdgeKind::Implements, "implements"},
    {EdgeKind::References, "references"},
    {EdgeKind::Defines, "defines"},
    {EdgeKind::Uses, "uses"},
    {EdgeKind::DependsOn, "depends_on"},
    {EdgeKind::Instantiates, "instantiates"},
    {EdgeKind::Throws, "throws"},
    {EdgeKind::Catches, "catches"},
    {EdgeKind::Overrides, "overrides"},
    {EdgeKind::Extends, "extends"},
}};

template <typename E, std::size_t N>
std::string_view lookupName(const std::array<std::pair<E, std::string_view>, N>& table, E value) {
    for (const auto& [e, name] : table) {
        if (e == value)
            return name;
    }
    return "unknown";
}

template <typename E, std::size_t N>
Result<E> lookupValue(const std::array<std::pair<E, std::string_view>, N>& table,
                      std::string_view name, const char* what) {
    for (const auto& [e, n] : table) {
        if (n == name)
            return e;
    }
    return Error{ErrorCode::InvalidArgument, fmt::format("Unknown {}: '{}'", what, name)};
}

template <typename T> std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

template <typename E> E parseOrThrow(Result<E> r) {
    if (!r)
        throw std::invalid_argument(r.error().message);
    return r.value();
}

} // namespace

std::string_view toString(Language language) noexcept {
    return lookupName(kLanguages, language);
}

std::string_view toString(SymbolKind kind) noexcept {
    return lookupName(kSymbolKinds, kind);
}

std::string_view toString(EdgeKind kind) noexcept {
    return lookupName(kEdgeKinds, kind);
}

Result<Language> parseLanguage(std::string_view name) {
    return lookupValue(kLanguages, name, "language");
}

Result<SymbolKind> parseSymbolKind(std::string_view name) {
    return lookupValue(kSymbolKinds, name, "symbol kind");
}

Result<EdgeKind> parseEdgeKind(std::string_view name) {
    return lookupValue(kEdgeKinds, name, "edge kind");
}

bool SourceSpan::contains(const SourceSpan& inner) const noexcept {
    auto before = [](std::uint32_t l1, std::uint32_t c1, std::uint32_t l2, std::uint32_t c2) {
        return l1 < l2 || (l1 == l2 && c1 <= c2);
    };
    return before(startLine, startColumn, inner.startLine, inner.startColumn) &&
           before(inner.endLine, inner.endColumn, endLine, endColumn);
}

void to_json(nlohmann::json& j, const SourceSpan& span) {
    j = nlohmann::json{{"start_line", span.startLine},
                       {"start_column", span.startColumn},
                       {"end_line", span.endLine},
                       {"end_column", span.endColumn}};
}

void from_json(const nlohmann::json& j, SourceSpan& span) {
    span.startLine = j.value("start_line", 1u);
    span.startColumn = j.value("start_column", 1u);
    span.endLine = j.value("end_line", span.startLine);
    span.endColumn = j.value("end_column", 1u);
}

void to_json(nlohmann::json& j, const Symbol& symbol) {
    j = nlohmann::json{{"id", symbol.id},
                       {"name", symbol.name},
                       {"kind", toString(symbol.kind)},
                       {"file_path", symbol.filePath},
                       {"language", toString(symbol.language)},
                       {"span", symbol.span},
                       {"docstring", nullptr},
                       {"signature", nullptr},
                       {"parent_id", nullptr},
                       {"attributes", symbol.attributes},
                       {"repo_id", symbol.repoId}};
    if (symbol.docstring)
        j["docstring"] = *symbol.docstring;
    if (symbol.signature)
        j["signature"] = *symbol.signature;
    if (symbol.parentId)
        j["parent_id"] = *symbol.parentId;
}

// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
void from_json(const nlohmann::json& j, Symbol& symbol) {
    symbol.id = j.at("id").get<std::string>();
    symbol.name = j.at("name").get<std::string>();
    symbol.kind = parseOrThrow(parseSymbolKind(j.at("kind").get<std::string>()));
    symbol.filePath = j.value("file_path", std::string{});
    symbol.language = parseOrThrow(parseLanguage(j.value("language", std::string{"python"})));
    if (auto it = j.find("span"); it != j.end() && it->is_object()) {
        symbol.span = it->get<SourceSpan>();
    }
    symbol.docstring = optionalField<std::string>(j, "docstring");
    symbol.signature = optionalField<std::string>(j, "signature");
    symbol.parentId = optionalField<std::string>(j, "parent_id");
    symbol.attributes = j.value("attributes", nlohmann::json::object());
    symbol.repoId = j.value("repo_id", std::string{});
}

void to_json(nlohmann::json& j, const Edge& edge) {
    j = nlohmann::json{{"id", edge.id},
                       {"source_id", edge.sourceId},
                       {"target_id", nullptr},
                       {"kind", toString(edge.kind)},
                       {"attributes", edge.attributes},
                       {"repo_id", edge.repoId}};
    if (edge.targetId)
        j["target_id"] = *edge.targetId;
}

void from_json(const nlohmann::json& j, Edge& edge) {
    edge.id = j.at("id").get<std::string>();
    edge.sourceId = j.at("source_id").get<std::string>();
    edge.targetId = optionalField<std::string>(j, "target_id");
    edge.kind = parseOrThrow(parseEdgeKind(j.at("kind").get<std::string>()));
    edge.attributes = j.value("attributes", nlohmann::json::object());
    edge.repoId = j.value("repo_id", std::string{});
}

} // namespace codegraph::model
