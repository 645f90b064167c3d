#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <codegraph/core/types.h>

namespace codegraph::model {

enum class Language { Python, TypeScript, JavaScript, Java, Go, Rust, C, Cpp, CSharp };

enum class SymbolKind {
    Function,
    Method,
    Class,
    Interface,
    Variable,
    Constant,
    Module,
    Package,
    Parameter,
    Type,
    Enum,
    Struct,
    Trait
};

enum class EdgeKind {
    Contains,
    Calls,
    Imports,
    Inherits,
    Implements,
    References,
    Defines,
    Uses,
    DependsOn,
    Instantiates,
    Throws,
    Catches,
    Overrides,
    Extends
};

std::string_view toString(Language language) noexcept;
std::string_view toString(SymbolKind kind) noexcept;
std::string_view toString(EdgeKind kind) noexcept;

Result<Language> parseLanguage(std::string_view name);
Result<SymbolKind> parseSymbolKind(std::string_view name);
Result<EdgeKind> parseEdgeKind(std::string_view name);

/**
 * @brief Source location. Lines and columns are 1-based; the end column is
 * exclusive.
 */
struct SourceSpan {
    std::uint32_t startLine = 1;
    std::uint32_t startColumn = 1;
    std::uint32_t endLine = 1;
    std::uint32_t endColumn = 1;

    bool contains(const SourceSpan& inner) const noexcept;
    bool operator==(const SourceSpan&) const = default;
};

/**
 * @brief A named code entity.
 *
 * parentId is a lookup reference to the enclosing symbol (a method's class),
 * not an ownership link.
 */
struct Symbol {
    std::string id;
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string filePath;
    Language language = Language::Python;
    SourceSpan span;
    std::optional<std::string> docstring;
    std::optional<std::string> signature;
    std::optional<std::string> parentId;
    nlohmann::json attributes = nlohmann::json::object();
    std::string repoId;
};

/**
 * @brief Directed relationship. An absent targetId means the target is an
 * external or not yet resolved reference described by attributes.
 */
struct Edge {
    std::string id;
    std::string sourceId;
    std::optional<std::string> targetId;
    EdgeKind kind = EdgeKind::References;
    nlohmann::json attributes = nlohmann::json::object();
    std::string repoId;

    [[nodiscard]] bool isResolved() const noexcept { return targetId.has_value(); }
};

void to_json(nlohmann::json& j, const SourceSpan& span);
void from_json(const nlohmann::json& j, SourceSpan& span);
void to_json(nlohmann::json& j, const Symbol& symbol);
void from_json(const nlohmann::json& j, Symbol& symbol);
void to_json(nlohmann::json& j, const Edge& edge);
void from_json(const nlohmann::json& j, Edge& edge);

} // namespace codegraph::model
