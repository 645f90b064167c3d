#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <codegraph/core/types.h>
#include <codegraph/model/code_model.h>

struct TSLanguage;

namespace codegraph::extraction {

/**
 * @brief Finds and dlopen()s tree-sitter grammar libraries.
 *
 * Search order:
 * - CODEGRAPH_TS_<LANG>_LIB (a library file or a directory)
 * - <data dir>/grammars
 * - $XDG_DATA_HOME/codegraph/grammars, ~/.local/share/codegraph/grammars
 * - /usr/local/share/codegraph/grammars, /usr/share/codegraph/grammars
 * - the system library directories
 *
 * Loaded libraries stay open until the loader is destroyed.
 */
class GrammarLoader {
public:
    explicit GrammarLoader(std::filesystem::path dataDir = {});
    ~GrammarLoader();

    GrammarLoader(const GrammarLoader&) = delete;
    GrammarLoader& operator=(const GrammarLoader&) = delete;

    Result<const TSLanguage*> loadGrammar(model::Language language);

    std::vector<std::filesystem::path> getGrammarSearchPaths() const;

    bool grammarExists(model::Language language) const;

private:
    struct GrammarSpec {
        model::Language language;
        std::string_view env_var;
        std::string_view symbol;
        std::string_view default_so;
    };

    static constexpr GrammarSpec kSpecs[] = {
        {model::Language::Python, "CODEGRAPH_TS_PYTHON_LIB", "tree_sitter_python",
         "libtree-sitter-python.so"},
        {model::Language::TypeScript, "CODEGRAPH_TS_TYPESCRIPT_LIB", "tree_sitter_typescript",
         "libtree-sitter-typescript.so"},
        {model::Language::JavaScript, "CODEGRAPH_TS_JAVASCRIPT_LIB", "tree_sitter_javascript",
         "libtree-sitter-javascript.so"},
    };

    static const GrammarSpec* findSpec(model::Language language) noexcept;
    std::vector<std::string> getLibraryCandidates(const GrammarSpec& spec) const;

    std::filesystem::path dataDir_;
    mutable std::mutex mutex_;
    std::unordered_map<model::Language, std::pair<void*, const TSLanguage*>> loaded_;
};

} // namespace codegraph::extraction
