#include <codegraph/extraction/grammar_loader.h>

#include <dlfcn.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codegraph::extraction {

GrammarLoader::GrammarLoader(std::filesystem::path dataDir) : dataDir_(std::move(dataDir)) {}

GrammarLoader::~GrammarLoader() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [language, handle] : loaded_) {
        if (handle.first)
            dlclose(handle.first);
    }
    loaded_.clear();
}

const GrammarLoader::GrammarSpec* GrammarLoader::findSpec(model::Language language) noexcept {
    for (const auto& spec : kSpecs) {
        if (spec.language == language)
            return &spec;
    }
    return nullptr;
}

std::vector<std::filesystem::path> GrammarLoader::getGrammarSearchPaths() const {
    std::vector<std::filesystem::path> paths;

    if (!dataDir_.empty()) {
        paths.push_back(dataDir_ / "grammars");
    }
    if (const char* xdg_data_home = std::getenv("XDG_DATA_HOME"); xdg_data_home && *xdg_data_home) {
        paths.emplace_back(std::filesystem::path(xdg_data_home) / "codegraph" / "grammars");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        paths.emplace_back(std::filesystem::path(home) / ".local" / "share" / "codegraph" /
                           "grammars");
    }
    paths.emplace_back("/usr/local/share/codegraph/grammars");
    paths.emplace_back("/usr/share/codegraph/grammars");
    paths.emplace_back("/usr/local/lib");
    paths.emplace_back("/usr/lib");
    paths.emplace_back("/usr/lib/x86_64-linux-gnu");
    paths.emplace_back("/usr/lib/aarch64-linux-gnu");
    return paths;
}

std::vector<std::string> GrammarLoader::getLibraryCandidates(const GrammarSpec& spec) const {
    std::vector<std::string> candidates;

    if (const char* env_path = std::getenv(spec.env_var.data()); env_path && *env_path) {
        std::filesystem::path p(env_path);
        std::error_code ec;
        if (std::filesystem::is_directory(p, ec)) {
            candidates.push_back((p / spec.default_so).string());
        } else {
            candidates.push_back(p.string());
        }
    }

    // libtree-sitter-python.so, tree-sitter-python.so, libtree_sitter_python.so
    std::string core_name(spec.default_so);
    core_name = core_name.substr(3, core_name.size() - 6);
    std::string underscore_name = core_name;
    std::replace(underscore_name.begin(), underscore_name.end(), '-', '_');
    const std::vector<std::string> lib_names{std::string(spec.default_so), core_name + ".so",
                                             "lib" + underscore_name + ".so"};

    for (const auto& base_path : getGrammarSearchPaths()) {
        std::error_code ec;
        if (!std::filesystem::exists(base_path, ec))
            continue;
        for (const auto& lib_name : lib_names) {
            candidates.push_back((base_path / lib_name).string());
        }
    }
    return candidates;
}

Result<const TSLanguage*> GrammarLoader::loadGrammar(model::Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = loaded_.find(language); it != loaded_.end()) {
        return it->second.second;
    }

    const auto* spec = findSpec(language);
    if (!spec) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("No grammar known for language '{}'", model::toString(language))};
    }

    std::string tried;
    for (const auto& candidate : getLibraryCandidates(*spec)) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec))
            continue;
        if (!tried.empty())
            tried += ", ";
        tried += candidate;

        void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
        if (!handle) {
            spdlog::debug("[GrammarLoader] dlopen failed for {}: {}", candidate, dlerror());
            continue;
        }
        auto* factory_fn =
            reinterpret_cast<const TSLanguage* (*)()>(dlsym(handle, spec->symbol.data()));
        if (factory_fn) {
            if (const TSLanguage* lang = factory_fn()) {
                spdlog::info("[GrammarLoader] loaded {} grammar from {}", model::toString(language),
                             candidate);
                loaded_.emplace(language, std::make_pair(handle, lang));
                return lang;
            }
        }
        dlclose(handle);
    }

    return Error{ErrorCode::NotFound,
                 fmt::format("Failed to load grammar for '{}'. Tried: {}",
                             model::toString(language), tried.empty() ? "(none found)" : tried)};
}

bool GrammarLoader::grammarExists(model::Language language) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loaded_.contains(language))
            return true;
    }
    const auto* spec = findSpec(language);
    if (!spec)
        return false;
    for (const auto& candidate : getLibraryCandidates(*spec)) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec))
            return true;
    }
    return false;
}

} // namespace codegraph::extraction
