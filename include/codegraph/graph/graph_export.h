#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <codegraph/model/code_model.h>

namespace codegraph::graph {

/// A materialized relationship between two stored symbols.
struct RelationshipRecord {
    std::string edgeId;
    std::string sourceId;
    std::string targetId;
    model::EdgeKind kind = model::EdgeKind::References;
};

std::string escapeXml(std::string_view text);

/**
 * @brief GraphML document: nodes carry name/type/file_path, edges carry type.
 */
std::string toGraphML(const std::string& repoId, const std::vector<model::Symbol>& symbols,
                      const std::vector<RelationshipRecord>& relationships);

/**
 * @brief JSON interchange document, also accepted by GraphStore::importBulk.
 *
 * {"directed": true, "multigraph": true, "repo_id": ..., "symbols": [...], "edges": [...]}
 */
nlohmann::json toInterchangeJson(const std::string& repoId,
                                 const std::vector<model::Symbol>& symbols,
                                 const std::vector<model::Edge>& edges);

} // namespace codegraph::graph
