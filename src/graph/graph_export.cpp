#include <codegraph/graph/graph_export.h>
#include <codegraph/graph/graph_store.h>

#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace codegraph::graph {

std::string escapeXml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string toGraphML(const std::string& repoId, const std::vector<model::Symbol>& symbols,
                      const std::vector<RelationshipRecord>& relationships) {
    std::ostringstream out;
    out << R"(<?xml version="1.0" encoding="UTF-8"?>)" << '\n'
        << R"(<graphml xmlns="http://graphml.graphdrawing.org/xmlns">)" << '\n'
        << R"(  <key id="d0" for="node" attr.name="name" attr.type="string"/>)" << '\n'
        << R"(  <key id="d1" for="node" attr.name="kind" attr.type="string"/>)" << '\n'
        << R"(  <key id="d2" for="node" attr.name="file_path" attr.type="string"/>)" << '\n'
        << R"(  <key id="d3" for="edge" attr.name="type" attr.type="string"/>)" << '\n'
        << "  <graph id=\"" << escapeXml(repoId) << "\" edgedefault=\"directed\">\n";

    for (const auto& s : symbols) {
        out << "    <node id=\"" << escapeXml(s.id) << "\">\n"
            << "      <data key=\"d0\">" << escapeXml(s.name) << "</data>\n"
            << "      <data key=\"d1\">" << model::toString(s.kind) << "</data>\n"
            << "      <data key=\"d2\">" << escapeXml(s.filePath) << "</data>\n"
            << "    </node>\n";
    }
    for (const auto& r : relationships) {
        out << "    <edge id=\"" << escapeXml(r.edgeId) << "\" source=\"" << escapeXml(r.sourceId)
            << "\" target=\"" << escapeXml(r.targetId) << "\">\n"
            << "      <data key=\"d3\">" << model::toString(r.kind) << "</data>\n"
            << "    </edge>\n";
    }
    out << "  </graph>\n</graphml>\n";
    return out.str();
}

nlohmann::json toInterchangeJson(const std::string& repoId,
                                 const std::vector<model::Symbol>& symbols,
                                 const std::vector<model::Edge>& edges) {
    return nlohmann::json{{"directed", true},
                          {"multigraph", true},
                          {"repo_id", repoId},
                          {"symbols", symbols},
                          {"edges", edges}};
}

Result<ExportFormat> parseExportFormat(std::string_view name) {
    if (name == "graphml")
        return ExportFormat::GraphML;
    if (name == "json")
        return ExportFormat::Json;
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Unknown export format '{}' (expected graphml or json)", name)};
}

Result<void> GraphReader::exportGraph(const std::string& repoId,
                                      const std::filesystem::path& target,
                                      ExportFormat format) const {
    auto doc = exportDocument(repoId, format);
    if (!doc)
        return doc.error();

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::PermissionDenied, "Cannot open export target: " + target.string()};
    }
    out << doc.value();
    out.close();
    if (!out) {
        return Error{ErrorCode::InternalError, "Failed writing export to " + target.string()};
    }
    spdlog::info("Exported graph for repo {} to {}", repoId, target.string());
    return {};
}

} // namespace codegraph::graph
