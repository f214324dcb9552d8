// WorkflowIO.cpp
//
// JSON import/export of workflows. Import is strict about structure (ids,
// arrays) and lenient about content: unknown node types, dangling edges and
// missing handles are kept as-is and dealt with at lookup time.
#include "WorkflowIO.hpp"
#include "Log.hpp"
#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fstream>

namespace MediaFlow {

using nlohmann::json;

namespace {

const char* const kWorkflowVersion = "1.0.0";

std::string requireString(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw WorkflowFormatError(fmt::format("{} is missing string field '{}'", where, key));
    }
    return it->get<std::string>();
}

// Handles may be absent or null in exported documents; both mean "no handle"
std::string optionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string isoTimestampNow() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

} // namespace

Graph importWorkflow(const json& doc) {
    if (!doc.is_object()) throw WorkflowFormatError("document is not an object");
    auto nodesIt = doc.find("nodes");
    if (nodesIt == doc.end() || !nodesIt->is_array()) throw WorkflowFormatError("'nodes' must be an array");

    Graph graph;
    for (const auto& nodeJson : *nodesIt) {
        if (!nodeJson.is_object()) throw WorkflowFormatError("node entry is not an object");
        Node node;
        node.id = requireString(nodeJson, "id", "node");
        node.type = optionalString(nodeJson, "type");
        if (node.type.empty()) node.type = "default";
        node.data = json::object();
        auto label = nodeJson.find("label");
        if (label != nodeJson.end() && !label->is_null()) node.data["label"] = *label;
        auto data = nodeJson.find("data");
        if (data != nodeJson.end() && data->is_object()) {
            for (const auto& item : data->items()) node.data[item.key()] = item.value();
        }
        auto position = nodeJson.find("position");
        if (position != nodeJson.end()) node.position = *position;
        if (graph.findNode(node.id)) {
            throw WorkflowFormatError(fmt::format("duplicate node id '{}'", node.id));
        }
        graph.nodes.push_back(std::move(node));
    }

    auto edgesIt = doc.find("edges");
    if (edgesIt != doc.end() && !edgesIt->is_null()) {
        if (!edgesIt->is_array()) throw WorkflowFormatError("'edges' must be an array");
        for (const auto& edgeJson : *edgesIt) {
            if (!edgeJson.is_object()) throw WorkflowFormatError("edge entry is not an object");
            Edge edge;
            edge.id = optionalString(edgeJson, "id");
            edge.source = requireString(edgeJson, "source", "edge");
            edge.target = requireString(edgeJson, "target", "edge");
            edge.sourceHandle = optionalString(edgeJson, "sourceHandle");
            edge.targetHandle = optionalString(edgeJson, "targetHandle");
            if (!graph.findNode(edge.source) || !graph.findNode(edge.target)) {
                log::warn("edge '{}' references a missing node ({} -> {})", edge.id, edge.source, edge.target);
            }
            graph.edges.push_back(std::move(edge));
        }
    }

    auto meta = doc.find("metadata");
    if (meta != doc.end() && meta->is_object()) graph.metadata = *meta;
    log::debug("imported workflow: {} nodes, {} edges", graph.nodes.size(), graph.edges.size());
    return graph;
}

json exportWorkflow(const Graph& graph) {
    json nodes = json::array();
    for (const auto& n : graph.nodes) {
        auto label = n.data.find("label");
        nodes.push_back({
            {"id", n.id},
            {"type", n.type.empty() ? std::string("default") : n.type},
            {"label", label != n.data.end() && label->is_string() ? label->get<std::string>() : std::string()},
            {"inputs", json::array()},
            {"outputs", json::array()},
            {"params", json::array()},
            {"position", n.position.is_null() ? json{{"x", 0}, {"y", 0}} : n.position},
            {"data", n.data},
        });
    }
    json edges = json::array();
    for (const auto& e : graph.edges) {
        edges.push_back({
            {"id", e.id},
            {"source", e.source},
            {"target", e.target},
            {"sourceHandle", e.sourceHandle},
            {"targetHandle", e.targetHandle},
        });
    }
    const std::string now = isoTimestampNow();
    json metadata = {{"version", kWorkflowVersion}, {"created", now}, {"modified", now}};
    auto created = graph.metadata.find("created");
    if (created != graph.metadata.end() && created->is_string()) metadata["created"] = *created;
    return {{"nodes", std::move(nodes)}, {"edges", std::move(edges)}, {"metadata", std::move(metadata)}};
}

Graph loadWorkflowFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Could not find workflow file: " + path);
    json doc;
    try {
        f >> doc;
    } catch (const json::parse_error& e) {
        throw WorkflowFormatError(e.what());
    }
    return importWorkflow(doc);
}

void saveWorkflowFile(const std::string& path, const Graph& graph) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Could not write workflow file: " + path);
    out << exportWorkflow(graph).dump(2, ' ', false, json::error_handler_t::replace) << '\n';
}

} // namespace MediaFlow
