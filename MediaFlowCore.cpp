// MediaFlowCore.cpp
//
// Implements the graph accessors, the deterministic scheduler, the optional
// cycle diagnostic, and per-node input aggregation.
#include "MediaFlowCore.hpp"
#include "Log.hpp"
#include "PayloadNormalizer.hpp"
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace MediaFlow {

const char* const kDefaultInputPort = "default";

bool Node::isSkipped() const {
    if (!data.is_object()) return false;
    auto it = data.find("skip");
    return it != data.end() && isTruthy(*it);
}

Node* Graph::findNode(const NodeId& id) {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&](const Node& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

const Node* Graph::findNode(const NodeId& id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&](const Node& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

namespace {

// Successor lists by node index, built in edge order; dangling edges dropped
std::vector<std::vector<size_t>> buildAdjacency(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    std::unordered_map<NodeId, size_t> nodeIndex;
    nodeIndex.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) nodeIndex.emplace(nodes[i].id, i);

    std::vector<std::vector<size_t>> successors(nodes.size());
    for (const auto& e : edges) {
        auto from = nodeIndex.find(e.source);
        auto to = nodeIndex.find(e.target);
        if (from == nodeIndex.end() || to == nodeIndex.end()) {
            log::debug("scheduler: ignoring dangling edge '{}' ({} -> {})", e.id, e.source, e.target);
            continue;
        }
        successors[from->second].push_back(to->second);
    }
    return successors;
}

const Node* findById(const std::vector<Node>& nodes, const NodeId& id) {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&](const Node& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

void appendValue(ResolvedInput& slot, nlohmann::json value) {
    slot.values.push_back(std::move(value));
}

} // namespace

std::vector<NodeId> topologicalOrder(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    const auto successors = buildAdjacency(nodes, edges);
    std::vector<int> inDegree(nodes.size(), 0);
    for (const auto& succ : successors) {
        for (size_t next : succ) ++inDegree[next];
    }

    // Seed in declared node order; never from an unordered container
    std::deque<size_t> queue;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (inDegree[i] == 0) queue.push_back(i);
    }

    std::vector<NodeId> order;
    order.reserve(nodes.size());
    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();
        order.push_back(nodes[current].id);
        for (size_t next : successors[current]) {
            if (--inDegree[next] == 0) queue.push_back(next);
        }
    }

    if (order.size() != nodes.size()) {
        throw CycleDetected();
    }
    return order;
}

std::vector<NodeId> findCycle(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    const auto successors = buildAdjacency(nodes, edges);
    enum class Mark { Unvisited, OnStack, Done };
    std::vector<Mark> mark(nodes.size(), Mark::Unvisited);

    // Iterative DFS; 'path' mirrors the recursion stack
    for (size_t root = 0; root < nodes.size(); ++root) {
        if (mark[root] != Mark::Unvisited) continue;
        std::vector<std::pair<size_t, size_t>> stack; // (node, next successor slot)
        std::vector<size_t> path;
        stack.emplace_back(root, 0);
        path.push_back(root);
        mark[root] = Mark::OnStack;
        while (!stack.empty()) {
            auto& [current, slot] = stack.back();
            if (slot < successors[current].size()) {
                size_t next = successors[current][slot++];
                if (mark[next] == Mark::OnStack) {
                    auto start = std::find(path.begin(), path.end(), next);
                    std::vector<NodeId> cycle;
                    for (auto it = start; it != path.end(); ++it) cycle.push_back(nodes[*it].id);
                    return cycle;
                }
                if (mark[next] == Mark::Unvisited) {
                    mark[next] = Mark::OnStack;
                    stack.emplace_back(next, 0);
                    path.push_back(next);
                }
            } else {
                mark[current] = Mark::Done;
                stack.pop_back();
                path.pop_back();
            }
        }
    }
    return {};
}

nlohmann::json ResolvedInput::toJson() const {
    if (values.size() == 1) return values.front();
    return nlohmann::json(values);
}

ResolvedInputs resolveInputs(const NodeId& nodeId, const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    ResolvedInputs inputs;
    for (const auto& edge : edges) {
        if (edge.target != nodeId) continue;
        const Node* source = findById(nodes, edge.source);
        if (!source || edge.sourceHandle.empty()) continue;
        auto it = source->data.find(edge.sourceHandle);
        if (it == source->data.end() || it->is_null()) {
            log::debug("resolveInputs: {}:{} has no published value", edge.source, edge.sourceHandle);
            continue;
        }
        const PortId port = edge.targetHandle.empty() ? PortId(kDefaultInputPort) : edge.targetHandle;
        appendValue(inputs[port], *it);
        log::debug("resolveInputs: {}:{} -> {}:{} ({} value(s))", edge.source, edge.sourceHandle, nodeId, port,
                   inputs[port].values.size());
    }
    return inputs;
}

ResolvedInputs resolveTypedInputs(const Node& node, const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    ResolvedInputs inputs;
    for (const auto& edge : edges) {
        if (edge.target != node.id) continue;
        const Node* source = findById(nodes, edge.source);
        if (!source) continue;
        const PortId port = edge.targetHandle.empty() ? PortId(kDefaultInputPort) : edge.targetHandle;
        const SemanticType targetType =
            getHandleType(node.type, port, HandleDirection::Input).value_or(SemanticType::Any);

        nlohmann::json value;
        if (!edge.sourceHandle.empty()) {
            auto it = source->data.find(edge.sourceHandle);
            if (it != source->data.end()) value = *it;
        }
        if (value.is_null()) {
            value = extractTyped(source->data, targetType);
        }

        nlohmann::json normalized = normalize(value, targetType);
        if (normalized.is_null() || (normalized.is_string() && normalized.get_ref<const std::string&>().empty())) {
            log::debug("resolveTypedInputs: {}:{} yields no {} value", edge.source, edge.sourceHandle,
                       toString(targetType));
            continue;
        }
        auto& slot = inputs[port];
        if (targetType == SemanticType::Image && normalized.is_array()) {
            for (auto& v : normalized) appendValue(slot, std::move(v));
        } else {
            appendValue(slot, std::move(normalized));
        }
    }
    return inputs;
}

nlohmann::json toJson(const ResolvedInputs& inputs) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [port, input] : inputs) out[port] = input.toJson();
    return out;
}

} // namespace MediaFlow
