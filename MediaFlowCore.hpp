// MediaFlow core types and dataflow primitives
//
// This header defines the in-memory graph (nodes with open data records,
// port-to-port edges) and the pure functions a driver needs to run it:
// a deterministic topological order, per-node input aggregation, and the
// exceptions the core raises. Nothing here performs generation work; it
// only decides order and what each node gets to see.
#pragma once
#include "HandleSchema.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace MediaFlow {

using NodeId = std::string;
using PortId = std::string;

// Represents a node (generator, input, preview, script)
struct Node {
    NodeId id;
    std::string type; // node kind tag, e.g. "imageGen"; unknown tags are tolerated
    // Open record: user configuration (prompt, model, ...) and published
    // outputs, keyed by output handle id ("text", "image", ...) or "output".
    nlohmann::json data = nlohmann::json::object();
    nlohmann::json position; // editor placement, carried through untouched

    // data.skip is truthy: the driver replays the stored output instead of running
    bool isSkipped() const;
};

// Represents a directed connection between an output port and an input port.
// An empty handle string means the edge carries no handle.
struct Edge {
    std::string id;
    NodeId source;
    PortId sourceHandle;
    NodeId target;
    PortId targetHandle;
};

struct Graph {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    nlohmann::json metadata = nlohmann::json::object();

    Node* findNode(const NodeId& id);
    const Node* findNode(const NodeId& id) const;
};

// Raised when no execution order exists. Carries no node detail; see
// findCycle for an explicit diagnostic pass.
class CycleDetected : public std::runtime_error {
public:
    CycleDetected() : std::runtime_error("Cycle detected in flow graph") {}
};

// Kahn's algorithm. The ready queue is seeded in node-list order and grows
// in edge order, so equal inputs always give the same order. Edges whose
// endpoints are not in 'nodes' are ignored. Throws CycleDetected.
std::vector<NodeId> topologicalOrder(const std::vector<Node>& nodes, const std::vector<Edge>& edges);

// Diagnostic only: node ids along one cycle in path order, empty if acyclic.
std::vector<NodeId> findCycle(const std::vector<Node>& nodes, const std::vector<Edge>& edges);

// Values delivered to one input port, one per contributing edge in edge
// order. Never empty once it is part of a ResolvedInputs map.
struct ResolvedInput {
    std::vector<nlohmann::json> values;

    bool isMulti() const { return values.size() > 1; }
    // The value of a single-edge input; the first value otherwise
    const nlohmann::json& scalar() const { return values.front(); }
    // Scalar when one edge contributed, array otherwise
    nlohmann::json toJson() const;
};

using ResolvedInputs = std::map<PortId, ResolvedInput>;

// Input port used when an edge carries no target handle
extern const char* const kDefaultInputPort;

// Collects, per input port of 'nodeId', the values published by upstream
// nodes under each edge's sourceHandle. Missing sources or missing (null)
// values contribute nothing.
ResolvedInputs resolveInputs(const NodeId& nodeId, const std::vector<Node>& nodes, const std::vector<Edge>& edges);

// Driver-side variant: falls back to extractTyped() on the source record
// when the keyed value is absent, normalizes each value to the target port's
// semantic type, drops empty results, and flattens image lists.
ResolvedInputs resolveTypedInputs(const Node& node, const std::vector<Node>& nodes, const std::vector<Edge>& edges);

// Flattens a ResolvedInputs map into a JSON object ({port: scalar|array})
nlohmann::json toJson(const ResolvedInputs& inputs);

} // namespace MediaFlow
