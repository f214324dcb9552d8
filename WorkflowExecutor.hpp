// WorkflowExecutor.hpp
//
// Sequential driver on top of the core: computes the order, pre-flights
// every node, then for each node resolves typed inputs, produces its output
// (locally for input/preview kinds, through a GenerationBackend for
// generator and script kinds), normalizes it and publishes it into the
// node's data record for downstream consumers. Nodes run strictly one at a
// time in scheduler order.
#pragma once
#include "MediaFlowCore.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace MediaFlow {

// Per-node execution failure (missing prompt at run time, no back-end, ...)
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// What a generation back-end receives for one node
struct GenerationRequest {
    NodeKind kind = NodeKind::TextGen;
    std::string prompt;
    nlohmann::json imageInput;  // null, a reference string, or a list of them
    nlohmann::json inputs;      // typed inputs as {port: value | [values]}
};

// Produces a node's raw output (model API call, script run, fixture...).
// The result may have any shape the normalizer understands; throw to fail
// the node.
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;
    virtual nlohmann::json generate(const Node& node, const GenerationRequest& request) = 0;
};

struct ExecutionResult {
    NodeId nodeId;
    bool success = false;
    bool skipped = false;
    nlohmann::json output;                              // raw output as published under "output"
    nlohmann::json outputs = nlohmann::json::object();  // normalized per-handle map
    std::string error;
};

struct ExecutionOptions {
    std::function<bool()> shouldStop;                               // checked before each node
    std::function<void(size_t current, size_t total)> onProgress;
    std::function<void(const NodeId&)> onNodeStart;
    std::function<void(const NodeId&, bool success)> onNodeComplete;
    // Validate every node before the first one runs and throw
    // MissingRequiredInput on deficiencies. When off, each node is validated
    // as it comes up and fails on its own.
    bool preflight = true;
};

// Output handle id -> normalized value, plus the semantic alias
// (text/image/video/model) that downstream extraction looks for.
nlohmann::json buildOutputMap(const std::string& nodeType, const nlohmann::json& output);

class WorkflowExecutor {
public:
    // 'backend' may be null when the graph has no generator or script nodes
    explicit WorkflowExecutor(GenerationBackend* backend = nullptr) : backend(backend) {}

    // Run the whole graph. Throws CycleDetected or MissingRequiredInput
    // before any node executes; per-node failures are reported in the results.
    std::vector<ExecutionResult> run(Graph& graph, const ExecutionOptions& options = {});

    // Run a single node against the current data records
    ExecutionResult runNode(Graph& graph, const NodeId& nodeId, const ExecutionOptions& options = {});

    struct RunStats {
        unsigned long long nodesExecuted = 0;
        unsigned long long nodesSkipped = 0;
        unsigned long long nodesFailed = 0;
        unsigned long long runTimeNsAccum = 0;
    };
    RunStats getAndResetRunStats() {
        RunStats out = stats;
        stats = RunStats{};
        return out;
    }

private:
    GenerationBackend* backend;
    RunStats stats;

    ExecutionResult executeOne(Graph& graph, Node& node, bool validate);
    nlohmann::json resolveNodeOutput(const Node& node, const ResolvedInputs& inputs);
    nlohmann::json generate(const Node& node, NodeKind kind, const ResolvedInputs& inputs);
};

} // namespace MediaFlow
