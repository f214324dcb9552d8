// WorkflowIO.hpp
//
// Workflow documents on disk and on the wire:
//   { "nodes": [{id, type, label, inputs, outputs, params, position, data}],
//     "edges": [{id, source, target, sourceHandle, targetHandle}],
//     "metadata": {version, created, modified} }
#pragma once
#include "MediaFlowCore.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace MediaFlow {

class WorkflowFormatError : public std::runtime_error {
public:
    explicit WorkflowFormatError(const std::string& what)
        : std::runtime_error("Invalid workflow file format: " + what) {}
};

// Builds a Graph from a workflow document; a node's label is merged into its
// data record (record fields win). Throws WorkflowFormatError.
Graph importWorkflow(const nlohmann::json& doc);

// Serializes a Graph; metadata.created is kept when present, modified is now
nlohmann::json exportWorkflow(const Graph& graph);

Graph loadWorkflowFile(const std::string& path);
void saveWorkflowFile(const std::string& path, const Graph& graph);

} // namespace MediaFlow
