// FixtureBackend.hpp
//
// GenerationBackend that replays canned results from a JSON object, keyed
// by node id first and node type second. Used by the CLI for offline runs
// and by tests.
#pragma once
#include "WorkflowExecutor.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace MediaFlow {

class FixtureBackend : public GenerationBackend {
public:
    explicit FixtureBackend(nlohmann::json fixtures) : fixtures(std::move(fixtures)) {}
    static FixtureBackend fromFile(const std::string& path);

    nlohmann::json generate(const Node& node, const GenerationRequest& request) override;

    // Requests seen so far, in call order (node id, request)
    const std::vector<std::pair<NodeId, GenerationRequest>>& calls() const { return callLog; }

private:
    nlohmann::json fixtures;
    std::vector<std::pair<NodeId, GenerationRequest>> callLog;
};

} // namespace MediaFlow
