// NodeValidation.hpp
//
// Pre-execution readiness checks. Each node kind carries a small table of
// requirements; a requirement is met by an incoming edge on a named input
// handle and/or by a local value in the node's data record. The validator
// only reports, it never mutates the graph and never throws.
#pragma once
#include "MediaFlowCore.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace MediaFlow {

enum class RequirementMode {
    ConnectedOrLocal, // edge into 'handle', or a non-empty string under any local key
    LocalNonEmpty,    // non-empty string under any local key
    LocalPresent,     // any non-null value under any local key
};

struct Requirement {
    std::string handle;                 // input handle (ConnectedOrLocal only)
    std::vector<std::string> localKeys; // data-record keys that satisfy it
    std::string key;                    // reported key
    std::string label;                  // user-facing description
    RequirementMode mode;
};

struct MissingRequirement {
    std::string key;
    std::string label;
};

struct NodeReadiness {
    NodeId nodeId;
    std::vector<MissingRequirement> missing;
};

// Requirement table for a node type tag; empty for unknown kinds
const std::vector<Requirement>& requirementsFor(const std::string& nodeType);

// Missing requirements of one node, in table order
std::vector<MissingRequirement> validateRequired(const Node& node, const std::vector<Edge>& edges);

// Every non-skipped node with at least one deficiency, in node-list order
std::vector<NodeReadiness> preflight(const Graph& graph);

// "Prompt, Language"
std::string formatMissingRequired(const std::vector<MissingRequirement>& missing);

// True when the string is empty or only white space, Unicode spaces such
// as U+00A0 and U+3000 included
bool isBlankText(const std::string& s);

// True for a string holding at least one non-whitespace character
bool hasNonEmptyString(const nlohmann::json& record, const std::string& key);

// Raised by the executor when pre-flight validation fails
class MissingRequiredInput : public std::runtime_error {
public:
    explicit MissingRequiredInput(std::vector<NodeReadiness> issues);
    const std::vector<NodeReadiness>& issues() const { return issueList; }

private:
    std::vector<NodeReadiness> issueList;
};

} // namespace MediaFlow
