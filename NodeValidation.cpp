// NodeValidation.cpp
//
// Requirement tables per node kind and their uniform evaluation. Adding a
// node kind means adding a table row, not new control flow.
#include "NodeValidation.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace MediaFlow {

namespace {

Requirement connectedOrLocal(std::string handle, std::vector<std::string> keys, std::string label) {
    std::string key = keys.empty() ? handle : keys.front();
    return {std::move(handle), std::move(keys), std::move(key), std::move(label), RequirementMode::ConnectedOrLocal};
}

Requirement localNonEmpty(std::vector<std::string> keys, std::string key, std::string label) {
    return {"", std::move(keys), std::move(key), std::move(label), RequirementMode::LocalNonEmpty};
}

Requirement localPresent(std::string key, std::string label) {
    return {"", {key}, key, std::move(label), RequirementMode::LocalPresent};
}

const std::unordered_map<std::string, std::vector<Requirement>>& requirementTable() {
    static const std::unordered_map<std::string, std::vector<Requirement>> table = {
        {"textGen", {connectedOrLocal("text", {"prompt"}, "Prompt")}},
        {"imageGen", {connectedOrLocal("text", {"prompt"}, "Prompt")}},
        {"videoGen", {connectedOrLocal("text", {"prompt"}, "Prompt")}},
        {"3dGen", {connectedOrLocal("text", {"prompt"}, "Prompt")}},
        {"textInput", {localNonEmpty({"text", "output"}, "text", "Text")}},
        {"imageInput", {localPresent("image", "Image")}},
        {"videoInput", {localPresent("video", "Video")}},
        {"3dInput", {localNonEmpty({"url", "model", "output"}, "url", "3D model download URL")}},
        {"textPreview", {connectedOrLocal("text", {"text", "output"}, "Upstream text input")}},
        {"imagePreview", {connectedOrLocal("image", {"image", "output", "url", "src"}, "Upstream image input")}},
        {"videoPreview", {connectedOrLocal("video", {"video", "output", "url", "src"}, "Upstream video input")}},
        {"3dPreview", {connectedOrLocal("model", {"model", "3d", "output", "url", "src"}, "Upstream 3D input")}},
        {"scriptRunner", {localNonEmpty({"code"}, "code", "Code"), localNonEmpty({"language"}, "language", "Language")}},
    };
    return table;
}

bool hasAnyValue(const nlohmann::json& record, const std::string& key) {
    if (!record.is_object()) return false;
    auto it = record.find(key);
    return it != record.end() && !it->is_null();
}

bool isHandleConnected(const NodeId& nodeId, const std::string& handle, const std::vector<Edge>& edges) {
    return std::any_of(edges.begin(), edges.end(),
                       [&](const Edge& e) { return e.target == nodeId && e.targetHandle == handle; });
}

bool isSatisfied(const Requirement& req, const Node& node, const std::vector<Edge>& edges) {
    auto anyKey = [&](auto&& pred) {
        return std::any_of(req.localKeys.begin(), req.localKeys.end(),
                           [&](const std::string& k) { return pred(node.data, k); });
    };
    switch (req.mode) {
        case RequirementMode::ConnectedOrLocal:
            if (isHandleConnected(node.id, req.handle, edges)) return true;
            return anyKey(hasNonEmptyString);
        case RequirementMode::LocalNonEmpty:
            return anyKey(hasNonEmptyString);
        case RequirementMode::LocalPresent:
            return anyKey(hasAnyValue);
    }
    return true;
}

// Non-ASCII white space recognized when trimming user text
bool isUnicodeSpace(char32_t cp) {
    switch (cp) {
        case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string summarize(const std::vector<NodeReadiness>& issues) {
    std::string msg = "Missing required inputs:";
    for (size_t i = 0; i < issues.size(); ++i) {
        msg += (i ? "; " : " ");
        msg += "node '" + issues[i].nodeId + "' (" + formatMissingRequired(issues[i].missing) + ")";
    }
    return msg;
}

} // namespace

bool isBlankText(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            if (!std::isspace(c)) return false;
            ++i;
            continue;
        }
        size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 0;
        if (len == 0 || i + len > s.size()) return false; // stray byte: content, not space
        char32_t cp = c & (0x7F >> len);
        for (size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!isUnicodeSpace(cp)) return false;
        i += len;
    }
    return true;
}

bool hasNonEmptyString(const nlohmann::json& record, const std::string& key) {
    if (!record.is_object()) return false;
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return false;
    return !isBlankText(it->get_ref<const std::string&>());
}

const std::vector<Requirement>& requirementsFor(const std::string& nodeType) {
    static const std::vector<Requirement> none;
    const auto& table = requirementTable();
    auto it = table.find(nodeType);
    return it == table.end() ? none : it->second;
}

std::vector<MissingRequirement> validateRequired(const Node& node, const std::vector<Edge>& edges) {
    std::vector<MissingRequirement> missing;
    for (const auto& req : requirementsFor(node.type)) {
        if (!isSatisfied(req, node, edges)) missing.push_back({req.key, req.label});
    }
    return missing;
}

std::vector<NodeReadiness> preflight(const Graph& graph) {
    std::vector<NodeReadiness> issues;
    for (const auto& node : graph.nodes) {
        if (node.isSkipped()) continue;
        auto missing = validateRequired(node, graph.edges);
        if (!missing.empty()) issues.push_back({node.id, std::move(missing)});
    }
    return issues;
}

std::string formatMissingRequired(const std::vector<MissingRequirement>& missing) {
    std::string out;
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i) out += ", ";
        out += missing[i].label;
    }
    return out;
}

MissingRequiredInput::MissingRequiredInput(std::vector<NodeReadiness> issues)
    : std::runtime_error(summarize(issues)), issueList(std::move(issues)) {}

} // namespace MediaFlow
