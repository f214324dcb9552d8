// WorkflowExecutor.cpp
//
// Implements the sequential run loop, per-kind output resolution and output
// publishing.
#include "WorkflowExecutor.hpp"
#include "Log.hpp"
#include "NodeValidation.hpp"
#include "PayloadNormalizer.hpp"
#include <algorithm>
#include <chrono>
#include <initializer_list>

namespace MediaFlow {

using nlohmann::json;

namespace {

json inputValue(const ResolvedInputs& inputs, const char* port) {
    auto it = inputs.find(port);
    return it == inputs.end() ? json(nullptr) : it->second.toJson();
}

json field(const json& record, const char* key) {
    if (!record.is_object()) return nullptr;
    auto it = record.find(key);
    return it == record.end() ? json(nullptr) : *it;
}

json firstTruthy(std::initializer_list<json> candidates) {
    for (const auto& c : candidates) {
        if (isTruthy(c)) return c;
    }
    return nullptr;
}

json firstPresent(std::initializer_list<json> candidates) {
    for (const auto& c : candidates) {
        if (!c.is_null()) return c;
    }
    return nullptr;
}

json asList(const json& value) {
    return value.is_array() ? value : json::array({value});
}

json optionalToJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::string displayName(const Node& node) {
    json label = field(node.data, "label");
    if (label.is_string() && !label.get_ref<const std::string&>().empty()) return label.get<std::string>();
    return node.type.empty() ? node.id : node.type;
}

void publish(Node& node, const json& output, const json& outputMap) {
    if (!node.data.is_object()) node.data = json::object();
    node.data["output"] = output;
    for (const auto& item : outputMap.items()) node.data[item.key()] = item.value();
}

const char* semanticAlias(SemanticType type) {
    switch (type) {
        case SemanticType::Text: return "text";
        case SemanticType::Image: return "image";
        case SemanticType::Video: return "video";
        case SemanticType::Model3D: return "model";
        case SemanticType::Any: break;
    }
    return nullptr;
}

} // namespace

json buildOutputMap(const std::string& nodeType, const json& output) {
    json map = json::object();
    // 3D previews have no output handle but still expose the model for display
    if (nodeType == toString(NodeKind::Preview3D)) {
        if (!output.is_null()) {
            auto model = to3D(output);
            if (model) {
                map["model"] = *model;
                map["3d"] = *model;
            }
        }
        return map;
    }
    const NodeHandleSchema* schema = findHandleSchema(nodeType);
    if (!schema) return map;
    for (const auto& handle : schema->outputs) {
        const SemanticType type = parseSemanticType(handle.type).value_or(SemanticType::Any);
        json normalized = normalize(output, type);
        map[handle.id] = normalized;
        if (const char* alias = semanticAlias(type)) map[alias] = normalized;
    }
    return map;
}

std::vector<ExecutionResult> WorkflowExecutor::run(Graph& graph, const ExecutionOptions& options) {
    const std::vector<NodeId> order = topologicalOrder(graph.nodes, graph.edges);
    if (options.preflight) {
        auto issues = preflight(graph);
        if (!issues.empty()) throw MissingRequiredInput(std::move(issues));
    }
    log::info("running {} node(s)", order.size());

    std::vector<ExecutionResult> results;
    results.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const NodeId& id = order[i];
        if (options.onProgress) options.onProgress(i + 1, order.size());
        if (options.shouldStop && options.shouldStop()) {
            log::info("run stopped before node '{}'", id);
            break;
        }
        if (options.onNodeStart) options.onNodeStart(id);
        Node* node = graph.findNode(id);
        ExecutionResult result = executeOne(graph, *node, !options.preflight);
        if (options.onNodeComplete) options.onNodeComplete(id, result.success);
        results.push_back(std::move(result));
    }
    return results;
}

ExecutionResult WorkflowExecutor::runNode(Graph& graph, const NodeId& nodeId, const ExecutionOptions& options) {
    ExecutionResult result;
    result.nodeId = nodeId;
    if (options.shouldStop && options.shouldStop()) {
        result.error = "Execution stopped";
        return result;
    }
    Node* node = graph.findNode(nodeId);
    if (!node) {
        result.error = "Unknown node '" + nodeId + "'";
        return result;
    }
    if (options.onNodeStart) options.onNodeStart(nodeId);
    result = executeOne(graph, *node, true);
    if (options.onNodeComplete) options.onNodeComplete(nodeId, result.success);
    return result;
}

ExecutionResult WorkflowExecutor::executeOne(Graph& graph, Node& node, bool validate) {
    auto t0 = std::chrono::steady_clock::now();
    ExecutionResult result;
    result.nodeId = node.id;
    try {
        const ResolvedInputs inputs = resolveTypedInputs(node, graph.nodes, graph.edges);
        if (node.isSkipped()) {
            json output = firstPresent({field(node.data, "output"), inputValue(inputs, "text"),
                                        inputValue(inputs, "image"), inputValue(inputs, "video"),
                                        inputValue(inputs, "model")});
            json outputMap = buildOutputMap(node.type, output);
            for (const auto& item : outputMap.items()) node.data[item.key()] = item.value();
            result.success = true;
            result.skipped = true;
            result.output = std::move(output);
            result.outputs = std::move(outputMap);
            ++stats.nodesSkipped;
            log::info("node '{}' skipped", node.id);
            return result;
        }
        if (validate) {
            auto missing = validateRequired(node, graph.edges);
            if (!missing.empty()) {
                throw GenerationError("node '" + displayName(node) + "' is missing required inputs: " +
                                      formatMissingRequired(missing));
            }
        }
        json output = resolveNodeOutput(node, inputs);
        json outputMap = buildOutputMap(node.type, output);
        publish(node, output, outputMap);
        result.success = true;
        result.output = std::move(output);
        result.outputs = std::move(outputMap);
        ++stats.nodesExecuted;
        log::debug("node '{}' published {}", node.id, dumpText(result.outputs));
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
        ++stats.nodesFailed;
        log::error("node '{}' failed: {}", node.id, result.error);
    }
    auto t1 = std::chrono::steady_clock::now();
    stats.runTimeNsAccum += (unsigned long long)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
    return result;
}

json WorkflowExecutor::resolveNodeOutput(const Node& node, const ResolvedInputs& inputs) {
    const json& data = node.data;
    auto kind = parseNodeKind(node.type);
    if (!kind) {
        return firstTruthy({inputValue(inputs, "text"), inputValue(inputs, "image"), inputValue(inputs, "video"),
                            inputValue(inputs, "model"), field(data, "output")});
    }
    switch (*kind) {
        case NodeKind::TextGen:
        case NodeKind::ImageGen:
        case NodeKind::VideoGen:
        case NodeKind::Gen3D:
        case NodeKind::ScriptRunner:
            return generate(node, *kind, inputs);
        case NodeKind::TextInput:
            return toText(firstPresent({field(data, "text"), inputValue(inputs, "text")}));
        case NodeKind::ImageInput:
            return toImage(firstPresent({field(data, "image"), inputValue(inputs, "image")}));
        case NodeKind::VideoInput:
            return optionalToJson(toVideo(firstPresent({field(data, "video"), inputValue(inputs, "video")})));
        case NodeKind::Input3D:
            return optionalToJson(to3D(firstPresent({field(data, "url"), field(data, "model"), field(data, "output")})));
        case NodeKind::TextPreview: {
            std::string text = toText(firstTruthy({inputValue(inputs, "text"), inputValue(inputs, "prompt"),
                                                   inputValue(inputs, "content"), inputValue(inputs, "message"),
                                                   field(data, "output"), field(data, "text"), field(data, "prompt")}));
            return text.empty() ? json(nullptr) : json(text);
        }
        case NodeKind::ImagePreview:
            return toImage(firstTruthy({inputValue(inputs, "image"), inputValue(inputs, "url"),
                                        inputValue(inputs, "src"), field(data, "output"), field(data, "image")}));
        case NodeKind::VideoPreview:
            return optionalToJson(toVideo(firstTruthy({inputValue(inputs, "video"), inputValue(inputs, "url"),
                                                       inputValue(inputs, "src"), field(data, "output"),
                                                       field(data, "video")})));
        case NodeKind::Preview3D:
            return optionalToJson(to3D(firstTruthy({inputValue(inputs, "model"), inputValue(inputs, "3d"),
                                                    inputValue(inputs, "url"), inputValue(inputs, "src"),
                                                    field(data, "output"), field(data, "model")})));
    }
    return nullptr;
}

json WorkflowExecutor::generate(const Node& node, NodeKind kind, const ResolvedInputs& inputs) {
    if (!backend) {
        throw GenerationError("no generation backend configured for node '" + displayName(node) + "'");
    }
    const json& data = node.data;
    GenerationRequest request;
    request.kind = kind;
    request.inputs = toJson(inputs);
    request.prompt = toText(firstTruthy({inputValue(inputs, "text"), inputValue(inputs, "prompt"), field(data, "prompt")}));

    if (kind == NodeKind::VideoGen) {
        // Frame count selects the mode downstream: none, first frame, first+last, references
        json image = inputValue(inputs, "image");
        if (!image.is_null()) {
            request.imageInput = asList(image);
        } else if (!field(data, "firstFrame").is_null() && !field(data, "lastFrame").is_null()) {
            request.imageInput = json::array({field(data, "firstFrame"), field(data, "lastFrame")});
        } else if (!field(data, "image").is_null()) {
            request.imageInput = asList(field(data, "image"));
        }
    } else {
        request.imageInput = firstTruthy({inputValue(inputs, "image"), field(data, "image")});
    }

    if ((kind == NodeKind::ImageGen || kind == NodeKind::VideoGen) && isBlankText(request.prompt)) {
        throw GenerationError("node '" + displayName(node) + "' needs a prompt: connect a text input or set 'prompt'");
    }
    if (kind == NodeKind::Gen3D) {
        if (!isTruthy(request.imageInput)) {
            throw GenerationError("node '" + displayName(node) + "' needs an image input");
        }
        if (request.imageInput.is_array()) request.imageInput = request.imageInput.front();
    }

    log::debug("node '{}': calling backend ({} input port(s))", node.id, inputs.size());
    json raw = backend->generate(node, request);
    if (kind == NodeKind::Gen3D) {
        auto model = to3D(raw);
        if (model) return *model;
    }
    return raw;
}

} // namespace MediaFlow
