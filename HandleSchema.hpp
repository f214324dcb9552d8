// HandleSchema.hpp
//
// Static per-node-kind port table. Every node kind declares its named input
// and output handles together with the semantic type that flows through
// them. Connection validity is decided here (exact type match or an 'any'
// wildcard); coercion between types never happens at this level.
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace MediaFlow {

enum class SemanticType { Text, Image, Video, Model3D, Any };

enum class NodeKind {
    TextGen,
    ImageGen,
    VideoGen,
    Gen3D,
    ScriptRunner,
    TextInput,
    ImageInput,
    VideoInput,
    Input3D,
    TextPreview,
    ImagePreview,
    VideoPreview,
    Preview3D,
};

enum class HandleDirection { Input, Output };

struct HandleDef {
    std::string id;
    std::string label;
    std::string type; // wire type name as authored ("text", "image", "3d", legacy "string", ...)
};

struct NodeHandleSchema {
    std::vector<HandleDef> inputs;
    std::vector<HandleDef> outputs;
};

// "text" | "image" | "video" | "3d" | "any"
const char* toString(SemanticType type);
// Normalizes a wire type name; legacy "string" maps to Text, anything
// unrecognized yields nullopt.
std::optional<SemanticType> parseSemanticType(const std::string& name);

// Wire tag of a node kind ("textGen", "3dPreview", ...)
const char* toString(NodeKind kind);
std::optional<NodeKind> parseNodeKind(const std::string& tag);

bool isGeneratorKind(NodeKind kind);
bool isInputKind(NodeKind kind);
bool isPreviewKind(NodeKind kind);

// Schema for a node type tag, or nullptr when the kind is unknown
const NodeHandleSchema* findHandleSchema(const std::string& nodeType);

// Semantic type of a handle, or nullopt when the node type or the handle id
// is unknown in that direction.
std::optional<SemanticType> getHandleType(const std::string& nodeType,
                                          const std::string& handleId,
                                          HandleDirection direction);

// Sole gate for port-to-port connections: false when either side is
// unresolved, true for 'any' on either side or an exact match.
bool isCompatibleHandleType(std::optional<SemanticType> source, std::optional<SemanticType> target);

} // namespace MediaFlow
