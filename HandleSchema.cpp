// HandleSchema.cpp
//
// The handle table itself plus the kind/type name mappings.
#include "HandleSchema.hpp"
#include <algorithm>
#include <unordered_map>

namespace MediaFlow {

namespace {

struct KindTag {
    NodeKind kind;
    const char* tag;
};

const KindTag kKindTags[] = {
    {NodeKind::TextGen, "textGen"},
    {NodeKind::ImageGen, "imageGen"},
    {NodeKind::VideoGen, "videoGen"},
    {NodeKind::Gen3D, "3dGen"},
    {NodeKind::ScriptRunner, "scriptRunner"},
    {NodeKind::TextInput, "textInput"},
    {NodeKind::ImageInput, "imageInput"},
    {NodeKind::VideoInput, "videoInput"},
    {NodeKind::Input3D, "3dInput"},
    {NodeKind::TextPreview, "textPreview"},
    {NodeKind::ImagePreview, "imagePreview"},
    {NodeKind::VideoPreview, "videoPreview"},
    {NodeKind::Preview3D, "3dPreview"},
};

const std::unordered_map<std::string, NodeHandleSchema>& schemaTable() {
    static const std::unordered_map<std::string, NodeHandleSchema> table = {
        {"textGen", {{{"text", "Text", "text"}, {"image", "Image", "image"}},
                     {{"text", "Text", "text"}}}},
        {"imageGen", {{{"text", "Text", "text"}, {"image", "Image", "image"}},
                      {{"image", "Image", "image"}}}},
        {"videoGen", {{{"text", "Text", "text"}, {"image", "Image", "image"}},
                      {{"video", "Video", "video"}}}},
        {"3dGen", {{{"text", "Text", "text"}, {"image", "Image", "image"}},
                   {{"model", "3D", "3d"}}}},
        {"scriptRunner", {{{"input1", "Input 1", "any"}, {"input2", "Input 2", "any"}},
                          {{"output", "Output", "any"}}}},
        {"textInput", {{}, {{"text", "Text", "text"}}}},
        {"imageInput", {{}, {{"image", "Image", "image"}}}},
        {"videoInput", {{}, {{"video", "Video", "video"}}}},
        {"3dInput", {{}, {{"model", "3D", "3d"}}}},
        {"textPreview", {{{"text", "Text", "text"}}, {}}},
        {"imagePreview", {{{"image", "Image", "image"}}, {}}},
        {"videoPreview", {{{"video", "Video", "video"}}, {}}},
        {"3dPreview", {{{"model", "3D", "3d"}}, {}}},
    };
    return table;
}

} // namespace

const char* toString(SemanticType type) {
    switch (type) {
        case SemanticType::Text: return "text";
        case SemanticType::Image: return "image";
        case SemanticType::Video: return "video";
        case SemanticType::Model3D: return "3d";
        case SemanticType::Any: return "any";
    }
    return "any";
}

std::optional<SemanticType> parseSemanticType(const std::string& name) {
    if (name == "text" || name == "string") return SemanticType::Text;
    if (name == "image") return SemanticType::Image;
    if (name == "video") return SemanticType::Video;
    if (name == "3d") return SemanticType::Model3D;
    if (name == "any") return SemanticType::Any;
    return std::nullopt;
}

const char* toString(NodeKind kind) {
    for (const auto& kt : kKindTags) {
        if (kt.kind == kind) return kt.tag;
    }
    return "";
}

std::optional<NodeKind> parseNodeKind(const std::string& tag) {
    for (const auto& kt : kKindTags) {
        if (tag == kt.tag) return kt.kind;
    }
    return std::nullopt;
}

bool isGeneratorKind(NodeKind kind) {
    return kind == NodeKind::TextGen || kind == NodeKind::ImageGen ||
           kind == NodeKind::VideoGen || kind == NodeKind::Gen3D;
}

bool isInputKind(NodeKind kind) {
    return kind == NodeKind::TextInput || kind == NodeKind::ImageInput ||
           kind == NodeKind::VideoInput || kind == NodeKind::Input3D;
}

bool isPreviewKind(NodeKind kind) {
    return kind == NodeKind::TextPreview || kind == NodeKind::ImagePreview ||
           kind == NodeKind::VideoPreview || kind == NodeKind::Preview3D;
}

const NodeHandleSchema* findHandleSchema(const std::string& nodeType) {
    const auto& table = schemaTable();
    auto it = table.find(nodeType);
    return it == table.end() ? nullptr : &it->second;
}

std::optional<SemanticType> getHandleType(const std::string& nodeType,
                                          const std::string& handleId,
                                          HandleDirection direction) {
    if (nodeType.empty() || handleId.empty()) return std::nullopt;
    const NodeHandleSchema* schema = findHandleSchema(nodeType);
    if (!schema) return std::nullopt;
    const auto& handles = direction == HandleDirection::Input ? schema->inputs : schema->outputs;
    auto it = std::find_if(handles.begin(), handles.end(),
                           [&](const HandleDef& h) { return h.id == handleId; });
    if (it == handles.end()) return std::nullopt;
    return parseSemanticType(it->type);
}

bool isCompatibleHandleType(std::optional<SemanticType> source, std::optional<SemanticType> target) {
    if (!source || !target) return false;
    if (*source == SemanticType::Any || *target == SemanticType::Any) return true;
    return *source == *target;
}

} // namespace MediaFlow
