// PayloadNormalizer.hpp
//
// Coerces weakly-typed payloads (whatever an upstream generation step or a
// user left in a data record) into the canonical shape of a semantic type:
//   text  -> one string
//   image -> one reference string, or an ordered list of them
//   video -> one reference string (first element of a list)
//   3d    -> one reference string (first element of a list)
// A reference string starts with a type-specific data-URI prefix, http://,
// https:// or file://. All functions are total: unusable input degrades to
// null / "" / a JSON dump, never an exception.
#pragma once
#include "HandleSchema.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace MediaFlow {

// Canonical envelope. Consumers std::visit instead of probing JSON shapes.
struct TextValue { std::string text; };
struct ImageRef { std::string url; };
struct ImageList { std::vector<std::string> urls; };
struct VideoRef { std::string url; };
struct ModelRef { std::string url; };
struct RawValue { nlohmann::json value; }; // 'any' typed data, passed through

using Payload = std::variant<std::monostate, TextValue, ImageRef, ImageList, VideoRef, ModelRef, RawValue>;

bool isImageReference(const std::string& s);
bool isVideoReference(const std::string& s);
bool isModelReference(const std::string& s);

// JavaScript-style truthiness of a JSON value (null, false, 0, "" are falsy)
bool isTruthy(const nlohmann::json& value);

// Serialization that never throws: invalid UTF-8 bytes become U+FFFD and
// integral floats print without a fraction ([1.0] -> "[1]").
std::string dumpText(const nlohmann::json& value, int indent = -1);

std::string toText(const nlohmann::json& value);
// Returns null, a reference string, or a non-empty array of reference strings
nlohmann::json toImage(const nlohmann::json& value);
std::optional<std::string> toVideo(const nlohmann::json& value);
std::optional<std::string> to3D(const nlohmann::json& value);

// Dispatch by semantic type; Any is the identity
nlohmann::json normalize(const nlohmann::json& value, SemanticType type);

// Best value of the given type in a node data record: 'output' first, then a
// type-specific field priority list.
nlohmann::json extractTyped(const nlohmann::json& dataRecord, SemanticType type);

Payload toPayload(const nlohmann::json& value, SemanticType type);
nlohmann::json toJson(const Payload& payload);
bool isEmptyPayload(const Payload& payload);

} // namespace MediaFlow
