// PayloadNormalizer.cpp
//
// Normalization rules per semantic type. Field priority lists are part of
// the data contract with generation back-ends and must not be reordered.
#include "PayloadNormalizer.hpp"
#include "Log.hpp"
#include <cmath>
#include <cstdint>
#include <iterator>
#include <fmt/format.h>

namespace MediaFlow {

using nlohmann::json;

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool isRemoteOrFile(const std::string& s) {
    return startsWith(s, "http://") || startsWith(s, "https://") || startsWith(s, "file://");
}

std::string numberToString(const json& value) {
    if (value.is_number_integer()) {
        return value.is_number_unsigned() ? std::to_string(value.get<std::uint64_t>())
                                          : std::to_string(value.get<std::int64_t>());
    }
    double d = value.get<double>();
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0) return "0";
    // Integral values print as plain digits up to 1e21, as editors display them
    if (std::trunc(d) == d && std::fabs(d) < 1e21) return fmt::format("{:.0f}", d);
    return fmt::format("{}", d);
}

// Integral floats become integers so 2.0 serializes as 2
json withIntegralNumbers(const json& value) {
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.2e18) {
            return static_cast<std::int64_t>(d);
        }
        return value;
    }
    if (value.is_array()) {
        json out = json::array();
        for (const auto& item : value) out.push_back(withIntegralNumbers(item));
        return out;
    }
    if (value.is_object()) {
        json out = json::object();
        for (const auto& item : value.items()) out[item.key()] = withIntegralNumbers(item.value());
        return out;
    }
    return value;
}

const char* const kImageFields[] = {"image", "url", "src", "output", "data", "result"};
const char* const kVideoFields[] = {"video", "url", "src", "output", "data", "result"};
const char* const kModelFields[] = {"model", "url", "src", "output", "data", "result", "3d"};

// Picks the first truthy field of a record, else the last field's value
// (which may be null). Mirrors how extraction chains fall back.
json firstTruthyOrLast(const json& record, std::initializer_list<const char*> fields) {
    const char* last = nullptr;
    for (const char* f : fields) {
        last = f;
        auto it = record.find(f);
        if (it != record.end() && isTruthy(*it)) return *it;
    }
    if (last) {
        auto it = record.find(last);
        if (it != record.end()) return *it;
    }
    return nullptr;
}

template <typename Fn>
std::optional<std::string> singleReference(const json& value, Fn&& isRef,
                                           const char* const* fields, size_t fieldCount) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (isRef(s)) return s;
        return std::nullopt;
    }
    if (value.is_array()) {
        if (value.empty()) return std::nullopt;
        return singleReference(value.front(), isRef, fields, fieldCount);
    }
    if (value.is_object()) {
        for (size_t i = 0; i < fieldCount; ++i) {
            auto it = value.find(fields[i]);
            if (it == value.end()) continue;
            auto normalized = singleReference(*it, isRef, fields, fieldCount);
            if (normalized) return normalized;
        }
    }
    return std::nullopt;
}

} // namespace

bool isImageReference(const std::string& s) {
    return startsWith(s, "data:image/") || isRemoteOrFile(s);
}

bool isVideoReference(const std::string& s) {
    return startsWith(s, "data:video/") || isRemoteOrFile(s);
}

bool isModelReference(const std::string& s) {
    return startsWith(s, "data:model/") || startsWith(s, "data:application/octet-stream") || isRemoteOrFile(s);
}

bool isTruthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case json::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case json::value_t::number_float: {
            double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

std::string dumpText(const json& value, int indent) {
    return withIntegralNumbers(value).dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string toText(const json& value) {
    if (value.is_null() || value.is_discarded()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return numberToString(value);
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_array()) {
        bool allStrings = true;
        for (const auto& item : value) {
            if (!item.is_string()) { allStrings = false; break; }
        }
        if (!allStrings) return dumpText(value);
        std::string joined;
        for (size_t i = 0; i < value.size(); ++i) {
            if (i) joined += '\n';
            joined += value[i].get_ref<const std::string&>();
        }
        return joined;
    }
    if (value.is_object()) {
        for (const char* field : {"text", "content", "message", "output"}) {
            auto it = value.find(field);
            if (it != value.end()) return toText(*it);
        }
        return dumpText(value);
    }
    return dumpText(value);
}

json toImage(const json& value) {
    if (value.is_null()) return nullptr;
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (isImageReference(s)) return s;
        return nullptr;
    }
    if (value.is_array()) {
        json images = json::array();
        for (const auto& item : value) {
            json normalized = toImage(item);
            if (normalized.is_array()) {
                for (auto& n : normalized) images.push_back(std::move(n));
            } else if (normalized.is_string()) {
                images.push_back(std::move(normalized));
            }
        }
        if (images.empty()) return nullptr;
        return images;
    }
    if (value.is_object()) {
        for (const char* field : kImageFields) {
            auto it = value.find(field);
            if (it == value.end()) continue;
            json normalized = toImage(*it);
            if (!normalized.is_null()) return normalized;
        }
        // Inline base64 payload: {data: "...", mimeType: "image/jpeg"}
        auto data = value.find("data");
        if (data != value.end() && data->is_string()) {
            std::string mime = "image/png";
            for (const char* key : {"mimeType", "mime_type"}) {
                auto m = value.find(key);
                if (m != value.end() && m->is_string() && !m->get_ref<const std::string&>().empty()) {
                    mime = m->get<std::string>();
                    break;
                }
            }
            log::debug("toImage: synthesizing data URI from base64 payload ({})", mime);
            return "data:" + mime + ";base64," + data->get<std::string>();
        }
    }
    return nullptr;
}

std::optional<std::string> toVideo(const json& value) {
    return singleReference(value, isVideoReference, kVideoFields, std::size(kVideoFields));
}

std::optional<std::string> to3D(const json& value) {
    return singleReference(value, isModelReference, kModelFields, std::size(kModelFields));
}

json normalize(const json& value, SemanticType type) {
    switch (type) {
        case SemanticType::Text:
            return toText(value);
        case SemanticType::Image:
            return toImage(value);
        case SemanticType::Video: {
            auto v = toVideo(value);
            return v ? json(*v) : json(nullptr);
        }
        case SemanticType::Model3D: {
            auto m = to3D(value);
            return m ? json(*m) : json(nullptr);
        }
        case SemanticType::Any:
            break;
    }
    return value;
}

json extractTyped(const json& dataRecord, SemanticType type) {
    if (!dataRecord.is_object()) return normalize(nullptr, type);
    auto output = dataRecord.find("output");
    if (output != dataRecord.end()) {
        json normalized = normalize(*output, type);
        bool empty = normalized.is_null() || (normalized.is_string() && normalized.get_ref<const std::string&>().empty());
        if (!empty) return normalized;
    }
    switch (type) {
        case SemanticType::Text:
            return toText(firstTruthyOrLast(dataRecord, {"text", "content", "message", "prompt", "output"}));
        case SemanticType::Image:
            return toImage(firstTruthyOrLast(dataRecord, {"image", "url", "src", "output"}));
        case SemanticType::Video:
            return normalize(firstTruthyOrLast(dataRecord, {"video", "url", "src", "output"}), type);
        case SemanticType::Model3D:
            return normalize(firstTruthyOrLast(dataRecord, {"model", "3d", "url", "src", "output"}), type);
        case SemanticType::Any:
            break;
    }
    if (output != dataRecord.end() && isTruthy(*output)) return *output;
    return dataRecord;
}

Payload toPayload(const json& value, SemanticType type) {
    switch (type) {
        case SemanticType::Text:
            return TextValue{toText(value)};
        case SemanticType::Image: {
            json image = toImage(value);
            if (image.is_string()) return ImageRef{image.get<std::string>()};
            if (image.is_array()) return ImageList{image.get<std::vector<std::string>>()};
            return std::monostate{};
        }
        case SemanticType::Video: {
            auto v = toVideo(value);
            if (v) return VideoRef{*v};
            return std::monostate{};
        }
        case SemanticType::Model3D: {
            auto m = to3D(value);
            if (m) return ModelRef{*m};
            return std::monostate{};
        }
        case SemanticType::Any:
            break;
    }
    if (value.is_null()) return std::monostate{};
    return RawValue{value};
}

namespace {
struct PayloadToJson {
    json operator()(const std::monostate&) const { return nullptr; }
    json operator()(const TextValue& v) const { return v.text; }
    json operator()(const ImageRef& v) const { return v.url; }
    json operator()(const ImageList& v) const { return v.urls; }
    json operator()(const VideoRef& v) const { return v.url; }
    json operator()(const ModelRef& v) const { return v.url; }
    json operator()(const RawValue& v) const { return v.value; }
};
} // namespace

json toJson(const Payload& payload) {
    return std::visit(PayloadToJson{}, payload);
}

bool isEmptyPayload(const Payload& payload) {
    if (std::holds_alternative<std::monostate>(payload)) return true;
    if (auto t = std::get_if<TextValue>(&payload)) return t->text.empty();
    if (auto r = std::get_if<RawValue>(&payload)) return r->value.is_null();
    return false;
}

} // namespace MediaFlow
