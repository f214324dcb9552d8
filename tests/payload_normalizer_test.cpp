/**
 * @file payload_normalizer_test.cpp
 * @brief Coercion of loose payloads into canonical text/image/video/3d shapes.
 */

#include "PayloadNormalizer.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <variant>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

using namespace MediaFlow;
using nlohmann::json;

static void test_to_text() {
    CHECK(toText(json::parse(R"({"content": "hi"})")) == "hi");
    CHECK(toText(json::parse(R"(["a", "b"])")) == "a\nb");
    CHECK(toText(json::parse("[1,2]")) == "[1,2]");
    CHECK(toText(nullptr).empty());
    CHECK(toText("plain") == "plain");
    CHECK(toText(42) == "42");
    CHECK(toText(-7) == "-7");
    CHECK(toText(1.5) == "1.5");
    CHECK(toText(true) == "true");
    // Field priority: text, content, message, output
    CHECK(toText(json::parse(R"({"content": "c", "text": "t"})")) == "t");
    CHECK(toText(json::parse(R"({"output": {"message": "nested"}})")) == "nested");
    CHECK(toText(json::parse(R"({"foo": 1})")) == R"({"foo":1})");
    CHECK(toText(json::array()).empty());
    std::printf("  PASS: toText\n");
}

static void test_to_text_is_total() {
    const std::string replacement = "\xEF\xBF\xBD"; // U+FFFD
    std::string text = toText(json::array({std::string("\xff\xfe"), 1}));
    CHECK(text.rfind("[\"", 0) == 0);
    CHECK(text.find(replacement) != std::string::npos);
    CHECK(text.size() >= 3 && text.compare(text.size() - 3, 3, ",1]") == 0);

    json record = {{"foo", std::string("caf\xe9")}};
    text = toText(record);
    CHECK(text.find("caf") != std::string::npos);
    CHECK(text.find(replacement) != std::string::npos);

    text = extractTyped(json({{"output", record}}), SemanticType::Text).get<std::string>();
    CHECK(text.find(replacement) != std::string::npos);

    // A lone string is passed through untouched
    CHECK(toText(std::string("\xff")) == "\xff");
    std::printf("  PASS: toText never throws on invalid UTF-8\n");
}

static void test_number_text_matches_editor() {
    CHECK(toText(json::parse(R"([1.0, "a"])")) == R"([1,"a"])");
    CHECK(toText(json::parse(R"({"n": 2.0})")) == R"({"n":2})");
    CHECK(toText(json::parse(R"({"n": 2.5})")) == R"({"n":2.5})");
    CHECK(toText(1e20) == "100000000000000000000");
    CHECK(toText(2.0) == "2");
    CHECK(toText(-0.0) == "0");
    CHECK(toText(1e21) == "1e+21");
    std::printf("  PASS: numbers print like the editor\n");
}

static void test_to_image() {
    CHECK(toImage("not-a-url").is_null());
    CHECK(toImage("https://x/y.png") == "https://x/y.png");
    CHECK(toImage("data:image/png;base64,AAAA") == "data:image/png;base64,AAAA");
    CHECK(toImage("file:///tmp/a.png") == "file:///tmp/a.png");
    CHECK(toImage("data:video/mp4;base64,AAAA").is_null());
    CHECK(toImage(nullptr).is_null());
    CHECK(toImage(12).is_null());

    // Lists flatten, invalid members drop out, empty results are null
    json mixed = json::parse(R"(["https://a/1.png", "bad", ["https://a/2.png", 3]])");
    CHECK(toImage(mixed) == json::parse(R"(["https://a/1.png", "https://a/2.png"])"));
    CHECK(toImage(json::array()).is_null());
    CHECK(toImage(json::parse(R"(["bad"])")).is_null());

    CHECK(toImage(json::parse(R"({"url": "https://x/u.png"})")) == "https://x/u.png");
    CHECK(toImage(json::parse(R"({"result": {"image": "https://x/r.png"}})")) == "https://x/r.png");
    CHECK(toImage(json::parse(R"({"data": [{"url": "https://x/0.png"}, {"url": "https://x/1.png"}]})")) ==
          json::parse(R"(["https://x/0.png", "https://x/1.png"])"));
    CHECK(toImage(json::parse(R"({"caption": "no image here"})")).is_null());
    std::printf("  PASS: toImage\n");
}

static void test_to_image_base64_synthesis() {
    CHECK(toImage(json::parse(R"({"data": "QUJD", "mimeType": "image/jpeg"})")) == "data:image/jpeg;base64,QUJD");
    CHECK(toImage(json::parse(R"({"data": "QUJD", "mime_type": "image/webp"})")) == "data:image/webp;base64,QUJD");
    CHECK(toImage(json::parse(R"({"data": "QUJD"})")) == "data:image/png;base64,QUJD");
    // A reference under 'data' wins over synthesis
    CHECK(toImage(json::parse(R"({"data": "https://x/d.png", "mimeType": "image/jpeg"})")) == "https://x/d.png");
    std::printf("  PASS: toImage base64 synthesis\n");
}

static void test_to_video_and_3d() {
    CHECK(toVideo("https://v/clip.mp4") == std::string("https://v/clip.mp4"));
    CHECK(toVideo(json::parse(R"(["https://v/1.mp4", "https://v/2.mp4"])")) == std::string("https://v/1.mp4"));
    CHECK(toVideo(json::parse(R"({"result": {"video": "https://v/r.mp4"}})")) == std::string("https://v/r.mp4"));
    CHECK(toVideo("data:video/webm;base64,AAAA") == std::string("data:video/webm;base64,AAAA"));
    CHECK(!toVideo("data:image/png;base64,AAAA"));
    CHECK(!toVideo(json::array()));
    CHECK(!toVideo(nullptr));

    CHECK(to3D("data:model/gltf-binary;base64,Z2xURg") == std::string("data:model/gltf-binary;base64,Z2xURg"));
    CHECK(to3D("data:application/octet-stream;base64,AA") == std::string("data:application/octet-stream;base64,AA"));
    CHECK(to3D(json::parse(R"({"3d": "https://m/x.glb"})")) == std::string("https://m/x.glb"));
    CHECK(to3D(json::parse(R"([{"model": "https://m/a.glb"}, "https://m/b.glb"])")) == std::string("https://m/a.glb"));
    CHECK(!to3D("model.glb"));
    std::printf("  PASS: toVideo / to3D\n");
}

static void test_canonical_values_are_fixed_points() {
    const json text = "already text";
    CHECK(normalize(text, SemanticType::Text) == text);

    const json image = "https://x/y.png";
    const json images = json::parse(R"(["https://x/1.png", "data:image/png;base64,AA"])");
    CHECK(normalize(image, SemanticType::Image) == image);
    CHECK(normalize(images, SemanticType::Image) == images);

    const json video = "https://v/clip.mp4";
    CHECK(normalize(video, SemanticType::Video) == video);
    CHECK(normalize(normalize(json::array({video, "https://v/other.mp4"}), SemanticType::Video),
                    SemanticType::Video) == video);

    const json model = "https://m/x.glb";
    CHECK(normalize(model, SemanticType::Model3D) == model);

    const json raw = json::parse(R"({"rows": [1, 2, 3]})");
    CHECK(normalize(raw, SemanticType::Any) == raw);
    std::printf("  PASS: canonical values are fixed points\n");
}

static void test_extract_typed() {
    // 'output' first
    json record = json::parse(R"({"output": "https://x/o.png", "image": "https://x/i.png"})");
    CHECK(extractTyped(record, SemanticType::Image) == "https://x/o.png");

    // Empty output falls through to the field chain
    record = json::parse(R"({"output": "", "text": "", "content": "c"})");
    CHECK(extractTyped(record, SemanticType::Text) == "c");
    CHECK(extractTyped(json::parse(R"({"prompt": "p"})"), SemanticType::Text) == "p");
    CHECK(extractTyped(json::object(), SemanticType::Text) == "");

    CHECK(extractTyped(json::parse(R"({"src": "https://s/i.png"})"), SemanticType::Image) == "https://s/i.png");
    CHECK(extractTyped(json::parse(R"({"video": ["https://v/a.mp4"]})"), SemanticType::Video) == "https://v/a.mp4");
    CHECK(extractTyped(json::parse(R"({"3d": "https://m/m.glb"})"), SemanticType::Model3D) == "https://m/m.glb");
    CHECK(extractTyped(json::object(), SemanticType::Video).is_null());

    CHECK(extractTyped(json::parse(R"({"output": 5})"), SemanticType::Any) == 5);
    json plain = json::parse(R"({"a": 1})");
    CHECK(extractTyped(plain, SemanticType::Any) == plain);
    std::printf("  PASS: extractTyped\n");
}

static void test_payload_variant() {
    Payload text = toPayload(json::parse(R"({"message": "m"})"), SemanticType::Text);
    CHECK(std::holds_alternative<TextValue>(text));
    CHECK(std::get<TextValue>(text).text == "m");

    Payload list = toPayload(json::parse(R"(["https://x/1.png", "https://x/2.png"])"), SemanticType::Image);
    CHECK(std::holds_alternative<ImageList>(list));
    CHECK(std::get<ImageList>(list).urls.size() == 2);
    CHECK(toJson(list) == json::parse(R"(["https://x/1.png", "https://x/2.png"])"));

    CHECK(std::holds_alternative<ImageRef>(toPayload("https://x/1.png", SemanticType::Image)));
    CHECK(std::holds_alternative<VideoRef>(toPayload("https://v/1.mp4", SemanticType::Video)));
    CHECK(std::holds_alternative<ModelRef>(toPayload("https://m/1.glb", SemanticType::Model3D)));
    CHECK(std::holds_alternative<std::monostate>(toPayload("bad", SemanticType::Video)));
    CHECK(std::holds_alternative<std::monostate>(toPayload(nullptr, SemanticType::Any)));
    CHECK(std::holds_alternative<RawValue>(toPayload(json::parse("[1]"), SemanticType::Any)));

    CHECK(isEmptyPayload(Payload{}));
    CHECK(isEmptyPayload(TextValue{""}));
    CHECK(!isEmptyPayload(TextValue{"x"}));
    CHECK(toJson(Payload{}).is_null());
    std::printf("  PASS: Payload variant\n");
}

static void test_truthiness() {
    CHECK(!isTruthy(nullptr));
    CHECK(!isTruthy(false));
    CHECK(!isTruthy(0));
    CHECK(!isTruthy(0.0));
    CHECK(!isTruthy(""));
    CHECK(isTruthy("0"));
    CHECK(isTruthy(json::array()));
    CHECK(isTruthy(json::object()));
    CHECK(isTruthy(-1));
    std::printf("  PASS: truthiness\n");
}

int main() {
    std::printf("payload_normalizer_test\n");
    test_to_text();
    test_to_text_is_total();
    test_number_text_matches_editor();
    test_to_image();
    test_to_image_base64_synthesis();
    test_to_video_and_3d();
    test_canonical_values_are_fixed_points();
    test_extract_typed();
    test_payload_variant();
    test_truthiness();
    std::printf("OK: all payload normalizer tests passed\n");
    return 0;
}
