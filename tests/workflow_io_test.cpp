/**
 * @file workflow_io_test.cpp
 * @brief Workflow document import/export and file round trips.
 */

#include "WorkflowIO.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#ifndef MEDIAFLOW_FLOWS_DIR
#define MEDIAFLOW_FLOWS_DIR "flows"
#endif

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

using namespace MediaFlow;
using nlohmann::json;

static bool rejects(const json& doc) {
    try {
        importWorkflow(doc);
    } catch (const WorkflowFormatError& e) {
        CHECK(std::string(e.what()).rfind("Invalid workflow file format: ", 0) == 0);
        return true;
    }
    return false;
}

static void test_import_basic() {
    json doc = json::parse(R"({
        "nodes": [
            {"id": "p", "type": "textInput", "label": "Prompt", "position": {"x": 1, "y": 2},
             "data": {"text": "hello"}},
            {"id": "g", "type": "textGen", "label": "Outer", "data": {"label": "Inner", "prompt": ""}},
            {"id": "u"}
        ],
        "edges": [
            {"id": "e1", "source": "p", "sourceHandle": "text", "target": "g", "targetHandle": "text"},
            {"id": "e2", "source": "g", "target": "u", "sourceHandle": null}
        ],
        "metadata": {"version": "1.0.0", "created": "2026-01-01T00:00:00Z"}
    })");
    Graph g = importWorkflow(doc);
    CHECK(g.nodes.size() == 3);
    CHECK(g.nodes[0].data["label"] == "Prompt");
    CHECK(g.nodes[0].data["text"] == "hello");
    CHECK(g.nodes[0].position == json({{"x", 1}, {"y", 2}}));
    // Record fields win over the top-level label
    CHECK(g.nodes[1].data["label"] == "Inner");
    CHECK(g.nodes[2].type == "default");

    CHECK(g.edges.size() == 2);
    CHECK(g.edges[0].sourceHandle == "text");
    CHECK(g.edges[1].sourceHandle.empty());
    CHECK(g.edges[1].targetHandle.empty());
    CHECK(g.metadata["created"] == "2026-01-01T00:00:00Z");
    CHECK(g.findNode("g") == &g.nodes[1]);
    CHECK(g.findNode("nope") == nullptr);
    std::printf("  PASS: import\n");
}

static void test_import_rejects_malformed() {
    CHECK(rejects(json::array()));
    CHECK(rejects(json::parse(R"({"edges": []})")));
    CHECK(rejects(json::parse(R"({"nodes": {}})")));
    CHECK(rejects(json::parse(R"({"nodes": [{"type": "textGen"}]})")));
    CHECK(rejects(json::parse(R"({"nodes": [{"id": "a"}, {"id": "a"}]})")));
    CHECK(rejects(json::parse(R"({"nodes": [{"id": "a"}], "edges": [{"id": "e", "target": "a"}]})")));
    CHECK(rejects(json::parse(R"({"nodes": [], "edges": {}})")));

    // Dangling edges and unknown kinds are kept
    Graph g = importWorkflow(json::parse(R"({"nodes": [{"id": "a", "type": "audioGen"}],
                                             "edges": [{"id": "e", "source": "a", "target": "zz"}]})"));
    CHECK(g.nodes[0].type == "audioGen");
    CHECK(g.edges.size() == 1);
    std::printf("  PASS: malformed documents rejected\n");
}

static void test_export_shape() {
    Graph g;
    Node n;
    n.id = "p";
    n.type = "textInput";
    n.data = {{"label", "Prompt"}, {"text", "hi"}};
    g.nodes.push_back(n);
    Node bare;
    bare.id = "q";
    bare.type = "textPreview";
    g.nodes.push_back(bare);
    g.edges.push_back(Edge{"e1", "p", "text", "q", "text"});
    g.edges.push_back(Edge{"e2", "p", "", "q", ""});

    json doc = exportWorkflow(g);
    const json& first = doc["nodes"][0];
    CHECK(first["label"] == "Prompt");
    CHECK(first["inputs"] == json::array());
    CHECK(first["outputs"] == json::array());
    CHECK(first["params"] == json::array());
    CHECK(first["position"] == json({{"x", 0}, {"y", 0}}));
    CHECK(first["data"]["text"] == "hi");
    CHECK(doc["nodes"][1]["label"] == "");

    CHECK(doc["edges"][0]["sourceHandle"] == "text");
    CHECK(doc["edges"][1]["targetHandle"] == "");

    const json& meta = doc["metadata"];
    CHECK(meta["version"] == "1.0.0");
    const std::string created = meta["created"].get<std::string>();
    CHECK(created.size() == 20);
    CHECK(created[10] == 'T');
    CHECK(created.back() == 'Z');
    CHECK(meta["modified"] == meta["created"]);

    // An existing creation time survives re-export
    g.metadata["created"] = "2025-12-24T18:00:00Z";
    CHECK(exportWorkflow(g)["metadata"]["created"] == "2025-12-24T18:00:00Z");
    std::printf("  PASS: export shape\n");
}

static void test_file_round_trip() {
    Graph g = loadWorkflowFile(std::string(MEDIAFLOW_FLOWS_DIR) + "/text_to_image.json");
    CHECK(g.nodes.size() == 6);
    CHECK(g.edges.size() == 5);
    CHECK(g.findNode("render")->data["aspectRatio"] == "16:9");

    const auto path = std::filesystem::temp_directory_path() / "mediaflow_workflow_io_test.json";
    saveWorkflowFile(path.string(), g);
    Graph back = loadWorkflowFile(path.string());
    CHECK(back.nodes.size() == g.nodes.size());
    for (size_t i = 0; i < g.nodes.size(); ++i) {
        CHECK(back.nodes[i].id == g.nodes[i].id);
        CHECK(back.nodes[i].type == g.nodes[i].type);
        CHECK(back.nodes[i].data == g.nodes[i].data);
        CHECK(back.nodes[i].position == g.nodes[i].position);
    }
    CHECK(back.edges.size() == g.edges.size());
    CHECK(back.edges[2].source == "render");
    CHECK(back.edges[2].targetHandle == "image");
    CHECK(back.metadata["created"] == "2026-01-05T09:30:00Z");
    std::filesystem::remove(path);
    std::printf("  PASS: file round trip\n");
}

static void test_file_errors() {
    bool threw = false;
    try {
        loadWorkflowFile("/nonexistent/mediaflow/workflow.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);

    const auto path = std::filesystem::temp_directory_path() / "mediaflow_workflow_io_bad.json";
    {
        std::ofstream out(path);
        out << "{ \"nodes\": [ ";
    }
    threw = false;
    try {
        loadWorkflowFile(path.string());
    } catch (const WorkflowFormatError&) {
        threw = true;
    }
    CHECK(threw);
    std::filesystem::remove(path);
    std::printf("  PASS: file errors\n");
}

int main() {
    std::printf("workflow_io_test\n");
    test_import_basic();
    test_import_rejects_malformed();
    test_export_shape();
    test_file_round_trip();
    test_file_errors();
    std::printf("OK: all workflow io tests passed\n");
    return 0;
}
