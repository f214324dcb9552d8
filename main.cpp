// main.cpp
//
// Headless MediaFlow runner. Parses CLI (CLI11), loads a workflow JSON file
// and, depending on the flags:
// - prints the execution order (or the cycle, when asked to diagnose it)
// - prints the readiness report of every node
// - runs the workflow sequentially against a fixture back-end and prints
//   one line per node (text or NDJSON)
// - writes the updated workflow back out
#include "FixtureBackend.hpp"
#include "Log.hpp"
#include "MediaFlowCore.hpp"
#include "NodeValidation.hpp"
#include "PayloadNormalizer.hpp"
#include "WorkflowExecutor.hpp"
#include "WorkflowIO.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace {

// Long data URIs are unreadable on a terminal
std::string preview(const nlohmann::json& value, size_t maxLen = 96) {
    std::string s = value.is_string() ? value.get<std::string>() : MediaFlow::dumpText(value);
    if (s.size() > maxLen) s = s.substr(0, maxLen) + "...";
    return s;
}

void printOrder(const MediaFlow::Graph& graph, const std::vector<MediaFlow::NodeId>& order) {
    fmt::print("Execution order ({} nodes):\n", order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const auto* node = graph.findNode(order[i]);
        fmt::print("  {:>3}. {} ({})\n", i + 1, order[i], node ? node->type : "?");
    }
}

void printReadiness(const std::vector<MediaFlow::NodeReadiness>& issues) {
    if (issues.empty()) {
        fmt::print("All nodes ready.\n");
        return;
    }
    fmt::print("{} node(s) missing required inputs:\n", issues.size());
    for (const auto& r : issues) {
        for (const auto& m : r.missing) fmt::print("  {}: {} [{}]\n", r.nodeId, m.label, m.key);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string workflowPath;
    std::string fixturesPath;
    std::string exportPath;
    bool showOrder = false;
    bool showValidation = false;
    bool run = false;
    bool noPreflight = false;
    bool diagnoseCycles = false;
    bool ndjson = false;
    bool showStats = false;
    int stopAfter = 0;          // 0 = run to completion
    bool verbose = false;
    bool quiet = false;

    CLI::App app{"MediaFlow workflow runner"};
    try {
        app.add_option("--workflow", workflowPath, "Path to workflow JSON file")->required();
        app.add_flag("--order", showOrder, "Print the execution order");
        app.add_flag("--validate", showValidation, "Print missing required inputs per node");
        app.add_flag("--run", run, "Execute the workflow");
        app.add_option("--fixtures", fixturesPath, "JSON file mapping node id or node type to a raw generation result");
        app.add_flag("--no-preflight", noPreflight, "Validate nodes one by one while running instead of up front");
        app.add_option("--stop-after", stopAfter, "Stop the run after N nodes (0=off)");
        app.add_option("--export", exportPath, "Write the workflow (with published outputs) to this file");
        app.add_flag("--diagnose-cycles", diagnoseCycles, "On a cyclic graph, print the nodes of one cycle");
        app.add_flag("--ndjson", ndjson, "Print run results as NDJSON");
        app.add_flag("--stats", showStats, "Print run counters after the run");
        app.add_flag("--verbose", verbose, "Debug logging");
        app.add_flag("--quiet", quiet, "Errors only");
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (verbose) MediaFlow::log::setLevel(MediaFlow::log::Level::Debug);
    else if (quiet) MediaFlow::log::setLevel(MediaFlow::log::Level::Error);
    // Nothing selected: behave like --order --validate
    if (!showOrder && !showValidation && !run) showOrder = showValidation = true;

    MediaFlow::Graph graph;
    try {
        graph = MediaFlow::loadWorkflowFile(workflowPath);
    } catch (const std::exception& e) {
        MediaFlow::log::error("{}", e.what());
        return 2;
    }

    int exitCode = 0;
    std::vector<MediaFlow::NodeId> order;
    try {
        order = MediaFlow::topologicalOrder(graph.nodes, graph.edges);
    } catch (const MediaFlow::CycleDetected& e) {
        MediaFlow::log::error("{}", e.what());
        if (diagnoseCycles) {
            auto cycle = MediaFlow::findCycle(graph.nodes, graph.edges);
            std::string path;
            for (const auto& id : cycle) path += id + " -> ";
            if (!cycle.empty()) path += cycle.front();
            fmt::print("Cycle: {}\n", path);
        }
        return 1;
    }
    if (showOrder) printOrder(graph, order);

    if (showValidation) {
        auto issues = MediaFlow::preflight(graph);
        printReadiness(issues);
        if (!issues.empty() && !run) exitCode = 1;
    }

    if (run) {
        std::unique_ptr<MediaFlow::FixtureBackend> backend;
        try {
            if (!fixturesPath.empty()) {
                backend = std::make_unique<MediaFlow::FixtureBackend>(MediaFlow::FixtureBackend::fromFile(fixturesPath));
            }
        } catch (const std::exception& e) {
            MediaFlow::log::error("{}", e.what());
            return 2;
        }

        MediaFlow::WorkflowExecutor executor(backend.get());
        MediaFlow::ExecutionOptions options;
        options.preflight = !noPreflight;
        int started = 0;
        options.shouldStop = [&]() { return stopAfter > 0 && started >= stopAfter; };
        options.onNodeStart = [&](const MediaFlow::NodeId& id) {
            ++started;
            MediaFlow::log::info("[{}/{}] {}", started, order.size(), id);
        };

        std::vector<MediaFlow::ExecutionResult> results;
        try {
            results = executor.run(graph, options);
        } catch (const MediaFlow::MissingRequiredInput& e) {
            MediaFlow::log::error("{}", e.what());
            printReadiness(e.issues());
            return 1;
        }

        for (const auto& r : results) {
            if (!r.success) exitCode = 1;
            if (ndjson) {
                nlohmann::json line = {{"type", "result"}, {"nodeId", r.nodeId}, {"success", r.success},
                                       {"skipped", r.skipped}, {"output", r.output}, {"outputs", r.outputs}};
                if (!r.error.empty()) line["error"] = r.error;
                fmt::print("{}\n", MediaFlow::dumpText(line));
            } else if (r.success) {
                fmt::print("{:<16} {} {}\n", r.nodeId, r.skipped ? "SKIP" : "OK  ", preview(r.output));
            } else {
                fmt::print("{:<16} FAIL {}\n", r.nodeId, r.error);
            }
        }
        if (showStats) {
            auto s = executor.getAndResetRunStats();
            fmt::print("{{\"type\":\"stats\",\"nodesExecuted\":{},\"nodesSkipped\":{},\"nodesFailed\":{},\"runTimeNsAccum\":{}}}\n",
                       s.nodesExecuted, s.nodesSkipped, s.nodesFailed, s.runTimeNsAccum);
        }
    }

    if (!exportPath.empty()) {
        try {
            MediaFlow::saveWorkflowFile(exportPath, graph);
        } catch (const std::exception& e) {
            MediaFlow::log::error("{}", e.what());
            return 2;
        }
    }
    return exitCode;
}
