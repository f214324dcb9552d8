// FixtureBackend.cpp
#include "FixtureBackend.hpp"
#include "Log.hpp"
#include <fstream>

namespace MediaFlow {

FixtureBackend FixtureBackend::fromFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Could not find fixtures file: " + path);
    nlohmann::json doc;
    try {
        f >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid fixtures file " + path + ": " + e.what());
    }
    if (!doc.is_object()) throw std::runtime_error("Invalid fixtures file " + path + ": expected an object");
    return FixtureBackend(std::move(doc));
}

nlohmann::json FixtureBackend::generate(const Node& node, const GenerationRequest& request) {
    callLog.emplace_back(node.id, request);
    for (const std::string& key : {node.id, node.type}) {
        auto it = fixtures.find(key);
        if (it != fixtures.end()) {
            log::debug("fixture for '{}' matched by key '{}'", node.id, key);
            return *it;
        }
    }
    throw GenerationError("no fixture for node '" + node.id + "' (" + node.type + ")");
}

} // namespace MediaFlow
