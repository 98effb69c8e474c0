#include "workflow/WorkflowSerializer.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace automflow {
namespace workflow {

// =============================================================================
// Serialization
// =============================================================================

json WorkflowSerializer::toJson(const Workflow& workflow) {
    json result;

    json nodesArray = json::array();
    for (const auto& node : workflow.getNodes()) {
        nodesArray.push_back(nodeToJson(node));
    }
    result["nodes"] = nodesArray;

    json edgesArray = json::array();
    for (const auto& edge : workflow.getEdges()) {
        edgesArray.push_back(edgeToJson(edge));
    }
    result["edges"] = edgesArray;

    return result;
}

std::string WorkflowSerializer::toString(const Workflow& workflow, int indent) {
    return toJson(workflow).dump(indent);
}

json WorkflowSerializer::nodeToJson(const Node& node) {
    json j;
    j["id"] = node.id;
    j["type"] = node.type;
    if (node.position) {
        j["position"] = {{"x", node.position->first}, {"y", node.position->second}};
    }
    j["data"] = node.data;
    return j;
}

json WorkflowSerializer::edgeToJson(const Edge& edge) {
    json j;
    j["id"] = edge.id;
    j["source"] = edge.source;
    j["target"] = edge.target;
    if (!edge.sourceHandle.empty()) {
        j["sourceHandle"] = edge.sourceHandle;
    }
    if (!edge.targetHandle.empty()) {
        j["targetHandle"] = edge.targetHandle;
    }
    return j;
}

// =============================================================================
// Deserialization
// =============================================================================

Workflow WorkflowSerializer::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid workflow: expected a JSON object");
    }
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        throw std::runtime_error("Invalid workflow: missing 'nodes' array");
    }
    if (!j.contains("edges") || !j["edges"].is_array()) {
        throw std::runtime_error("Invalid workflow: missing 'edges' array");
    }

    Workflow workflow;
    for (const auto& nodeJson : j["nodes"]) {
        try {
            workflow.addNode(jsonToNode(nodeJson));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid node: ") + e.what());
        }
    }
    for (const auto& edgeJson : j["edges"]) {
        workflow.addEdge(jsonToEdge(edgeJson));
    }
    return workflow;
}

Workflow WorkflowSerializer::fromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid workflow JSON: " + std::string(e.what()));
    }
    return fromJson(j);
}

Workflow WorkflowSerializer::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open workflow file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str());
}

Node WorkflowSerializer::jsonToNode(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("type")) {
        throw std::runtime_error("Invalid node: missing 'id' or 'type'");
    }
    if (!j["id"].is_string() || !j["type"].is_string()) {
        throw std::runtime_error("Invalid node: 'id' and 'type' must be strings");
    }

    Node node;
    node.id = j["id"].get<std::string>();
    node.type = j["type"].get<std::string>();

    if (j.contains("position") && j["position"].is_object()) {
        const auto& pos = j["position"];
        node.position = std::make_pair(pos.value("x", 0.0), pos.value("y", 0.0));
    }

    if (j.contains("data") && j["data"].is_object()) {
        node.data = j["data"];
    }
    return node;
}

Edge WorkflowSerializer::jsonToEdge(const json& j) {
    if (!j.is_object() || !j.contains("source") || !j.contains("target")) {
        throw std::runtime_error("Invalid edge: missing 'source' or 'target'");
    }

    Edge edge;
    edge.id = j.value("id", "");
    edge.source = j["source"].get<std::string>();
    edge.target = j["target"].get<std::string>();

    // Editors export null handles, treat them as absent
    if (j.contains("sourceHandle") && j["sourceHandle"].is_string()) {
        edge.sourceHandle = j["sourceHandle"].get<std::string>();
    }
    if (j.contains("targetHandle") && j["targetHandle"].is_string()) {
        edge.targetHandle = j["targetHandle"].get<std::string>();
    }
    return edge;
}

} // namespace workflow
} // namespace automflow
