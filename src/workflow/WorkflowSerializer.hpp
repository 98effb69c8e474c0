#pragma once

#include "workflow/Workflow.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace automflow {
namespace workflow {

/**
 * Serialization/Deserialization for Workflow
 *
 * JSON format (editor export):
 * {
 *   "nodes": [
 *     {"id": "n1", "type": "navigation", "position": {"x": 0, "y": 0}, "data": {"url": "..."}}
 *   ],
 *   "edges": [
 *     {"id": "e1", "source": "n1", "target": "n2", "sourceHandle": "output", "targetHandle": "input"}
 *   ]
 * }
 */
class WorkflowSerializer {
public:
    // === Serialization ===

    static json toJson(const Workflow& workflow);
    static std::string toString(const Workflow& workflow, int indent = 2);

    // === Deserialization ===

    /**
     * Create a Workflow from JSON
     * Throws std::runtime_error on malformed nodes or edges
     */
    static Workflow fromJson(const json& j);
    static Workflow fromString(const std::string& str);

    /**
     * Read and parse a workflow file
     */
    static Workflow fromFile(const std::string& path);

private:
    static json nodeToJson(const Node& node);
    static json edgeToJson(const Edge& edge);
    static Node jsonToNode(const json& j);
    static Edge jsonToEdge(const json& j);
};

} // namespace workflow
} // namespace automflow
