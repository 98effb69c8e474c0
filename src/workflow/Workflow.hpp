#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace automflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Built-in node type tags
 */
namespace NodeTypes {
    inline const std::string Start = "start";
    inline const std::string OpenBrowser = "openBrowser";
    inline const std::string Navigation = "navigation";
    inline const std::string Wait = "wait";
    inline const std::string Loop = "loop";
    inline const std::string SetVariable = "setVariable";
    inline const std::string IntValue = "intValue";
    inline const std::string StringValue = "stringValue";
    inline const std::string BooleanValue = "booleanValue";
    inline const std::string Reusable = "reusable.reusable";
    inline const std::string ReusableEnd = "reusable.end";
    inline const std::string RunReusable = "reusable.runReusable";

    /// Value nodes publish a variable under their own id and feed property inputs
    bool isValueNode(const std::string& type);
}

/**
 * A step of a workflow graph
 */
struct Node {
    std::string id;
    std::string type;
    std::optional<std::pair<double, double>> position;  // [x, y] for the editor
    json data = json::object();

    /// True when data[key] is the boolean true
    bool flag(const std::string& key) const;

    /// data[key] as string, or fallback if absent / not a string
    std::string stringField(const std::string& key, const std::string& fallback = "") const;
};

/**
 * Directed edge between two nodes
 *
 * An edge is control flow ("driver") when its handles are absent or one of the
 * driver handle names. A targetHandle ending in "-input" wires a node property.
 */
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    std::string sourceHandle;  // empty = none
    std::string targetHandle;  // empty = none

    bool isDriver() const;
    bool isPropertyInput() const;

    /// "url-input" -> "url", empty if not a property input
    std::string propertyName() const;
};

/**
 * A workflow graph: nodes in declaration order and edges
 */
class Workflow {
public:
    Workflow() = default;

    // === Node Management ===

    /**
     * Add a node. Throws if a node with the same id already exists
     */
    void addNode(Node node);

    const Node* getNode(const std::string& nodeId) const;
    Node* getNode(const std::string& nodeId);
    bool hasNode(const std::string& nodeId) const;

    // === Edge Management ===

    void addEdge(Edge edge);

    /**
     * Convenience for tests and builders: adds a driver edge source -> target
     */
    void connect(const std::string& source, const std::string& target);

    // === Queries ===

    std::vector<const Edge*> outgoingDriverEdges(const std::string& nodeId) const;
    std::vector<const Edge*> incomingDriverEdges(const std::string& nodeId) const;
    std::vector<const Edge*> incomingEdges(const std::string& nodeId) const;

    /**
     * Find the first node of type "start", nullptr if none
     */
    const Node* findStartNode() const;

    // === Getters ===

    const std::vector<Node>& getNodes() const { return m_nodes; }
    const std::vector<Edge>& getEdges() const { return m_edges; }
    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const { return m_edges.size(); }
    bool empty() const { return m_nodes.empty(); }

private:
    std::vector<Node> m_nodes;
    std::unordered_map<std::string, size_t> m_index;
    std::vector<Edge> m_edges;
};

} // namespace workflow
} // namespace automflow
