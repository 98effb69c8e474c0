#include "workflow/Workflow.hpp"
#include <stdexcept>

namespace automflow {
namespace workflow {

bool NodeTypes::isValueNode(const std::string& type) {
    return type == IntValue || type == StringValue || type == BooleanValue;
}

// =============================================================================
// Node / Edge
// =============================================================================

bool Node::flag(const std::string& key) const {
    auto it = data.find(key);
    return it != data.end() && it->is_boolean() && it->get<bool>();
}

std::string Node::stringField(const std::string& key, const std::string& fallback) const {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool Edge::isDriver() const {
    bool sourceOk = sourceHandle.empty() || sourceHandle == "output" || sourceHandle == "driver";
    bool targetOk = targetHandle.empty() || targetHandle == "driver" || targetHandle == "input";
    return sourceOk && targetOk;
}

bool Edge::isPropertyInput() const {
    static const std::string suffix = "-input";
    return targetHandle.size() > suffix.size() &&
           targetHandle.compare(targetHandle.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Edge::propertyName() const {
    if (!isPropertyInput()) return "";
    return targetHandle.substr(0, targetHandle.size() - 6);
}

// =============================================================================
// Workflow
// =============================================================================

void Workflow::addNode(Node node) {
    if (node.id.empty()) {
        throw std::invalid_argument("Node id cannot be empty");
    }
    if (m_index.count(node.id)) {
        throw std::invalid_argument("Duplicate node id: " + node.id);
    }
    if (!node.data.is_object()) {
        node.data = json::object();
    }
    m_index[node.id] = m_nodes.size();
    m_nodes.push_back(std::move(node));
}

const Node* Workflow::getNode(const std::string& nodeId) const {
    auto it = m_index.find(nodeId);
    return it != m_index.end() ? &m_nodes[it->second] : nullptr;
}

Node* Workflow::getNode(const std::string& nodeId) {
    auto it = m_index.find(nodeId);
    return it != m_index.end() ? &m_nodes[it->second] : nullptr;
}

bool Workflow::hasNode(const std::string& nodeId) const {
    return m_index.count(nodeId) > 0;
}

void Workflow::addEdge(Edge edge) {
    if (edge.id.empty()) {
        edge.id = "e_" + edge.source + "_" + edge.target +
                  (edge.targetHandle.empty() ? "" : "_" + edge.targetHandle);
    }
    m_edges.push_back(std::move(edge));
}

void Workflow::connect(const std::string& source, const std::string& target) {
    Edge edge;
    edge.source = source;
    edge.target = target;
    addEdge(std::move(edge));
}

std::vector<const Edge*> Workflow::outgoingDriverEdges(const std::string& nodeId) const {
    std::vector<const Edge*> result;
    for (const auto& edge : m_edges) {
        if (edge.source == nodeId && edge.isDriver()) {
            result.push_back(&edge);
        }
    }
    return result;
}

std::vector<const Edge*> Workflow::incomingDriverEdges(const std::string& nodeId) const {
    std::vector<const Edge*> result;
    for (const auto& edge : m_edges) {
        if (edge.target == nodeId && edge.isDriver()) {
            result.push_back(&edge);
        }
    }
    return result;
}

std::vector<const Edge*> Workflow::incomingEdges(const std::string& nodeId) const {
    std::vector<const Edge*> result;
    for (const auto& edge : m_edges) {
        if (edge.target == nodeId) {
            result.push_back(&edge);
        }
    }
    return result;
}

const Node* Workflow::findStartNode() const {
    for (const auto& node : m_nodes) {
        if (node.type == NodeTypes::Start) {
            return &node;
        }
    }
    return nullptr;
}

} // namespace workflow
} // namespace automflow
