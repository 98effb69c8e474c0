#include "workflow/ReusableScope.hpp"
#include <functional>

namespace automflow {
namespace workflow {

NodeIdSet ReusableScope::getScope(const Workflow& workflow, const std::string& entryNodeId) {
    NodeIdSet scope;
    const Node* entry = workflow.getNode(entryNodeId);
    if (!entry || entry->type != NodeTypes::Reusable) {
        return scope;
    }

    NodeIdSet visited;
    int nestedDepth = 0;

    std::function<void(const std::string&)> traverse = [&](const std::string& nodeId) {
        if (!visited.insert(nodeId).second) {
            return;
        }
        const Node* node = workflow.getNode(nodeId);
        if (!node) {
            return;
        }

        if (nodeId != entryNodeId) {
            if (node->type == NodeTypes::Reusable) {
                ++nestedDepth;
            } else if (node->type == NodeTypes::ReusableEnd) {
                scope.insert(nodeId);
                if (nestedDepth == 0) {
                    return;  // closes our scope
                }
                --nestedDepth;
            }
            scope.insert(nodeId);
        }

        for (const auto* edge : workflow.outgoingDriverEdges(nodeId)) {
            traverse(edge->target);
        }
    };

    traverse(entryNodeId);
    return scope;
}

std::optional<Workflow> ReusableScope::extract(const Workflow& workflow, const std::string& entryNodeId) {
    const Node* entry = workflow.getNode(entryNodeId);
    if (!entry || entry->type != NodeTypes::Reusable) {
        return std::nullopt;
    }

    Workflow result;
    if (workflow.outgoingDriverEdges(entryNodeId).empty()) {
        return result;
    }

    NodeIdSet scope = getScope(workflow, entryNodeId);
    for (const auto& node : workflow.getNodes()) {
        if (scope.count(node.id)) {
            result.addNode(node);
        }
    }
    for (const auto& edge : workflow.getEdges()) {
        if (scope.count(edge.target)) {
            result.addEdge(edge);
        }
    }
    return result;
}

std::optional<std::string> ReusableScope::findByContext(const Workflow& workflow, const std::string& contextName) {
    for (const auto& node : workflow.getNodes()) {
        if (node.type == NodeTypes::Reusable && node.stringField("contextName") == contextName) {
            return node.id;
        }
    }
    return std::nullopt;
}

NodeIdSet ReusableScope::getAllScopedNodes(const Workflow& workflow) {
    NodeIdSet all;
    for (const auto& node : workflow.getNodes()) {
        if (node.type == NodeTypes::Reusable) {
            all.insert(node.id);
            NodeIdSet scope = getScope(workflow, node.id);
            all.insert(scope.begin(), scope.end());
        }
    }
    return all;
}

} // namespace workflow
} // namespace automflow
