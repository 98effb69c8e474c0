#include "workflow/WorkflowParser.hpp"
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace automflow {
namespace workflow {

WorkflowParser::WorkflowParser(const Workflow& workflow)
    : m_workflow(workflow)
{
    if (const auto* start = workflow.findStartNode()) {
        m_startNodeId = start->id;
    }
}

std::vector<std::string> WorkflowParser::driverDependencies(const std::string& nodeId) const {
    std::vector<std::string> deps;
    for (const auto* edge : m_workflow.incomingDriverEdges(nodeId)) {
        // Edges from outside a sub-flow (e.g. the reusable entry) are not dependencies
        if (m_workflow.hasNode(edge->source)) {
            deps.push_back(edge->source);
        }
    }
    return deps;
}

std::vector<std::string> WorkflowParser::orderFrom(const std::vector<std::string>& seeds) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> visiting;

    std::function<void(const std::string&)> visit = [&](const std::string& nodeId) {
        if (visiting.count(nodeId)) {
            throw std::runtime_error("Circular dependency detected involving node: " + nodeId);
        }
        if (visited.count(nodeId) || !m_workflow.hasNode(nodeId)) {
            return;
        }

        visiting.insert(nodeId);
        for (const auto& dep : driverDependencies(nodeId)) {
            visit(dep);
        }
        visiting.erase(nodeId);

        visited.insert(nodeId);
        result.push_back(nodeId);
    };

    for (const auto& seed : seeds) {
        visit(seed);
    }
    for (const auto& node : m_workflow.getNodes()) {
        visit(node.id);
    }
    return result;
}

std::vector<std::string> WorkflowParser::getExecutionOrder() const {
    if (!m_startNodeId) {
        throw std::runtime_error("No start node found in workflow");
    }
    return orderFrom({*m_startNodeId});
}

std::vector<std::string> WorkflowParser::getSubflowOrder() const {
    std::vector<std::string> roots;
    for (const auto& node : m_workflow.getNodes()) {
        if (driverDependencies(node.id).empty()) {
            roots.push_back(node.id);
        }
    }
    return orderFrom(roots);
}

std::vector<std::string> WorkflowParser::getDriverDescendants(const std::string& nodeId) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen{nodeId};
    std::vector<std::string> stack{nodeId};

    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();
        for (const auto* edge : m_workflow.outgoingDriverEdges(current)) {
            if (seen.insert(edge->target).second && m_workflow.hasNode(edge->target)) {
                result.push_back(edge->target);
                stack.push_back(edge->target);
            }
        }
    }
    return result;
}

ValidationResult WorkflowParser::validate() const {
    ValidationResult result;

    if (!m_startNodeId) {
        result.errors.push_back("Workflow must contain a Start node");
    } else {
        try {
            getExecutionOrder();
        } catch (const std::runtime_error& e) {
            result.errors.push_back(e.what());
        }
    }

    std::unordered_map<std::string, int> driverInputs;
    for (const auto& edge : m_workflow.getEdges()) {
        if (!m_workflow.hasNode(edge.source) || !m_workflow.hasNode(edge.target)) {
            result.errors.push_back("Edge " + edge.id + " references an unknown node");
            continue;
        }
        if (edge.isDriver()) {
            ++driverInputs[edge.target];
        }
    }

    // Keep error order stable: follow node declaration order
    for (const auto& node : m_workflow.getNodes()) {
        auto it = driverInputs.find(node.id);
        if (it != driverInputs.end() && it->second > 1 && node.type != NodeTypes::Start) {
            result.errors.push_back("Node " + node.id + " has multiple input connections (only one allowed)");
        }
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace workflow
} // namespace automflow
