#pragma once

#include "workflow/Workflow.hpp"
#include <optional>
#include <string>
#include <vector>

namespace automflow {
namespace workflow {

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

/**
 * Structural analysis of a workflow: validation and control-flow ordering
 *
 * Only driver edges create ordering dependencies. Property-input edges carry
 * values and never influence the order.
 */
class WorkflowParser {
public:
    explicit WorkflowParser(const Workflow& workflow);

    /**
     * Check that the workflow can run:
     *   - a start node exists
     *   - driver edges contain no cycle
     *   - no node other than start has more than one incoming driver edge
     */
    ValidationResult validate() const;

    /**
     * Dependency-first ordering, beginning at the start node and then covering
     * every remaining node in declaration order.
     * Throws std::runtime_error if there is no start node or on a cycle.
     */
    std::vector<std::string> getExecutionOrder() const;

    /**
     * Same ordering without requiring a start node (used for reusable sub-flows,
     * whose roots are the nodes with no incoming driver edge inside the flow)
     */
    std::vector<std::string> getSubflowOrder() const;

    /**
     * Every node reachable from nodeId through driver edges, nodeId excluded
     */
    std::vector<std::string> getDriverDescendants(const std::string& nodeId) const;

    std::optional<std::string> getStartNodeId() const { return m_startNodeId; }

private:
    std::vector<std::string> orderFrom(const std::vector<std::string>& seeds) const;
    std::vector<std::string> driverDependencies(const std::string& nodeId) const;

    const Workflow& m_workflow;
    std::optional<std::string> m_startNodeId;
};

} // namespace workflow
} // namespace automflow
