#pragma once

#include "workflow/Workflow.hpp"
#include <optional>
#include <string>
#include <unordered_set>

namespace automflow {
namespace workflow {

using NodeIdSet = std::unordered_set<std::string>;

/**
 * Reusable sub-flow analysis
 *
 * A reusable scope starts at a "reusable.reusable" entry node and follows driver
 * edges until the matching "reusable.end" terminator. Entries met on the way
 * open nested scopes, and each nested terminator closes one level without
 * ending the outer scope.
 *
 *   R1 -> A -> R2 -> B -> End2 -> C -> End1
 *   getScope(R1) = {A, R2, B, End2, C, End1}
 */
class ReusableScope {
public:
    /**
     * Node ids belonging to the scope of entryNodeId. The entry itself is not part
     * of the scope, the terminator is. Empty if entryNodeId is not a reusable entry.
     */
    static NodeIdSet getScope(const Workflow& workflow, const std::string& entryNodeId);

    /**
     * Sub-workflow restricted to the scope. Keeps every edge whose target lies in
     * scope, including property-input edges coming from outside nodes.
     * Returns nullopt if entryNodeId is not a reusable entry, and an empty
     * workflow if nothing is connected to the entry.
     */
    static std::optional<Workflow> extract(const Workflow& workflow, const std::string& entryNodeId);

    /**
     * Id of the reusable entry whose data.contextName matches, nullopt if none
     */
    static std::optional<std::string> findByContext(const Workflow& workflow, const std::string& contextName);

    /**
     * Union of every reusable scope in the workflow, entry nodes included.
     * These nodes run only through a runReusable node.
     */
    static NodeIdSet getAllScopedNodes(const Workflow& workflow);
};

} // namespace workflow
} // namespace automflow
