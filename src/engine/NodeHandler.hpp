#pragma once

#include "engine/ExecutionContext.hpp"
#include "workflow/Workflow.hpp"
#include <memory>
#include <string>

namespace automflow {
namespace engine {

/**
 * Executes one node type
 *
 * Handlers read their configuration from node.data (interpolated through the
 * context), wrap their main action in RetryHelper when retry is enabled, run
 * WaitHelper before or after the action per waitAfterOperation, and throw
 * std::runtime_error with a descriptive message on failure.
 */
class NodeHandler {
public:
    virtual ~NodeHandler() = default;

    virtual void execute(const workflow::Node& node, ExecutionContext& context) = 0;

    /**
     * Category shown by GET /api/nodes
     */
    virtual std::string category() const { return "general"; }
};

using NodeHandlerPtr = std::shared_ptr<NodeHandler>;

} // namespace engine
} // namespace automflow
