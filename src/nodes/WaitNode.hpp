#pragma once

#include "engine/NodeHandler.hpp"
#include "engine/NodeHandlerRegistry.hpp"

namespace automflow {
namespace nodes {

void registerWaitNode(engine::NodeHandlerRegistry& registry);

/**
 * wait - pause or block until a condition holds
 *
 * data.pause = true suspends the execution (wait-pause) until it is continued.
 * Batch members are not interactive: the pause is logged and skipped.
 *
 * Otherwise data.waitType selects the wait:
 *   timeout       data.value milliseconds
 *   selector      data.value visible (selectorType css|xpath), data.timeout
 *   url           current URL matches data.value, data.timeout
 *   condition     script data.value evaluates truthy, data.timeout
 *   api-response  the response stored under apiWaitConfig.contextKey passes
 *                 a status | header | body-path | body-value check
 *
 * The wait runs inside RetryHelper. Only selector, url and condition waits
 * need a page.
 */
class WaitNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "flow"; }

private:
    static void waitOnce(const workflow::Node& node, engine::ExecutionContext& context);
    static void checkApiResponse(const workflow::Node& node, const engine::ExecutionContext& context);
};

} // namespace nodes
} // namespace automflow
