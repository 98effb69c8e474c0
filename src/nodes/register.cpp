#include "nodes/register.hpp"
#include "nodes/BrowserNodes.hpp"
#include "nodes/FlowNodes.hpp"
#include "nodes/WaitNode.hpp"

namespace automflow {
namespace nodes {

void registerBuiltinNodes(engine::NodeHandlerRegistry& registry) {
    registerFlowNodes(registry);
    registerBrowserNodes(registry);
    registerWaitNode(registry);
}

} // namespace nodes
} // namespace automflow
