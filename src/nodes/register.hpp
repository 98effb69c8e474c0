#pragma once

#include "engine/NodeHandlerRegistry.hpp"

namespace automflow {
namespace nodes {

/**
 * Register every built-in node handler
 */
void registerBuiltinNodes(engine::NodeHandlerRegistry& registry);

} // namespace nodes
} // namespace automflow
