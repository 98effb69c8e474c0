#pragma once

#include "engine/NodeHandler.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace automflow {
namespace engine {

/**
 * Maps node type tags to their handler
 *
 * Populated once at startup (built-ins, then plugin types), then only read
 * by concurrently running executors.
 *
 * Usage:
 *   NodeHandlerRegistry registry;
 *   nodes::registerBuiltinNodes(registry);
 *   auto handler = registry.getHandler("navigation");
 */
class NodeHandlerRegistry {
public:
    NodeHandlerRegistry() = default;

    // Non-copyable
    NodeHandlerRegistry(const NodeHandlerRegistry&) = delete;
    NodeHandlerRegistry& operator=(const NodeHandlerRegistry&) = delete;

    // === Registration ===

    /**
     * Register a handler for a type tag
     * Overwrites if the type is already registered
     */
    void registerHandler(const std::string& type, NodeHandlerPtr handler);

    void unregisterHandler(const std::string& type);

    // === Lookup ===

    /**
     * Get the handler for a type tag, nullptr if not found.
     * "category/type" tags fall back to the part after '/'.
     */
    NodeHandlerPtr getHandler(const std::string& type) const;

    bool hasHandler(const std::string& type) const;

    // === Enumeration ===

    /**
     * All registered type tags, sorted
     */
    std::vector<std::string> getTypes() const;

    std::vector<std::string> getCategories() const;

    size_t size() const { return m_handlers.size(); }

    void clear();

private:
    std::unordered_map<std::string, NodeHandlerPtr> m_handlers;
};

} // namespace engine
} // namespace automflow
