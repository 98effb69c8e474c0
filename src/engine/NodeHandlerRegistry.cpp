#include "engine/NodeHandlerRegistry.hpp"
#include <algorithm>
#include <set>

namespace automflow {
namespace engine {

void NodeHandlerRegistry::registerHandler(const std::string& type, NodeHandlerPtr handler) {
    if (!type.empty() && handler) {
        m_handlers[type] = std::move(handler);
    }
}

void NodeHandlerRegistry::unregisterHandler(const std::string& type) {
    m_handlers.erase(type);
}

NodeHandlerPtr NodeHandlerRegistry::getHandler(const std::string& type) const {
    auto it = m_handlers.find(type);
    if (it != m_handlers.end()) {
        return it->second;
    }

    // Plugin manifests may prefix types with their package ("my-plugin/myNode")
    size_t slashPos = type.find('/');
    if (slashPos != std::string::npos) {
        it = m_handlers.find(type.substr(slashPos + 1));
        if (it != m_handlers.end()) {
            return it->second;
        }
    }

    return nullptr;
}

bool NodeHandlerRegistry::hasHandler(const std::string& type) const {
    return getHandler(type) != nullptr;
}

std::vector<std::string> NodeHandlerRegistry::getTypes() const {
    std::vector<std::string> types;
    types.reserve(m_handlers.size());
    for (const auto& [type, handler] : m_handlers) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::vector<std::string> NodeHandlerRegistry::getCategories() const {
    std::set<std::string> categories;
    for (const auto& [type, handler] : m_handlers) {
        categories.insert(handler->category());
    }
    return std::vector<std::string>(categories.begin(), categories.end());
}

void NodeHandlerRegistry::clear() {
    m_handlers.clear();
}

} // namespace engine
} // namespace automflow
