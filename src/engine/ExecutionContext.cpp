#include "engine/ExecutionContext.hpp"
#include "server/Logger.hpp"
#include <thread>

namespace automflow {
namespace engine {

json ExecutionContext::getData(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_data.find(key);
    return it != m_data.end() ? *it : json();
}

void ExecutionContext::setData(const std::string& key, json value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data[key] = std::move(value);
}

bool ExecutionContext::hasData(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.contains(key);
}

void ExecutionContext::removeData(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.erase(key);
}

json ExecutionContext::getAllData() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data;
}

json ExecutionContext::getVariable(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_variables.find(key);
    return it != m_variables.end() ? *it : json();
}

void ExecutionContext::setVariable(const std::string& key, json value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_variables[key] = std::move(value);
}

bool ExecutionContext::hasVariable(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_variables.contains(key);
}

json ExecutionContext::getAllVariables() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_variables;
}

BrowserDriverPtr ExecutionContext::getPage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_page;
}

void ExecutionContext::setPage(BrowserDriverPtr page) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_page = std::move(page);
}

bool ExecutionContext::sleepFor(std::chrono::milliseconds duration) const {
    if (m_control) {
        return m_control->sleepFor(duration);
    }
    std::this_thread::sleep_for(duration);
    return true;
}

void ExecutionContext::throwIfStopped() const {
    if (m_control && m_control->isStopRequested()) {
        throw ExecutionStopped();
    }
}

void ExecutionContext::closePage() {
    BrowserDriverPtr page;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        page = std::move(m_page);
        m_page.reset();
    }

    if (page) {
        try {
            page->close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Failed to close browser page: ") + e.what());
        }
    }
}

} // namespace engine
} // namespace automflow
