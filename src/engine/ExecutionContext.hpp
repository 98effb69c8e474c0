#pragma once

#include "engine/BrowserDriver.hpp"
#include "engine/ExecutionControl.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace automflow {
namespace engine {

using json = nlohmann::json;

/**
 * Per-execution state shared by every node handler
 *
 * - data: execution-scoped key/value store (API responses, loop arrays...)
 * - variables: graph-scoped bindings, addressed by node id or a user name
 * - page: the active browser driver, absent until an openBrowser node runs
 *
 * Wait checks may read the context from several threads, all accessors lock.
 */
class ExecutionContext {
public:
    ExecutionContext() = default;

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // === Data ===

    /**
     * Value stored under key, null if absent
     */
    json getData(const std::string& key) const;
    void setData(const std::string& key, json value);
    bool hasData(const std::string& key) const;
    void removeData(const std::string& key);
    json getAllData() const;

    // === Variables ===

    json getVariable(const std::string& key) const;
    void setVariable(const std::string& key, json value);
    bool hasVariable(const std::string& key) const;
    json getAllVariables() const;

    // === Browser ===

    BrowserDriverPtr getPage() const;
    void setPage(BrowserDriverPtr page);

    /**
     * Factory used by openBrowser to create the page (may be empty)
     */
    const DriverFactory& getDriverFactory() const { return m_driverFactory; }
    void setDriverFactory(DriverFactory factory) { m_driverFactory = std::move(factory); }

    // === Executor control ===

    ExecutionControl* control() const { return m_control; }
    void setControl(ExecutionControl* control) { m_control = control; }

    /**
     * Sleep through the executor control when present (stop-aware).
     * Returns false if interrupted by a stop.
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

    /**
     * Throw ExecutionStopped if the owning execution has been stopped
     */
    void throwIfStopped() const;

    /**
     * Close and drop the page, keeping data and variables
     */
    void closePage();

private:
    mutable std::mutex m_mutex;
    json m_data = json::object();
    json m_variables = json::object();
    BrowserDriverPtr m_page;
    DriverFactory m_driverFactory;
    ExecutionControl* m_control = nullptr;
};

} // namespace engine
} // namespace automflow
