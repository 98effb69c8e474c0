#pragma once

#include "engine/ExecutionManager.hpp"
#include "engine/NodeHandlerRegistry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <utility>

namespace automflow {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/// Decoded query string parameters
using QueryParams = std::map<std::string, std::string>;

/**
 * Gestionnaire de requêtes - business side of the HTTP API
 *
 * Translates JSON request bodies into ExecutionManager calls and results back
 * into JSON. Successful bodies carry "status":"ok", failures
 * {"status":"error","message":...} with a 4xx/5xx code.
 */
class RequestHandler {
public:
    RequestHandler(engine::ExecutionManager& manager, const engine::NodeHandlerRegistry& registry);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // Handlers pour les endpoints généraux
    RouteResult handleHealth() const;
    RouteResult handleListNodes() const;

    // Single run
    RouteResult handleExecute(const json& request);
    RouteResult handleExecutionStatus(const std::string& executionId);
    RouteResult handleLatestExecutionStatus();
    RouteResult handleStopExecution(const std::string& executionId);

    /**
     * {action: continue | stop | skip | continueWithoutBreakpoint}
     */
    RouteResult handlePauseControl(const std::string& executionId, const json& request);

    RouteResult handleActiveExecutions();

    // Batches

    /**
     * One of {workflows:[...]}, {files:[...]} or {folderPath, recursive},
     * plus optional workers, priority, outputPath, traceLogs
     */
    RouteResult handleBatchExecute(const json& request);
    RouteResult handleBatchStatus(const std::string& batchId);
    RouteResult handleBatchExecutions(const std::string& batchId);
    RouteResult handleStopBatch(const std::string& batchId);
    RouteResult handleStopAll();

    /**
     * Query: status, limit (default 50), offset
     */
    RouteResult handleListBatches(const QueryParams& query);

    static RouteResult error(unsigned code, const std::string& message);

    /**
     * Split "/path?a=1&b=x%20y" into its path and decoded parameters
     */
    static std::string splitTarget(const std::string& target, QueryParams& query);

private:
    engine::ExecutionManager& m_manager;
    const engine::NodeHandlerRegistry& m_registry;
    std::chrono::steady_clock::time_point m_startTime;
};

} // namespace server
} // namespace automflow
