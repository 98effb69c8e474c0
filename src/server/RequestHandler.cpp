#include "server/RequestHandler.hpp"
#include "workflow/WorkflowScanner.hpp"
#include "workflow/WorkflowSerializer.hpp"
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

namespace automflow {
namespace server {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            out += ' ';
        } else if (text[i] == '%' && i + 2 < text.size()
                   && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

/**
 * JSON integer within [minValue, INT_MAX], nullopt for floats, strings or out of range values
 */
std::optional<int> boundedInt(const json& value, int64_t minValue) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    constexpr int64_t maxValue = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(maxValue) || static_cast<int64_t>(raw) < minValue) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    int64_t raw = value.get<int64_t>();
    if (raw < minValue || raw > maxValue) {
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

/**
 * Non-negative integer query parameter, fallback if absent or malformed
 */
int intParam(const QueryParams& query, const std::string& key, int fallback) {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) {
        return fallback;
    }
    for (char c : it->second) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid " + key + ": " + it->second);
        }
    }
    try {
        return std::stoi(it->second);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid " + key + ": " + it->second);
    }
}

json invalidEntriesJson(const std::vector<workflow::WorkflowEntry>& entries) {
    json invalid = json::array();
    for (const auto& entry : entries) {
        if (!entry.valid) {
            invalid.push_back({{"fileName", entry.fileName}, {"errors", entry.errors}});
        }
    }
    return invalid;
}

} // anonymous namespace

RequestHandler::RequestHandler(engine::ExecutionManager& manager, const engine::NodeHandlerRegistry& registry)
    : m_manager(manager)
    , m_registry(registry)
    , m_startTime(std::chrono::steady_clock::now())
{
}

RouteResult RequestHandler::error(unsigned code, const std::string& message) {
    return {code, json{{"status", "error"}, {"message", message}}};
}

std::string RequestHandler::splitTarget(const std::string& target, QueryParams& query) {
    size_t mark = target.find('?');
    if (mark == std::string::npos) {
        return target;
    }

    std::string rest = target.substr(mark + 1);
    size_t pos = 0;
    while (pos <= rest.size()) {
        size_t amp = rest.find('&', pos);
        if (amp == std::string::npos) amp = rest.size();
        std::string pair = rest.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            if (!key.empty()) query[key] = value;
        }
        pos = amp + 1;
    }
    return target.substr(0, mark);
}

// ============================================================
// General
// ============================================================

RouteResult RequestHandler::handleHealth() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - m_startTime).count();
    return {200, json{
        {"status", "ok"},
        {"service", "AutomFlowServer"},
        {"version", "1.0.0"},
        {"uptimeSeconds", uptime},
        {"activeWorkers", m_manager.activeWorkers()},
        {"maxWorkers", m_manager.getConfig().maxWorkers},
        {"queued", m_manager.queueSize()}
    }};
}

RouteResult RequestHandler::handleListNodes() const {
    json nodes = json::array();
    for (const auto& type : m_registry.getTypes()) {
        auto handler = m_registry.getHandler(type);
        nodes.push_back({{"type", type}, {"category", handler ? handler->category() : "general"}});
    }
    auto categorySet = m_registry.getCategories();
    std::vector<std::string> categories(categorySet.begin(), categorySet.end());
    return {200, json{{"status", "ok"}, {"nodes", nodes}, {"categories", categories}}};
}

// ============================================================
// Single run
// ============================================================

RouteResult RequestHandler::handleExecute(const json& request) {
    if (!request.is_object() || !request.contains("workflow") || !request["workflow"].is_object()) {
        return error(400, "Invalid workflow format");
    }

    workflow::Workflow parsed;
    try {
        parsed = workflow::WorkflowSerializer::fromJson(request["workflow"]);
    } catch (const std::exception& e) {
        return error(400, std::string("Invalid workflow format: ") + e.what());
    }

    engine::SingleRunOptions options;
    options.traceLogs = request.value("traceLogs", false);
    options.workflowFileName = request.value("workflowFileName", options.workflowFileName);
    if (request.contains("breakpointConfig") && request["breakpointConfig"].is_object()) {
        options.breakpoints = engine::BreakpointConfig::fromJson(request["breakpointConfig"]);
    }

    std::string executionId = m_manager.startSingle(std::move(parsed), options);
    return {200, json{{"status", "ok"}, {"executionId", executionId}}};
}

RouteResult RequestHandler::handleExecutionStatus(const std::string& executionId) {
    auto status = m_manager.getExecutionStatus(executionId);
    if (!status) {
        return error(404, "Execution not found: " + executionId);
    }
    return {200, json{{"status", "ok"}, {"execution", *status}}};
}

RouteResult RequestHandler::handleLatestExecutionStatus() {
    auto executionId = m_manager.getMostRecentExecutionId();
    if (!executionId) {
        return {200, json{{"status", "ok"}, {"execution", nullptr}}};
    }
    return handleExecutionStatus(*executionId);
}

RouteResult RequestHandler::handleStopExecution(const std::string& executionId) {
    auto result = m_manager.stopExecution(executionId);
    if (!result.found) {
        return error(404, "Execution not found: " + executionId);
    }
    json body = result.toJson();
    body["status"] = "ok";
    body["executionId"] = executionId;
    return {200, body};
}

RouteResult RequestHandler::handlePauseControl(const std::string& executionId, const json& request) {
    std::string action = request.is_object() ? request.value("action", std::string()) : std::string();
    if (action.empty()) {
        return error(400, "action is required");
    }

    bool applied = false;
    if (action == "continue") {
        applied = m_manager.continueExecution(executionId);
    } else if (action == "stop") {
        applied = m_manager.stopFromPause(executionId);
    } else if (action == "skip") {
        applied = m_manager.skipNext(executionId);
    } else if (action == "continueWithoutBreakpoint") {
        applied = m_manager.continueWithoutBreakpoint(executionId);
    } else {
        return error(400, "Invalid action: " + action);
    }

    if (!applied) {
        if (!m_manager.getExecutor(executionId)) {
            return error(404, "Execution not found: " + executionId);
        }
        return error(409, "Execution is not paused");
    }
    return {200, json{{"status", "ok"}, {"executionId", executionId}, {"action", action}}};
}

RouteResult RequestHandler::handleActiveExecutions() {
    json active = m_manager.getActiveExecutions();
    size_t count = active.size();
    return {200, json{{"status", "ok"}, {"executions", std::move(active)}, {"count", count}}};
}

// ============================================================
// Batches
// ============================================================

RouteResult RequestHandler::handleBatchExecute(const json& request) {
    if (!request.is_object()) {
        return error(400, "Request body must be a JSON object");
    }

    engine::BatchOptions options;
    std::vector<workflow::WorkflowEntry> entries;

    try {
        if (request.contains("workflows")) {
            if (!request["workflows"].is_array()) {
                return error(400, "workflows must be an array");
            }
            options.sourceType = "workflows";
            entries = workflow::WorkflowScanner::fromJsonArray(request["workflows"]);
        } else if (request.contains("files")) {
            if (!request["files"].is_array()) {
                return error(400, "files must be an array");
            }
            options.sourceType = "files";
            entries = workflow::WorkflowScanner::loadFiles(request["files"].get<std::vector<std::string>>());
        } else if (request.contains("folderPath")) {
            options.sourceType = "folder";
            options.folderPath = request["folderPath"].get<std::string>();
            entries = workflow::WorkflowScanner::scanFolder(options.folderPath, request.value("recursive", false));
        } else {
            return error(400, "One of workflows, files or folderPath is required");
        }
    } catch (const std::exception& e) {
        return error(400, e.what());
    }

    if (entries.empty()) {
        return error(400, "No workflows found");
    }

    if (request.contains("workers") && !request["workers"].is_null()) {
        auto workers = boundedInt(request["workers"], 1);
        if (!workers) {
            return error(400, "workers must be a positive integer");
        }
        options.workers = *workers;
    }
    if (request.contains("priority") && !request["priority"].is_null()) {
        auto priority = boundedInt(request["priority"], std::numeric_limits<int>::min());
        if (!priority) {
            return error(400, "priority must be an integer");
        }
        options.priority = *priority;
    }
    options.outputPath = request.value("outputPath", std::string());
    options.traceLogs = request.value("traceLogs", false);

    json invalid = invalidEntriesJson(entries);
    std::string batchId = m_manager.startBatch(std::move(entries), options);

    json body = {{"status", "ok"}, {"batchId", batchId}, {"invalid", invalid}};
    if (auto batch = m_manager.getBatchStatus(batchId)) {
        body["batch"] = batch->toJson();
    }
    return {200, body};
}

RouteResult RequestHandler::handleBatchStatus(const std::string& batchId) {
    auto batch = m_manager.getBatchStatus(batchId);
    if (!batch) {
        return error(404, "Batch not found: " + batchId);
    }
    return {200, json{{"status", "ok"}, {"batch", batch->toJson()}}};
}

RouteResult RequestHandler::handleBatchExecutions(const std::string& batchId) {
    if (!m_manager.getBatchStatus(batchId)) {
        return error(404, "Batch not found: " + batchId);
    }
    json executions = json::array();
    for (const auto& record : m_manager.getBatchExecutions(batchId)) {
        executions.push_back(record.toJson());
    }
    return {200, json{{"status", "ok"}, {"batchId", batchId}, {"executions", executions}}};
}

RouteResult RequestHandler::handleStopBatch(const std::string& batchId) {
    auto result = m_manager.stopBatch(batchId);
    if (!result.found) {
        return error(404, "Batch not found: " + batchId);
    }
    json body = result.toJson();
    body["status"] = "ok";
    body["batchId"] = batchId;
    return {200, body};
}

RouteResult RequestHandler::handleStopAll() {
    json body = m_manager.stopAll().toJson();
    body["status"] = "ok";
    return {200, body};
}

RouteResult RequestHandler::handleListBatches(const QueryParams& query) {
    storage::BatchFilter filter;
    try {
        filter.limit = intParam(query, "limit", filter.limit);
        filter.offset = intParam(query, "offset", filter.offset);
    } catch (const std::invalid_argument& e) {
        return error(400, e.what());
    }
    auto status = query.find("status");
    if (status != query.end() && !status->second.empty()) {
        filter.status = status->second;
    }

    json batches = json::array();
    for (const auto& batch : m_manager.listBatches(filter)) {
        batches.push_back(batch.toJson());
    }
    return {200, json{
        {"status", "ok"},
        {"batches", batches},
        {"limit", filter.limit},
        {"offset", filter.offset}
    }};
}

} // namespace server
} // namespace automflow
