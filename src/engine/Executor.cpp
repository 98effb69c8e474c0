#include "engine/Executor.hpp"
#include "engine/VariableInterpolator.hpp"
#include "server/Logger.hpp"
#include "workflow/WorkflowParser.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace automflow {
namespace engine {

using workflow::Node;
using workflow::Workflow;
using workflow::WorkflowParser;
namespace NodeTypes = workflow::NodeTypes;

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

/**
 * A node failure already reported (node_error emitted, message prefixed)
 */
class NodeFailure : public std::runtime_error {
public:
    explicit NodeFailure(const std::string& message) : std::runtime_error(message) {}
};

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) out += "; ";
        out += error;
    }
    return out;
}

std::string stringValue(const json& j, const char* key, const char* altKey, const std::string& fallback) {
    for (const char* k : {key, altKey}) {
        auto it = j.find(k);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

} // anonymous namespace

std::string executorStatusToString(ExecutorStatus status) {
    switch (status) {
        case ExecutorStatus::Idle:      return "idle";
        case ExecutorStatus::Running:   return "running";
        case ExecutorStatus::Paused:    return "paused";
        case ExecutorStatus::Completed: return "completed";
        case ExecutorStatus::Error:     return "error";
        case ExecutorStatus::Stopped:   return "stopped";
    }
    return "unknown";
}

// =============================================================================
// BreakpointConfig
// =============================================================================

BreakpointConfig BreakpointConfig::fromJson(const json& j) {
    BreakpointConfig config;
    if (!j.is_object()) {
        return config;
    }
    auto enabled = j.find("enabled");
    config.enabled = enabled != j.end() && enabled->is_boolean() && enabled->get<bool>();

    std::string at = stringValue(j, "breakpointAt", "at", "pre");
    if (at == "post") config.at = At::Post;
    else if (at == "both") config.at = At::Both;
    else config.at = At::Pre;

    config.scope = stringValue(j, "breakpointFor", "for", "all") == "marked" ? Scope::Marked : Scope::All;
    return config;
}

json BreakpointConfig::toJson() const {
    return {
        {"enabled", enabled},
        {"breakpointAt", at == At::Pre ? "pre" : at == At::Post ? "post" : "both"},
        {"breakpointFor", scope == Scope::Marked ? "marked" : "all"}
    };
}

// =============================================================================
// Executor
// =============================================================================

Executor::Executor(Workflow workflow, const NodeHandlerRegistry& registry, ExecutorOptions options)
    : m_workflow(std::move(workflow))
    , m_registry(registry)
    , m_options(std::move(options))
{
    m_context.setControl(this);
}

void Executor::execute() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != ExecutorStatus::Idle) {
            throw std::runtime_error("Executor has already been started");
        }
        m_status = ExecutorStatus::Running;
    }

    const auto startTime = Clock::now();
    emit(EventType::ExecutionStart);
    trace("Execution started (" + std::to_string(m_workflow.nodeCount()) + " nodes)");

    bool stopped = false;
    try {
        WorkflowParser parser(m_workflow);
        auto validation = parser.validate();
        if (!validation.valid) {
            throw std::runtime_error("Workflow validation failed: " + joinErrors(validation.errors));
        }

        if (const Node* start = m_workflow.findStartNode()) {
            auto slowMo = start->data.find("slowMo");
            if (slowMo != start->data.end()) {
                m_slowMoMs = std::max<int64_t>(0, VariableInterpolator::resolveInteger(*slowMo, m_context, 0));
            }
        }

        Walk walk{m_workflow, parser.getExecutionOrder(),
                  workflow::ReusableScope::getAllScopedNodes(m_workflow), {}};
        runWalk(walk);
        stopped = m_stopRequested.load();
    } catch (const ExecutionStopped&) {
        stopped = true;
    } catch (const std::exception& e) {
        m_context.closePage();
        if (m_stopRequested) {
            stopped = true;
        } else {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_error = e.what();
                m_status = ExecutorStatus::Error;
                m_currentNodeId.reset();
            }
            LOG_ERROR(std::string("Execution failed: ") + e.what());
            emit(EventType::ExecutionError, "", elapsedMs(startTime), e.what());
            throw;
        }
    }

    m_context.closePage();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_status = stopped ? ExecutorStatus::Stopped : ExecutorStatus::Completed;
        m_currentNodeId.reset();
        m_pausedNodeId.reset();
        m_pauseReason.reset();
    }

    if (stopped) {
        LOG_INFO("Execution stopped");
        emit(EventType::ExecutionStopped, "", elapsedMs(startTime));
    } else {
        emit(EventType::ExecutionComplete, "", elapsedMs(startTime));
        trace("Execution completed in " + std::to_string(elapsedMs(startTime)) + "ms");
    }
}

void Executor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
}

// === Introspection ===

ExecutorStatus Executor::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

std::optional<std::string> Executor::getCurrentNodeId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentNodeId;
}

std::optional<std::string> Executor::getPausedNodeId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pausedNodeId;
}

std::optional<PauseReason> Executor::getPauseReason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pauseReason;
}

std::string Executor::getError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

// === Pause controls ===

bool Executor::continueExecution() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != ExecutorStatus::Paused) return false;
        m_resumeAction = ResumeAction::Continue;
    }
    m_cv.notify_all();
    return true;
}

bool Executor::skip() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != ExecutorStatus::Paused) return false;
        m_resumeAction = ResumeAction::Skip;
    }
    m_cv.notify_all();
    return true;
}

bool Executor::continueWithoutBreakpoint() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != ExecutorStatus::Paused) return false;
        m_breakpointsDisabled = true;
        m_resumeAction = ResumeAction::Continue;
    }
    m_cv.notify_all();
    return true;
}

bool Executor::stopFromPause() {
    bool wasPaused = isPaused();
    stop();
    return wasPaused;
}

// === ExecutionControl ===

void Executor::requestPause(const std::string& nodeId, PauseReason reason) {
    pauseAt(nodeId, reason);
}

bool Executor::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, duration, [this]() { return m_stopRequested.load(); });
}

void Executor::runSubflow(const Workflow& subflow) {
    if (subflow.empty()) {
        return;
    }
    WorkflowParser parser(subflow);
    Walk walk{subflow, parser.getSubflowOrder(), {}, {}};
    for (const auto& node : subflow.getNodes()) {
        if (node.type == NodeTypes::Reusable || node.type == NodeTypes::ReusableEnd) {
            walk.skipped.insert(node.id);
        }
    }
    trace("Running sub-flow (" + std::to_string(subflow.nodeCount()) + " nodes)");
    runWalk(walk);
}

// === Traversal ===

void Executor::runWalk(Walk& walk) {
    for (const auto& nodeId : walk.order) {
        if (m_stopRequested) {
            throw ExecutionStopped();
        }
        if (walk.executed.count(nodeId) || walk.skipped.count(nodeId)) {
            continue;
        }
        const Node* node = walk.workflow.getNode(nodeId);
        if (!node) {
            continue;
        }

        auto extra = runNode(walk, *node);
        walk.executed.insert(nodeId);
        walk.executed.insert(extra.begin(), extra.end());
    }
}

std::vector<std::string> Executor::runNode(Walk& walk, const Node& node) {
    if (node.flag("bypass")) {
        trace("Bypassing node " + node.id + " (" + node.type + ")");
        return {};
    }

    setCurrentNode(node.id);

    if (breakpointApplies(node, true)) {
        emit(EventType::BreakpointTriggered, node.id, 0, "", {{"at", "pre"}});
        if (pauseAt(node.id, PauseReason::Breakpoint) == ResumeAction::Skip) {
            trace("Skipped node " + node.id + " at breakpoint");
            return {};
        }
    }

    emit(EventType::NodeStart, node.id);
    trace("Executing node " + node.id + " (" + node.type + ")");
    const auto startTime = Clock::now();
    std::vector<std::string> extra;

    try {
        dispatch(resolvePropertyInputs(walk, node));
        if (node.type == NodeTypes::Loop) {
            extra = runLoopBody(walk, node);
        }
        if (m_slowMoMs > 0 && !sleepFor(std::chrono::milliseconds(m_slowMoMs))) {
            throw ExecutionStopped();
        }
    } catch (const ExecutionStopped&) {
        throw;
    } catch (const NodeFailure&) {
        throw;
    } catch (const std::exception& e) {
        if (m_stopRequested) {
            throw ExecutionStopped();
        }
        int64_t duration = elapsedMs(startTime);
        if (node.flag("failSilently")) {
            LOG_WARN("Node " + node.id + " (" + node.type + ") failed silently: " + e.what());
            emit(EventType::NodeError, node.id, duration, e.what(), {{"failSilently", true}});
            return extra;
        }
        emit(EventType::NodeError, node.id, duration, e.what());
        throw NodeFailure("Node " + node.id + " (" + node.type + ") failed: " + e.what());
    }

    int64_t duration = elapsedMs(startTime);
    emit(EventType::NodeComplete, node.id, duration);
    trace("Node " + node.id + " completed in " + std::to_string(duration) + "ms");

    if (breakpointApplies(node, false)) {
        emit(EventType::BreakpointTriggered, node.id, 0, "", {{"at", "post"}});
        pauseAt(node.id, PauseReason::Breakpoint);
    }
    return extra;
}

std::vector<std::string> Executor::runLoopBody(Walk& walk, const Node& loopNode) {
    if (!m_context.hasData("_loopArray")) {
        return {};
    }
    json items = m_context.getData("_loopArray");
    m_context.removeData("_loopArray");

    auto descendants = WorkflowParser(walk.workflow).getDriverDescendants(loopNode.id);
    std::unordered_set<std::string> inBody(descendants.begin(), descendants.end());

    // Body nodes keep the order of the enclosing walk
    std::vector<std::string> body;
    for (const auto& id : walk.order) {
        if (inBody.count(id) && !walk.skipped.count(id) && !walk.executed.count(id)) {
            body.push_back(id);
        }
    }
    if (!items.is_array()) {
        items = json::array({items});
    }

    for (size_t index = 0; index < items.size(); ++index) {
        if (m_stopRequested) {
            throw ExecutionStopped();
        }
        m_context.setVariable("index", index);
        m_context.setVariable("item", items[index]);
        trace("Loop " + loopNode.id + " iteration " + std::to_string(index + 1) + "/" +
              std::to_string(items.size()));

        std::unordered_set<std::string> covered;
        for (const auto& id : body) {
            if (covered.count(id)) continue;
            const Node* node = walk.workflow.getNode(id);
            if (!node) continue;
            auto nested = runNode(walk, *node);
            covered.insert(nested.begin(), nested.end());
        }
    }
    return body;
}

void Executor::dispatch(const Node& node) {
    auto handler = m_registry.getHandler(node.type);
    if (!handler) {
        throw std::runtime_error("Unknown node type: " + node.type);
    }
    handler->execute(node, m_context);
}

Node Executor::resolvePropertyInputs(const Walk& walk, const Node& node) {
    Node resolved = node;
    if (!resolved.data.is_object()) {
        resolved.data = json::object();
    }

    for (const auto* edge : walk.workflow.incomingEdges(node.id)) {
        if (!edge->isPropertyInput()) {
            continue;
        }
        if (!m_context.hasVariable(edge->source)) {
            evaluateValueNode(walk, edge->source);
        }
        json value = m_context.getVariable(edge->source);
        if (!value.is_null()) {
            resolved.data[edge->propertyName()] = value;
            trace("Property " + edge->propertyName() + " of " + node.id + " wired from " + edge->source);
        }
    }
    return resolved;
}

void Executor::evaluateValueNode(const Walk& walk, const std::string& nodeId) {
    // Sub-flows keep property edges whose source lies outside the scope
    const Node* source = walk.workflow.getNode(nodeId);
    if (!source) {
        source = m_workflow.getNode(nodeId);
    }
    if (source && NodeTypes::isValueNode(source->type)) {
        trace("Evaluating value node " + nodeId);
        dispatch(*source);
    }
}

bool Executor::breakpointApplies(const Node& node, bool pre) const {
    const auto& config = m_options.breakpoints;
    if (!config.enabled || node.type == NodeTypes::Start) {
        return false;
    }
    if ((pre && config.at == BreakpointConfig::At::Post) || (!pre && config.at == BreakpointConfig::At::Pre)) {
        return false;
    }
    if (config.scope == BreakpointConfig::Scope::Marked && !node.flag("breakpoint")) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_breakpointsDisabled;
}

Executor::ResumeAction Executor::pauseAt(const std::string& nodeId, PauseReason reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopRequested) {
            throw ExecutionStopped();
        }
        m_status = ExecutorStatus::Paused;
        m_pausedNodeId = nodeId;
        m_pauseReason = reason;
        m_resumeAction = ResumeAction::None;
    }

    LOG_INFO("Execution paused at node " + nodeId + " (" + pauseReasonToString(reason) + ")");
    emit(EventType::ExecutionPaused, nodeId, 0, "", {{"pauseReason", pauseReasonToString(reason)}});

    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this]() { return m_resumeAction != ResumeAction::None || m_stopRequested.load(); });

    ResumeAction action = m_stopRequested ? ResumeAction::Stop : m_resumeAction;
    m_resumeAction = ResumeAction::None;
    m_pausedNodeId.reset();
    m_pauseReason.reset();
    if (action == ResumeAction::Stop) {
        throw ExecutionStopped();
    }
    m_status = ExecutorStatus::Running;
    return action;
}

// === Helpers ===

void Executor::setCurrentNode(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_currentNodeId = nodeId;
}

void Executor::emit(EventType type, const std::string& nodeId, int64_t durationMs,
                    const std::string& message, json payload) {
    if (!m_callback) {
        return;
    }
    ExecutionEvent event;
    event.type = type;
    event.nodeId = nodeId;
    event.durationMs = durationMs;
    event.message = message;
    event.payload = std::move(payload);
    m_callback(event);
}

void Executor::trace(const std::string& message) {
    if (!m_options.traceLogs) {
        return;
    }
    LOG_DEBUG("[trace] " + message);
    emit(EventType::Log, "", 0, message);
}

} // namespace engine
} // namespace automflow
