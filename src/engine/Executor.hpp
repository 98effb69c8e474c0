#pragma once

#include "engine/ExecutionContext.hpp"
#include "engine/ExecutionControl.hpp"
#include "engine/ExecutionEvent.hpp"
#include "engine/NodeHandlerRegistry.hpp"
#include "workflow/ReusableScope.hpp"
#include "workflow/Workflow.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace automflow {
namespace engine {

enum class ExecutorStatus {
    Idle,
    Running,
    Paused,
    Completed,
    Error,
    Stopped
};

std::string executorStatusToString(ExecutorStatus status);

/**
 * Where breakpoints fire, parsed from {enabled, at: pre|post|both, for: all|marked}
 */
struct BreakpointConfig {
    enum class At { Pre, Post, Both };
    enum class Scope { All, Marked };

    bool enabled = false;
    At at = At::Pre;
    Scope scope = Scope::All;   // Marked: only nodes with data.breakpoint == true

    static BreakpointConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

struct ExecutorOptions {
    bool interactive = true;    // false for batch members, wait-node pauses are ignored
    bool traceLogs = false;
    BreakpointConfig breakpoints;
};

/**
 * Runs one workflow graph to a terminal state
 *
 * Nodes are visited in control-flow order (driver edges only) and dispatched
 * to their handler through the registry. The executor owns the execution
 * context and acts as its ExecutionControl: handlers request pauses and
 * stop-aware sleeps through it.
 *
 * execute() blocks the calling thread. Every other public method is safe to
 * call from another thread while execute() runs.
 *
 * Usage:
 *   Executor executor(workflow, registry, options);
 *   executor.setExecutionCallback([](const ExecutionEvent& e) { ... });
 *   executor.execute();            // throws on error, returns on completion or stop
 */
class Executor : public ExecutionControl {
public:
    Executor(workflow::Workflow workflow, const NodeHandlerRegistry& registry,
             ExecutorOptions options = {});

    // Non-copyable
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void setExecutionCallback(ExecutionCallback callback) { m_callback = std::move(callback); }

    ExecutionContext& context() { return m_context; }
    const workflow::Workflow& getWorkflow() const override { return m_workflow; }

    // === Lifecycle ===

    /**
     * Validate then run the workflow.
     * Returns normally on completion or stop, throws std::runtime_error on a
     * validation error or a node failure that is not silent.
     */
    void execute();

    /**
     * Request cooperative cancellation. Wakes sleeps and pauses.
     */
    void stop();

    // === Introspection ===

    ExecutorStatus getStatus() const;
    std::optional<std::string> getCurrentNodeId() const;
    std::optional<std::string> getPausedNodeId() const;
    std::optional<PauseReason> getPauseReason() const;
    std::string getError() const;
    bool isPaused() const { return getStatus() == ExecutorStatus::Paused; }

    // === Pause controls ===
    // Each returns false when the executor is not paused.

    bool continueExecution();

    /**
     * Resume from a pre-execution breakpoint without running the paused node.
     * Behaves like continueExecution() for other pauses.
     */
    bool skip();

    /**
     * Resume and ignore breakpoints for the rest of the run
     */
    bool continueWithoutBreakpoint();

    bool stopFromPause();

    // === ExecutionControl ===

    void requestPause(const std::string& nodeId, PauseReason reason) override;
    bool isStopRequested() const override { return m_stopRequested.load(); }
    bool sleepFor(std::chrono::milliseconds duration) override;
    bool isInteractive() const override { return m_options.interactive; }
    void runSubflow(const workflow::Workflow& subflow) override;

private:
    enum class ResumeAction { None, Continue, Skip, Stop };

    /// Traversal state of one graph (the main workflow or a reusable sub-flow)
    struct Walk {
        const workflow::Workflow& workflow;
        std::vector<std::string> order;
        workflow::NodeIdSet skipped;
        std::unordered_set<std::string> executed;
    };

    void runWalk(Walk& walk);

    /**
     * Run one node with breakpoints, events and fail-silently.
     * Returns the ids of extra nodes it ran (loop bodies).
     */
    std::vector<std::string> runNode(Walk& walk, const workflow::Node& node);

    std::vector<std::string> runLoopBody(Walk& walk, const workflow::Node& loopNode);

    void dispatch(const workflow::Node& node);
    workflow::Node resolvePropertyInputs(const Walk& walk, const workflow::Node& node);
    void evaluateValueNode(const Walk& walk, const std::string& nodeId);

    bool breakpointApplies(const workflow::Node& node, bool pre) const;
    ResumeAction pauseAt(const std::string& nodeId, PauseReason reason);

    void setCurrentNode(const std::string& nodeId);
    void emit(EventType type, const std::string& nodeId = "", int64_t durationMs = 0,
              const std::string& message = "", nlohmann::json payload = nullptr);
    void trace(const std::string& message);

    workflow::Workflow m_workflow;
    const NodeHandlerRegistry& m_registry;
    ExecutorOptions m_options;
    ExecutionContext m_context;
    ExecutionCallback m_callback;
    int64_t m_slowMoMs = 0;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_stopRequested{false};
    ExecutorStatus m_status = ExecutorStatus::Idle;
    std::optional<std::string> m_currentNodeId;
    std::optional<std::string> m_pausedNodeId;
    std::optional<PauseReason> m_pauseReason;
    ResumeAction m_resumeAction = ResumeAction::None;
    bool m_breakpointsDisabled = false;
    std::string m_error;
};

} // namespace engine
} // namespace automflow
