#pragma once

#include "workflow/Workflow.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace automflow {
namespace engine {

enum class PauseReason {
    WaitPause,
    Breakpoint
};

inline std::string pauseReasonToString(PauseReason reason) {
    return reason == PauseReason::WaitPause ? "wait-pause" : "breakpoint";
}

/**
 * Control channel from node handlers back to the running Executor
 *
 * Handlers reach it through ExecutionContext::control(). A context without an
 * Executor (unit tests) has no control and every operation degrades to a
 * plain sleep / no-op.
 */
class ExecutionControl {
public:
    virtual ~ExecutionControl() = default;

    /**
     * Suspend the calling handler until the execution is continued.
     * Throws ExecutionStopped if the execution is stopped while paused.
     */
    virtual void requestPause(const std::string& nodeId, PauseReason reason) = 0;

    virtual bool isStopRequested() const = 0;

    /**
     * Sleep up to duration, returning early (false) if a stop is requested
     */
    virtual bool sleepFor(std::chrono::milliseconds duration) = 0;

    /**
     * False when running as a batch member (wait-node pauses are ignored)
     */
    virtual bool isInteractive() const = 0;

    /**
     * Run a sub-flow (reusable scope) with the current context
     */
    virtual void runSubflow(const workflow::Workflow& subflow) = 0;

    /**
     * Full workflow being executed (reusable scopes are extracted from it)
     */
    virtual const workflow::Workflow& getWorkflow() const = 0;
};

/**
 * Thrown to unwind a handler when its execution has been stopped
 */
class ExecutionStopped : public std::runtime_error {
public:
    explicit ExecutionStopped(const std::string& message = "Execution stopped")
        : std::runtime_error(message) {}
};

} // namespace engine
} // namespace automflow
