#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace automflow {
namespace engine {

/**
 * Kind of event emitted by an Executor or the ExecutionManager
 */
enum class EventType {
    ExecutionStart,
    ExecutionComplete,
    ExecutionError,
    ExecutionStopped,
    NodeStart,           // node began (yellow indicator)
    NodeComplete,        // node finished (green indicator)
    NodeError,           // node failed (red indicator)
    ExecutionPaused,     // wait-node pause
    BreakpointTriggered,
    Log,                 // trace log line
    BatchStart,
    BatchProgress,
    BatchComplete
};

inline std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::ExecutionStart:      return "execution_start";
        case EventType::ExecutionComplete:   return "execution_complete";
        case EventType::ExecutionError:      return "execution_error";
        case EventType::ExecutionStopped:    return "execution_stopped";
        case EventType::NodeStart:           return "node_start";
        case EventType::NodeComplete:        return "node_complete";
        case EventType::NodeError:           return "node_error";
        case EventType::ExecutionPaused:     return "execution_paused";
        case EventType::BreakpointTriggered: return "breakpoint_triggered";
        case EventType::Log:                 return "log";
        case EventType::BatchStart:          return "batch_start";
        case EventType::BatchProgress:       return "batch_progress";
        case EventType::BatchComplete:       return "batch_complete";
    }
    return "unknown";
}

/**
 * Event emitted during execution for real-time feedback (SSE)
 */
struct ExecutionEvent {
    EventType type = EventType::Log;
    std::string executionId;
    std::string batchId;          // empty for single runs
    std::string nodeId;           // node events only
    int64_t durationMs = 0;       // NodeComplete / NodeError / ExecutionComplete
    std::string message;          // error or log text
    nlohmann::json payload;       // event-specific extras (batch counters, pause reason...)
    int64_t timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    /**
     * Convert to JSON for SSE transmission
     */
    nlohmann::json toJson() const {
        nlohmann::json j;
        j["type"] = eventTypeToString(type);
        j["timestamp"] = timestamp;
        if (!executionId.empty()) j["executionId"] = executionId;
        if (!batchId.empty()) j["batchId"] = batchId;
        if (!nodeId.empty()) j["nodeId"] = nodeId;

        switch (type) {
            case EventType::NodeComplete:
            case EventType::ExecutionComplete:
                j["durationMs"] = durationMs;
                break;
            case EventType::NodeError:
            case EventType::ExecutionError:
                j["durationMs"] = durationMs;
                j["error"] = message;
                break;
            case EventType::Log:
                j["message"] = message;
                break;
            default:
                if (!message.empty()) j["message"] = message;
                break;
        }

        if (!payload.is_null()) {
            j["data"] = payload;
        }
        return j;
    }
};

/**
 * Callback type for execution events
 */
using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

} // namespace engine
} // namespace automflow
