#pragma once

#include "engine/BrowserDriver.hpp"
#include "engine/ExecutionEvent.hpp"
#include "engine/Executor.hpp"
#include "engine/NodeHandlerRegistry.hpp"
#include "engine/WorkerAdmission.hpp"
#include "storage/BatchMetadata.hpp"
#include "workflow/Workflow.hpp"
#include "workflow/WorkflowScanner.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace automflow {

namespace storage {
class BatchStorage;
}

namespace engine {

struct ExecutionManagerConfig {
    int maxWorkers = 4;                     // global worker cap
    int64_t evictionDelayMs = 5000;         // terminal executions stay queryable in memory this long
    std::string defaultOutputPath = "./output";
};

/**
 * Scheduler-side status of an execution. Queued is reported as "idle".
 */
enum class ExecutionStatus {
    Queued,
    Running,
    Completed,
    Error,
    Stopped
};

std::string executionStatusToString(ExecutionStatus status);

inline bool isTerminal(ExecutionStatus status) {
    return status == ExecutionStatus::Completed
        || status == ExecutionStatus::Error
        || status == ExecutionStatus::Stopped;
}

struct SingleRunOptions {
    std::string workflowFileName = "workflow.json";
    bool traceLogs = false;
    BreakpointConfig breakpoints;
};

struct BatchOptions {
    std::optional<int> workers;             // batch ceiling, defaults to the global cap
    int priority = 0;
    std::string sourceType = "workflows";   // folder | files | workflows
    std::string folderPath;
    std::string outputPath;                 // defaults to config.defaultOutputPath
    bool traceLogs = false;
};

struct StopResult {
    bool found = false;
    bool wasRunning = false;
    bool wasQueued = false;

    nlohmann::json toJson() const {
        return {{"wasRunning", wasRunning}, {"wasQueued", wasQueued}};
    }
};

struct BatchStopResult {
    bool found = false;
    std::vector<std::string> stoppedExecutions;
    int runningStopped = 0;
    int queuedCancelled = 0;

    nlohmann::json toJson() const {
        return {
            {"stoppedExecutions", stoppedExecutions},
            {"runningStopped", runningStopped},
            {"queuedCancelled", queuedCancelled}
        };
    }
};

struct StopAllResult {
    int totalBatches = 0;
    int runningStopped = 0;
    int queuedCancelled = 0;
    std::vector<std::pair<std::string, int>> batches;   // batchId, executions stopped

    int totalStopped() const { return runningStopped + queuedCancelled; }

    nlohmann::json toJson() const {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& [batchId, stopped] : batches) {
            list.push_back({{"batchId", batchId}, {"stopped", stopped}});
        }
        return {
            {"totalBatches", totalBatches},
            {"totalStopped", totalStopped()},
            {"runningStopped", runningStopped},
            {"queuedCancelled", queuedCancelled},
            {"batches", list}
        };
    }
};

/**
 * Top-level scheduler for single runs and batches
 *
 * Batch members go through a priority/FIFO queue and are admitted under two
 * ceilings: the global worker cap and their batch's own worker limit. A batch
 * at its limit never blocks members of other batches queued behind it. Single
 * runs start immediately on their own thread, outside the worker pool.
 *
 * Every execution runs on a dedicated std::thread. Failures are caught at that
 * thread boundary and recorded as an error status. One mutex guards the queue,
 * both registries and the worker accounting. Completion releases the worker
 * slot and re-runs queue processing under that same lock.
 *
 * Terminal executions stay in memory evictionDelayMs, then status queries
 * fall back to the BatchStorage (when one is configured).
 */
class ExecutionManager {
public:
    ExecutionManager(ExecutionManagerConfig config,
                     const NodeHandlerRegistry& registry,
                     DriverFactory driverFactory = nullptr,
                     storage::BatchStorage* storage = nullptr);
    ~ExecutionManager();

    // Non-copyable
    ExecutionManager(const ExecutionManager&) = delete;
    ExecutionManager& operator=(const ExecutionManager&) = delete;

    /**
     * Receives every batch event and every executor event (tagged with its
     * execution and batch ids). Called from worker threads, sometimes with
     * the scheduler lock held: the sink must not call back into the manager.
     */
    void setEventSink(ExecutionCallback sink);

    const ExecutionManagerConfig& getConfig() const { return m_config; }

    // === Submission ===

    /**
     * Start one workflow immediately, outside the worker pool.
     * Returns the execution id.
     */
    std::string startSingle(workflow::Workflow workflow, const SingleRunOptions& options = {});

    /**
     * Queue every valid entry as a batch member. Invalid entries are counted
     * but never run. Returns the batch id.
     */
    std::string startBatch(std::vector<workflow::WorkflowEntry> entries, const BatchOptions& options = {});

    // === Stop ===

    StopResult stopExecution(const std::string& executionId);

    /**
     * Stop every running member and cancel every queued member.
     * Leaves the batch stopped with running = queued = 0.
     */
    BatchStopResult stopBatch(const std::string& batchId);

    /**
     * stopBatch() on every batch that is running or still has members in flight
     */
    StopAllResult stopAll();

    // === Pause controls ===
    // Return false if the execution is unknown or not paused.

    bool continueExecution(const std::string& executionId);
    bool skipNext(const std::string& executionId);
    bool continueWithoutBreakpoint(const std::string& executionId);
    bool stopFromPause(const std::string& executionId);

    // === Queries ===

    /**
     * {executionId, status, currentNodeId, error, pausedNodeId, pauseReason, ...}
     * from memory, else from storage. nullopt if unknown.
     */
    std::optional<nlohmann::json> getExecutionStatus(const std::string& executionId);

    std::optional<storage::BatchMetadata> getBatchStatus(const std::string& batchId);

    std::vector<storage::ExecutionRecord> getBatchExecutions(const std::string& batchId);

    std::vector<storage::BatchMetadata> listBatches(const storage::BatchFilter& filter = {});

    /**
     * Executions currently running (paused ones included)
     */
    nlohmann::json getActiveExecutions();

    std::optional<std::string> getMostRecentExecutionId();

    std::shared_ptr<Executor> getExecutor(const std::string& executionId);

    int activeWorkers() const;
    size_t queueSize() const;

    /**
     * Stop everything and join every thread. Further submissions throw.
     */
    void shutdown();

private:
    struct ExecutionEntry {
        std::string executionId;
        std::string batchId;                // empty for single runs
        std::string workflowFileName;
        std::string workflowPath;
        ExecutionStatus status = ExecutionStatus::Queued;
        std::shared_ptr<Executor> executor;
        std::optional<int> workerId;
        std::optional<int64_t> startTime;
        std::optional<int64_t> endTime;
        std::string error;
        bool cancelled = false;             // set while still queued
        bool slotHeld = false;              // owns a WorkerAdmission slot
        std::thread thread;
        std::optional<std::chrono::steady_clock::time_point> evictAt;
    };

    struct QueueItem {
        std::string executionId;
        std::string batchId;
        int priority = 0;
        uint64_t sequence = 0;              // enqueue order
    };

    struct BatchEntry {
        storage::BatchMetadata metadata;
        std::optional<std::chrono::steady_clock::time_point> evictAt;
    };

    // All *Locked methods expect m_mutex to be held
    std::shared_ptr<Executor> createExecutor(const std::string& executionId, const std::string& batchId,
                                             workflow::Workflow workflow, ExecutorOptions options);
    void enqueueLocked(const ExecutionEntry& entry, int priority);
    void processQueueLocked();
    void dispatchLocked(ExecutionEntry& entry);
    void runExecution(const std::string& executionId, std::shared_ptr<Executor> executor);
    void handleCompletion(const std::string& executionId, ExecutionStatus outcome, const std::string& error);
    void finishLocked(ExecutionEntry& entry, ExecutionStatus status, const std::string& error);
    bool cancelQueuedLocked(ExecutionEntry& entry);
    void releaseSlotLocked(ExecutionEntry& entry);
    BatchStopResult stopBatchLocked(BatchEntry& batch);
    void checkBatchCompletionLocked(BatchEntry& batch);

    static storage::ExecutionRecord toRecord(const ExecutionEntry& entry);
    void persistExecutionLocked(const ExecutionEntry& entry);
    void persistBatchLocked(const storage::BatchMetadata& batch);
    void persistProgressLocked(const storage::BatchMetadata& batch);
    void emitBatchEventLocked(EventType type, const storage::BatchMetadata& batch);
    void emit(const ExecutionEvent& event);

    void recoverInterruptedBatches();
    void janitorLoop();
    std::string generateId(const std::string& prefix);

    ExecutionManagerConfig m_config;
    const NodeHandlerRegistry& m_registry;
    DriverFactory m_driverFactory;
    storage::BatchStorage* m_storage;

    mutable std::mutex m_mutex;
    WorkerAdmission m_admission;
    std::vector<QueueItem> m_queue;         // ordered: priority desc, then sequence
    std::unordered_map<std::string, ExecutionEntry> m_executions;
    std::unordered_map<std::string, BatchEntry> m_batches;
    uint64_t m_nextSequence = 0;
    int m_nextWorkerId = 0;
    std::optional<std::string> m_mostRecentExecutionId;
    bool m_shuttingDown = false;
    std::mt19937_64 m_random;

    std::mutex m_sinkMutex;
    ExecutionCallback m_eventSink;

    std::condition_variable m_janitorCv;
    std::thread m_janitor;
};

} // namespace engine
} // namespace automflow
