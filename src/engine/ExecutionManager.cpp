#include "engine/ExecutionManager.hpp"
#include "server/Logger.hpp"
#include "storage/BatchStorage.hpp"
#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace automflow {
namespace engine {

using Clock = std::chrono::steady_clock;

namespace {

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json optionalJson(const std::optional<int64_t>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) out += "; ";
        out += error;
    }
    return out;
}

} // anonymous namespace

std::string executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Queued:    return "idle";
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Error:     return "error";
        case ExecutionStatus::Stopped:   return "stopped";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

ExecutionManager::ExecutionManager(ExecutionManagerConfig config,
                                   const NodeHandlerRegistry& registry,
                                   DriverFactory driverFactory,
                                   storage::BatchStorage* storage)
    : m_config(std::move(config))
    , m_registry(registry)
    , m_driverFactory(std::move(driverFactory))
    , m_storage(storage)
    , m_admission(m_config.maxWorkers)
    , m_random(std::random_device{}())
{
    recoverInterruptedBatches();
    m_janitor = std::thread(&ExecutionManager::janitorLoop, this);
    LOG_INFO("Execution manager ready (max workers: " + std::to_string(m_admission.globalLimit()) +
             ", eviction: " + std::to_string(m_config.evictionDelayMs) + "ms)");
}

ExecutionManager::~ExecutionManager() {
    shutdown();
}

void ExecutionManager::setEventSink(ExecutionCallback sink) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_eventSink = std::move(sink);
}

void ExecutionManager::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_shuttingDown) {
            LOG_INFO("Shutting down execution manager");
        }
        m_shuttingDown = true;

        for (auto& [batchId, batch] : m_batches) {
            stopBatchLocked(batch);
        }
        for (auto& [executionId, entry] : m_executions) {
            if (entry.status == ExecutionStatus::Queued) {
                cancelQueuedLocked(entry);
                finishLocked(entry, ExecutionStatus::Stopped, "");
            } else if (entry.status == ExecutionStatus::Running) {
                entry.executor->stop();
                finishLocked(entry, ExecutionStatus::Stopped, "");
            }
            if (entry.thread.joinable()) {
                threads.push_back(std::move(entry.thread));
            }
        }
        m_queue.clear();
    }
    m_janitorCv.notify_all();

    for (auto& thread : threads) {
        thread.join();
    }
    if (m_janitor.joinable()) {
        m_janitor.join();
    }
}

// =============================================================================
// Submission
// =============================================================================

std::string ExecutionManager::startSingle(workflow::Workflow workflow, const SingleRunOptions& options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shuttingDown) {
        throw std::runtime_error("Execution manager is shutting down");
    }

    ExecutorOptions executorOptions;
    executorOptions.interactive = true;
    executorOptions.traceLogs = options.traceLogs;
    executorOptions.breakpoints = options.breakpoints;

    ExecutionEntry entry;
    entry.executionId = generateId("exec");
    entry.workflowFileName = options.workflowFileName;
    entry.status = ExecutionStatus::Running;
    entry.startTime = nowMs();
    entry.executor = createExecutor(entry.executionId, "", std::move(workflow), std::move(executorOptions));

    const std::string executionId = entry.executionId;
    auto& stored = m_executions.emplace(executionId, std::move(entry)).first->second;
    m_mostRecentExecutionId = executionId;
    persistExecutionLocked(stored);

    LOG_INFO("Starting single execution " + executionId);
    try {
        stored.thread = std::thread(&ExecutionManager::runExecution, this, executionId, stored.executor);
    } catch (const std::system_error& e) {
        finishLocked(stored, ExecutionStatus::Error, std::string("Failed to start worker thread: ") + e.what());
        throw std::runtime_error("Failed to start execution: " + std::string(e.what()));
    }
    return executionId;
}

std::string ExecutionManager::startBatch(std::vector<workflow::WorkflowEntry> entries, const BatchOptions& options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shuttingDown) {
        throw std::runtime_error("Execution manager is shutting down");
    }

    BatchEntry batch;
    auto& meta = batch.metadata;
    meta.batchId = generateId("batch");
    meta.status = "running";
    meta.sourceType = options.sourceType;
    meta.folderPath = options.folderPath;
    meta.totalWorkflows = static_cast<int>(entries.size());
    meta.workers = std::max(1, options.workers.value_or(m_config.maxWorkers));
    meta.priority = options.priority;
    meta.startTime = nowMs();
    meta.outputPath = options.outputPath.empty() ? m_config.defaultOutputPath : options.outputPath;

    for (auto& workflowEntry : entries) {
        if (!workflowEntry.valid) {
            ++meta.invalidWorkflows;
            LOG_WARN("Batch " + meta.batchId + ": skipping invalid workflow " + workflowEntry.fileName +
                     " (" + joinErrors(workflowEntry.errors) + ")");
            continue;
        }
        ++meta.validWorkflows;

        ExecutorOptions executorOptions;
        executorOptions.interactive = false;
        executorOptions.traceLogs = options.traceLogs;

        ExecutionEntry entry;
        entry.executionId = generateId("exec");
        entry.batchId = meta.batchId;
        entry.workflowFileName = workflowEntry.fileName;
        entry.workflowPath = workflowEntry.filePath;
        entry.status = ExecutionStatus::Queued;
        entry.executor = createExecutor(entry.executionId, meta.batchId, std::move(workflowEntry.workflow),
                                        std::move(executorOptions));

        const std::string executionId = entry.executionId;
        meta.executionIds.push_back(executionId);
        m_executions.emplace(executionId, std::move(entry));
    }
    meta.queued = meta.validWorkflows;

    const std::string batchId = meta.batchId;
    auto& stored = m_batches.emplace(batchId, std::move(batch)).first->second;

    // The batch row must exist before its executions (foreign key)
    persistBatchLocked(stored.metadata);
    for (const auto& executionId : stored.metadata.executionIds) {
        auto& entry = m_executions.at(executionId);
        persistExecutionLocked(entry);
        enqueueLocked(entry, stored.metadata.priority);
    }

    LOG_INFO("Batch " + batchId + " submitted: " + std::to_string(stored.metadata.validWorkflows) + " valid, " +
             std::to_string(stored.metadata.invalidWorkflows) + " invalid, workers " +
             std::to_string(stored.metadata.workers) + ", priority " + std::to_string(stored.metadata.priority));
    emitBatchEventLocked(EventType::BatchStart, stored.metadata);

    checkBatchCompletionLocked(stored);
    processQueueLocked();
    return batchId;
}

std::shared_ptr<Executor> ExecutionManager::createExecutor(const std::string& executionId,
                                                           const std::string& batchId,
                                                           workflow::Workflow workflow,
                                                           ExecutorOptions options) {
    auto executor = std::make_shared<Executor>(std::move(workflow), m_registry, std::move(options));
    executor->context().setDriverFactory(m_driverFactory);
    executor->setExecutionCallback([this, executionId, batchId](const ExecutionEvent& event) {
        ExecutionEvent tagged = event;
        tagged.executionId = executionId;
        tagged.batchId = batchId;
        emit(tagged);
    });
    return executor;
}

// =============================================================================
// Queue
// =============================================================================

void ExecutionManager::enqueueLocked(const ExecutionEntry& entry, int priority) {
    QueueItem item;
    item.executionId = entry.executionId;
    item.batchId = entry.batchId;
    item.priority = priority;
    item.sequence = m_nextSequence++;

    auto position = std::upper_bound(m_queue.begin(), m_queue.end(), item,
        [](const QueueItem& a, const QueueItem& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence < b.sequence;
        });
    m_queue.insert(position, std::move(item));
}

void ExecutionManager::processQueueLocked() {
    if (m_shuttingDown) {
        return;
    }

    auto it = m_queue.begin();
    while (it != m_queue.end() && m_admission.active() < m_admission.globalLimit()) {
        auto entryIt = m_executions.find(it->executionId);
        if (entryIt == m_executions.end() || entryIt->second.cancelled ||
            entryIt->second.status != ExecutionStatus::Queued) {
            it = m_queue.erase(it);
            continue;
        }

        int batchLimit = m_admission.globalLimit();
        auto batchIt = m_batches.find(it->batchId);
        if (batchIt != m_batches.end()) {
            batchLimit = batchIt->second.metadata.workers;
        }

        // A batch at its own limit must not hold back other batches behind it
        if (!m_admission.tryAcquire(it->batchId, batchLimit)) {
            ++it;
            continue;
        }

        it = m_queue.erase(it);
        entryIt->second.slotHeld = true;
        dispatchLocked(entryIt->second);
    }
}

void ExecutionManager::dispatchLocked(ExecutionEntry& entry) {
    entry.status = ExecutionStatus::Running;
    entry.workerId = ++m_nextWorkerId;
    entry.startTime = nowMs();
    m_mostRecentExecutionId = entry.executionId;

    auto batchIt = m_batches.find(entry.batchId);
    if (batchIt != m_batches.end()) {
        auto& meta = batchIt->second.metadata;
        meta.queued = std::max(0, meta.queued - 1);
        ++meta.running;
        persistProgressLocked(meta);
        emitBatchEventLocked(EventType::BatchProgress, meta);
    }
    persistExecutionLocked(entry);

    LOG_DEBUG("Dispatching " + entry.executionId + " (" + entry.workflowFileName + ") on worker " +
              std::to_string(*entry.workerId));
    try {
        entry.thread = std::thread(&ExecutionManager::runExecution, this, entry.executionId, entry.executor);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start worker for " + entry.executionId + ": " + e.what());
        finishLocked(entry, ExecutionStatus::Error, std::string("Failed to start worker: ") + e.what());
    }
}

// =============================================================================
// Completion
// =============================================================================

void ExecutionManager::runExecution(const std::string& executionId, std::shared_ptr<Executor> executor) {
    ExecutionStatus outcome = ExecutionStatus::Completed;
    std::string error;
    try {
        executor->execute();
        if (executor->getStatus() == ExecutorStatus::Stopped) {
            outcome = ExecutionStatus::Stopped;
        }
    } catch (const std::exception& e) {
        outcome = ExecutionStatus::Error;
        error = e.what();
    } catch (...) {
        outcome = ExecutionStatus::Error;
        error = "Unknown error";
    }
    handleCompletion(executionId, outcome, error);
}

void ExecutionManager::handleCompletion(const std::string& executionId, ExecutionStatus outcome,
                                        const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_executions.find(executionId);
    if (it == m_executions.end()) {
        return;
    }
    // Already settled by a stop
    if (isTerminal(it->second.status)) {
        return;
    }

    if (outcome == ExecutionStatus::Error) {
        LOG_WARN("Execution " + executionId + " failed: " + error);
    } else {
        LOG_INFO("Execution " + executionId + " " + executionStatusToString(outcome));
    }
    finishLocked(it->second, outcome, error);
    processQueueLocked();
}

void ExecutionManager::finishLocked(ExecutionEntry& entry, ExecutionStatus status, const std::string& error) {
    const bool wasRunning = entry.status == ExecutionStatus::Running;
    const bool wasQueued = entry.status == ExecutionStatus::Queued;

    entry.status = status;
    entry.endTime = nowMs();
    if (!error.empty()) {
        entry.error = error;
    }
    releaseSlotLocked(entry);
    entry.evictAt = Clock::now() + std::chrono::milliseconds(m_config.evictionDelayMs);
    persistExecutionLocked(entry);

    // Never started, so the executor will not report it
    if (wasQueued) {
        ExecutionEvent event;
        event.type = EventType::ExecutionStopped;
        event.executionId = entry.executionId;
        event.batchId = entry.batchId;
        emit(event);
    }

    auto batchIt = m_batches.find(entry.batchId);
    if (batchIt == m_batches.end() || batchIt->second.metadata.isTerminal()) {
        return;
    }
    auto& meta = batchIt->second.metadata;
    if (wasRunning) meta.running = std::max(0, meta.running - 1);
    if (wasQueued) meta.queued = std::max(0, meta.queued - 1);
    if (status == ExecutionStatus::Completed) {
        ++meta.completed;
    } else {
        ++meta.failed;
    }
    persistProgressLocked(meta);
    emitBatchEventLocked(EventType::BatchProgress, meta);
    checkBatchCompletionLocked(batchIt->second);
}

void ExecutionManager::checkBatchCompletionLocked(BatchEntry& batch) {
    auto& meta = batch.metadata;
    if (meta.isTerminal() || meta.completed + meta.failed < meta.validWorkflows) {
        return;
    }

    bool nothingRan = meta.validWorkflows == 0 && meta.invalidWorkflows > 0;
    meta.status = (meta.failed > 0 || nothingRan) ? "error" : "completed";
    meta.running = 0;
    meta.queued = 0;
    meta.endTime = nowMs();
    batch.evictAt = Clock::now() + std::chrono::milliseconds(m_config.evictionDelayMs);
    persistProgressLocked(meta);

    LOG_INFO("Batch " + meta.batchId + " " + meta.status + ": " + std::to_string(meta.completed) +
             " completed, " + std::to_string(meta.failed) + " failed");
    emitBatchEventLocked(EventType::BatchComplete, meta);
}

void ExecutionManager::releaseSlotLocked(ExecutionEntry& entry) {
    if (entry.slotHeld) {
        m_admission.release(entry.batchId);
        entry.slotHeld = false;
    }
}

bool ExecutionManager::cancelQueuedLocked(ExecutionEntry& entry) {
    entry.cancelled = true;
    auto it = std::find_if(m_queue.begin(), m_queue.end(),
                           [&](const QueueItem& item) { return item.executionId == entry.executionId; });
    if (it == m_queue.end()) {
        return false;
    }
    m_queue.erase(it);
    return true;
}

// =============================================================================
// Stop
// =============================================================================

StopResult ExecutionManager::stopExecution(const std::string& executionId) {
    StopResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_executions.find(executionId);
        if (it != m_executions.end()) {
            result.found = true;
            auto& entry = it->second;
            if (entry.status == ExecutionStatus::Queued) {
                cancelQueuedLocked(entry);
                finishLocked(entry, ExecutionStatus::Stopped, "");
                result.wasQueued = true;
            } else if (entry.status == ExecutionStatus::Running) {
                entry.executor->stop();
                finishLocked(entry, ExecutionStatus::Stopped, "");
                result.wasRunning = true;
                processQueueLocked();
            }
            LOG_INFO("Stop " + executionId + ": wasRunning=" + (result.wasRunning ? "true" : "false") +
                     ", wasQueued=" + (result.wasQueued ? "true" : "false"));
            return result;
        }
    }

    // Evicted long ago: it can only have finished
    if (m_storage && m_storage->getExecution(executionId)) {
        result.found = true;
    }
    return result;
}

BatchStopResult ExecutionManager::stopBatch(const std::string& batchId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_batches.find(batchId);
        if (it != m_batches.end()) {
            BatchStopResult result = stopBatchLocked(it->second);
            processQueueLocked();
            return result;
        }
    }

    BatchStopResult result;
    if (!m_storage) {
        return result;
    }
    auto stored = m_storage->getBatch(batchId);
    if (stored) {
        result.found = true;
        // Left running by an earlier process
        if (stored->status == "running") {
            m_storage->markBatchStopped(batchId);
        }
    }
    return result;
}

BatchStopResult ExecutionManager::stopBatchLocked(BatchEntry& batch) {
    BatchStopResult result;
    result.found = true;
    auto& meta = batch.metadata;
    if (meta.isTerminal()) {
        return result;
    }

    // Terminal first, member transitions below then leave the counters alone
    meta.status = "stopped";

    for (const auto& executionId : meta.executionIds) {
        auto it = m_executions.find(executionId);
        if (it == m_executions.end()) {
            continue;
        }
        auto& entry = it->second;
        if (entry.status == ExecutionStatus::Queued) {
            cancelQueuedLocked(entry);
            finishLocked(entry, ExecutionStatus::Stopped, "");
            ++result.queuedCancelled;
            result.stoppedExecutions.push_back(executionId);
        } else if (entry.status == ExecutionStatus::Running) {
            entry.executor->stop();
            finishLocked(entry, ExecutionStatus::Stopped, "");
            ++result.runningStopped;
            result.stoppedExecutions.push_back(executionId);
        }
    }

    meta.running = 0;
    meta.queued = 0;
    meta.endTime = nowMs();
    batch.evictAt = Clock::now() + std::chrono::milliseconds(m_config.evictionDelayMs);
    persistProgressLocked(meta);

    LOG_INFO("Batch " + meta.batchId + " stopped: " + std::to_string(result.runningStopped) + " running, " +
             std::to_string(result.queuedCancelled) + " queued");
    emitBatchEventLocked(EventType::BatchComplete, meta);
    return result;
}

StopAllResult ExecutionManager::stopAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    StopAllResult result;
    for (auto& [batchId, batch] : m_batches) {
        const auto& meta = batch.metadata;
        if (meta.isTerminal() && meta.running == 0 && meta.queued == 0) {
            continue;
        }
        BatchStopResult stopped = stopBatchLocked(batch);
        ++result.totalBatches;
        result.runningStopped += stopped.runningStopped;
        result.queuedCancelled += stopped.queuedCancelled;
        result.batches.emplace_back(batchId, stopped.runningStopped + stopped.queuedCancelled);
    }
    processQueueLocked();
    LOG_INFO("Stopped " + std::to_string(result.totalBatches) + " batches (" +
             std::to_string(result.totalStopped()) + " executions)");
    return result;
}

// =============================================================================
// Pause controls
// =============================================================================

bool ExecutionManager::continueExecution(const std::string& executionId) {
    auto executor = getExecutor(executionId);
    return executor && executor->continueExecution();
}

bool ExecutionManager::skipNext(const std::string& executionId) {
    auto executor = getExecutor(executionId);
    return executor && executor->skip();
}

bool ExecutionManager::continueWithoutBreakpoint(const std::string& executionId) {
    auto executor = getExecutor(executionId);
    return executor && executor->continueWithoutBreakpoint();
}

bool ExecutionManager::stopFromPause(const std::string& executionId) {
    auto executor = getExecutor(executionId);
    if (!executor || !executor->isPaused()) {
        return false;
    }
    stopExecution(executionId);
    return true;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<nlohmann::json> ExecutionManager::getExecutionStatus(const std::string& executionId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_executions.find(executionId);
        if (it != m_executions.end()) {
            const auto& entry = it->second;
            nlohmann::json status = {
                {"executionId", entry.executionId},
                {"status", executionStatusToString(entry.status)},
                {"workflowFileName", entry.workflowFileName},
                {"currentNodeId", nullptr},
                {"error", entry.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.error)},
                {"pausedNodeId", nullptr},
                {"pauseReason", nullptr},
                {"workerId", entry.workerId ? nlohmann::json(*entry.workerId) : nlohmann::json(nullptr)},
                {"startTime", optionalJson(entry.startTime)},
                {"endTime", optionalJson(entry.endTime)}
            };
            if (!entry.batchId.empty()) {
                status["batchId"] = entry.batchId;
            }
            if (entry.executor) {
                status["executorStatus"] = executorStatusToString(entry.executor->getStatus());
                if (auto nodeId = entry.executor->getCurrentNodeId()) status["currentNodeId"] = *nodeId;
                if (auto pausedId = entry.executor->getPausedNodeId()) status["pausedNodeId"] = *pausedId;
                if (auto reason = entry.executor->getPauseReason()) status["pauseReason"] = pauseReasonToString(*reason);
            }
            return status;
        }
    }

    if (!m_storage) {
        return std::nullopt;
    }
    auto record = m_storage->getExecution(executionId);
    if (!record) {
        return std::nullopt;
    }
    nlohmann::json status = record->toJson();
    status["currentNodeId"] = nullptr;
    status["pausedNodeId"] = nullptr;
    status["pauseReason"] = nullptr;
    return status;
}

std::optional<storage::BatchMetadata> ExecutionManager::getBatchStatus(const std::string& batchId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_batches.find(batchId);
        if (it != m_batches.end()) {
            return it->second.metadata;
        }
    }
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->getBatch(batchId);
}

std::vector<storage::ExecutionRecord> ExecutionManager::getBatchExecutions(const std::string& batchId) {
    std::vector<std::string> evicted;
    std::vector<std::pair<std::string, storage::ExecutionRecord>> live;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_batches.find(batchId);
        if (it != m_batches.end()) {
            for (const auto& executionId : it->second.metadata.executionIds) {
                auto entryIt = m_executions.find(executionId);
                if (entryIt != m_executions.end()) {
                    live.emplace_back(executionId, toRecord(entryIt->second));
                } else {
                    live.emplace_back(executionId, storage::ExecutionRecord{});
                    evicted.push_back(executionId);
                }
            }
        }
    }

    if (live.empty()) {
        return m_storage ? m_storage->getBatchExecutions(batchId) : std::vector<storage::ExecutionRecord>{};
    }

    std::vector<storage::ExecutionRecord> result;
    result.reserve(live.size());
    for (auto& [executionId, record] : live) {
        if (record.executionId.empty()) {
            if (!m_storage) continue;
            auto stored = m_storage->getExecution(executionId);
            if (!stored) continue;
            record = std::move(*stored);
        }
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<storage::BatchMetadata> ExecutionManager::listBatches(const storage::BatchFilter& filter) {
    if (m_storage) {
        return m_storage->getBatches(filter);
    }

    std::vector<storage::BatchMetadata> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [batchId, batch] : m_batches) {
            if (!filter.status || batch.metadata.status == *filter.status) {
                result.push_back(batch.metadata);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const storage::BatchMetadata& a, const storage::BatchMetadata& b) {
        return a.startTime > b.startTime;
    });

    size_t offset = static_cast<size_t>(std::max(0, filter.offset));
    if (offset >= result.size()) {
        return {};
    }
    result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(offset));
    if (filter.limit > 0 && result.size() > static_cast<size_t>(filter.limit)) {
        result.resize(static_cast<size_t>(filter.limit));
    }
    return result;
}

nlohmann::json ExecutionManager::getActiveExecutions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json active = nlohmann::json::array();
    for (const auto& [executionId, entry] : m_executions) {
        if (entry.status != ExecutionStatus::Running) {
            continue;
        }
        nlohmann::json item = {
            {"executionId", executionId},
            {"workflowFileName", entry.workflowFileName},
            {"status", executionStatusToString(entry.status)},
            {"workerId", entry.workerId ? nlohmann::json(*entry.workerId) : nlohmann::json(nullptr)},
            {"startTime", optionalJson(entry.startTime)},
            {"currentNodeId", nullptr},
            {"paused", false}
        };
        if (!entry.batchId.empty()) {
            item["batchId"] = entry.batchId;
        }
        if (entry.executor) {
            if (auto nodeId = entry.executor->getCurrentNodeId()) item["currentNodeId"] = *nodeId;
            item["paused"] = entry.executor->isPaused();
        }
        active.push_back(std::move(item));
    }
    return active;
}

std::optional<std::string> ExecutionManager::getMostRecentExecutionId() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mostRecentExecutionId;
}

std::shared_ptr<Executor> ExecutionManager::getExecutor(const std::string& executionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_executions.find(executionId);
    return it != m_executions.end() ? it->second.executor : nullptr;
}

int ExecutionManager::activeWorkers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_admission.active();
}

size_t ExecutionManager::queueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

// =============================================================================
// Persistence and events
// =============================================================================

storage::ExecutionRecord ExecutionManager::toRecord(const ExecutionEntry& entry) {
    storage::ExecutionRecord record;
    record.executionId = entry.executionId;
    record.batchId = entry.batchId;
    record.workflowFileName = entry.workflowFileName;
    record.workflowPath = entry.workflowPath;
    record.status = executionStatusToString(entry.status);
    record.workerId = entry.workerId;
    record.startTime = entry.startTime;
    record.endTime = entry.endTime;
    record.error = entry.error;
    return record;
}

void ExecutionManager::persistExecutionLocked(const ExecutionEntry& entry) {
    if (!m_storage) {
        return;
    }
    try {
        m_storage->saveExecution(toRecord(entry));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist execution " + entry.executionId + ": " + e.what());
    }
}

void ExecutionManager::persistBatchLocked(const storage::BatchMetadata& batch) {
    if (!m_storage) {
        return;
    }
    try {
        m_storage->saveBatch(batch);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist batch " + batch.batchId + ": " + e.what());
    }
}

void ExecutionManager::persistProgressLocked(const storage::BatchMetadata& batch) {
    if (!m_storage) {
        return;
    }
    storage::BatchProgress progress;
    progress.completed = batch.completed;
    progress.running = batch.running;
    progress.queued = batch.queued;
    progress.failed = batch.failed;
    progress.status = batch.status;
    progress.endTime = batch.endTime;
    try {
        m_storage->updateBatchProgress(batch.batchId, progress);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist progress of batch " + batch.batchId + ": " + e.what());
    }
}

void ExecutionManager::emitBatchEventLocked(EventType type, const storage::BatchMetadata& batch) {
    ExecutionEvent event;
    event.type = type;
    event.batchId = batch.batchId;
    event.payload = {
        {"status", batch.status},
        {"totalWorkflows", batch.totalWorkflows},
        {"validWorkflows", batch.validWorkflows},
        {"invalidWorkflows", batch.invalidWorkflows},
        {"completed", batch.completed},
        {"running", batch.running},
        {"queued", batch.queued},
        {"failed", batch.failed}
    };
    emit(event);
}

void ExecutionManager::emit(const ExecutionEvent& event) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    if (m_eventSink) {
        m_eventSink(event);
    }
}

// =============================================================================
// Housekeeping
// =============================================================================

void ExecutionManager::recoverInterruptedBatches() {
    if (!m_storage) {
        return;
    }
    try {
        for (const auto& batch : m_storage->loadActiveBatches()) {
            LOG_WARN("Batch " + batch.batchId + " was interrupted by a restart, marking it stopped");
            m_storage->markBatchStopped(batch.batchId);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to recover interrupted batches: ") + e.what());
    }
}

void ExecutionManager::janitorLoop() {
    const auto interval = std::chrono::milliseconds(
        std::max<int64_t>(10, std::min<int64_t>(m_config.evictionDelayMs, 250)));

    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shuttingDown) {
        m_janitorCv.wait_for(lock, interval, [this]() { return m_shuttingDown; });
        if (m_shuttingDown) {
            break;
        }

        const auto now = Clock::now();
        std::vector<std::thread> finished;
        for (auto it = m_executions.begin(); it != m_executions.end();) {
            const auto& evictAt = it->second.evictAt;
            if (evictAt && *evictAt <= now) {
                if (it->second.thread.joinable()) {
                    finished.push_back(std::move(it->second.thread));
                }
                LOG_DEBUG("Evicting execution " + it->first);
                it = m_executions.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = m_batches.begin(); it != m_batches.end();) {
            const auto& evictAt = it->second.evictAt;
            if (evictAt && *evictAt <= now) {
                LOG_DEBUG("Evicting batch " + it->first);
                it = m_batches.erase(it);
            } else {
                ++it;
            }
        }

        if (!finished.empty()) {
            lock.unlock();
            for (auto& thread : finished) {
                thread.join();
            }
            lock.lock();
        }
    }
}

std::string ExecutionManager::generateId(const std::string& prefix) {
    std::uniform_int_distribution<uint64_t> dis;
    std::stringstream ss;
    ss << prefix << "_" << std::hex << std::setfill('0') << std::setw(16) << dis(m_random);
    return ss.str();
}

} // namespace engine
} // namespace automflow
