#pragma once

#include "storage/BatchMetadata.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace automflow {
namespace storage {

/**
 * SQLite-based storage for batches and their executions
 *
 * Keeps the durable summary of every batch and execution so status queries
 * still answer once the scheduler has evicted them from memory, and so a
 * restart can find batches that were interrupted.
 *
 * Thread-safe: every operation holds an internal mutex.
 *
 * Usage:
 *   BatchStorage db("./automflow.db");
 *   db.saveBatch(batch);
 *   db.saveExecution(record);
 *   auto loaded = db.getBatch(batch.batchId);
 */
class BatchStorage {
public:
    /**
     * Open or create a SQLite database at the given path
     */
    explicit BatchStorage(const std::string& dbPath);
    ~BatchStorage();

    // Non-copyable
    BatchStorage(const BatchStorage&) = delete;
    BatchStorage& operator=(const BatchStorage&) = delete;

    // Movable
    BatchStorage(BatchStorage&&) noexcept;
    BatchStorage& operator=(BatchStorage&&) noexcept;

    // === Batches ===

    /**
     * Insert or update a batch (created_at is kept on update)
     */
    void saveBatch(const BatchMetadata& batch);

    /**
     * Batch by id, with executionIds in member order
     */
    std::optional<BatchMetadata> getBatch(const std::string& batchId);

    /**
     * Batches ordered by start time, newest first
     */
    std::vector<BatchMetadata> getBatches(const BatchFilter& filter = {});

    /**
     * Batches still marked running
     */
    std::vector<BatchMetadata> loadActiveBatches();

    void updateBatchProgress(const std::string& batchId, const BatchProgress& progress);

    /**
     * Mark a batch stopped with zero running/queued, and every member that had
     * not reached a terminal status as stopped
     */
    void markBatchStopped(const std::string& batchId);

    /**
     * Delete a batch and its executions. Returns false if it did not exist.
     */
    bool deleteBatch(const std::string& batchId);

    /**
     * Delete terminal batches that ended more than retentionDays ago.
     * Returns the number of batches deleted.
     */
    int cleanupOldBatches(int retentionDays);

    /**
     * Delete every batch. Returns the number of batches deleted.
     */
    int clearAllBatches();

    // === Executions ===

    /**
     * Insert or update an execution record
     */
    void saveExecution(const ExecutionRecord& record);

    std::optional<ExecutionRecord> getExecution(const std::string& executionId);

    /**
     * Members of a batch in submission order
     */
    std::vector<ExecutionRecord> getBatchExecutions(const std::string& batchId);

    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace automflow
