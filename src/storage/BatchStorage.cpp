#include "storage/BatchStorage.hpp"
#include <sqlite3.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace automflow {
namespace storage {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    /// Empty strings are stored as NULL
    void bindTextOrNull(int index, const std::string& value) {
        if (value.empty()) {
            bindNull(index);
        } else {
            bindText(index, value);
        }
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindInt64(int index, const std::optional<int64_t>& value) {
        if (value) {
            bindInt64(index, *value);
        } else {
            bindNull(index);
        }
    }

    void bindNull(int index) {
        sqlite3_bind_null(m_stmt, index);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    std::optional<int64_t> getOptionalInt64(int col) {
        if (isNull(col)) return std::nullopt;
        return getInt64(col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

const char* kBatchColumns =
    "batch_id, status, source_type, folder_path, total_workflows, valid_workflows, "
    "invalid_workflows, completed, running, queued, failed, workers, priority, "
    "start_time, end_time, created_at, output_path";

const char* kExecutionColumns =
    "execution_id, batch_id, workflow_file_name, workflow_path, status, worker_id, "
    "start_time, end_time, error";

BatchMetadata readBatch(Statement& stmt) {
    BatchMetadata batch;
    batch.batchId = stmt.getText(0);
    batch.status = stmt.getText(1);
    batch.sourceType = stmt.getText(2);
    batch.folderPath = stmt.getText(3);
    batch.totalWorkflows = static_cast<int>(stmt.getInt64(4));
    batch.validWorkflows = static_cast<int>(stmt.getInt64(5));
    batch.invalidWorkflows = static_cast<int>(stmt.getInt64(6));
    batch.completed = static_cast<int>(stmt.getInt64(7));
    batch.running = static_cast<int>(stmt.getInt64(8));
    batch.queued = static_cast<int>(stmt.getInt64(9));
    batch.failed = static_cast<int>(stmt.getInt64(10));
    batch.workers = static_cast<int>(stmt.getInt64(11));
    batch.priority = static_cast<int>(stmt.getInt64(12));
    batch.startTime = stmt.getInt64(13);
    batch.endTime = stmt.getOptionalInt64(14);
    batch.createdAt = stmt.getText(15);
    batch.outputPath = stmt.getText(16);
    return batch;
}

ExecutionRecord readExecution(Statement& stmt) {
    ExecutionRecord record;
    record.executionId = stmt.getText(0);
    record.batchId = stmt.getText(1);
    record.workflowFileName = stmt.getText(2);
    record.workflowPath = stmt.getText(3);
    record.status = stmt.getText(4);
    if (!stmt.isNull(5)) {
        record.workerId = static_cast<int>(stmt.getInt64(5));
    }
    record.startTime = stmt.getOptionalInt64(6);
    record.endTime = stmt.getOptionalInt64(7);
    record.error = stmt.getText(8);
    return record;
}

} // anonymous namespace

// =============================================================================
// BatchStorage::Impl
// =============================================================================

class BatchStorage::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("Failed to open database: " + error);
        }

        // Concurrent readers while the scheduler writes
        exec("PRAGMA journal_mode = WAL");
        exec("PRAGMA foreign_keys = ON");

        createTables();
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS batches (
                batch_id TEXT PRIMARY KEY,
                status TEXT NOT NULL,
                source_type TEXT NOT NULL,
                folder_path TEXT,
                total_workflows INTEGER NOT NULL DEFAULT 0,
                valid_workflows INTEGER NOT NULL DEFAULT 0,
                invalid_workflows INTEGER NOT NULL DEFAULT 0,
                completed INTEGER NOT NULL DEFAULT 0,
                running INTEGER NOT NULL DEFAULT 0,
                queued INTEGER NOT NULL DEFAULT 0,
                failed INTEGER NOT NULL DEFAULT 0,
                workers INTEGER NOT NULL DEFAULT 1,
                priority INTEGER NOT NULL DEFAULT 0,
                start_time INTEGER NOT NULL,
                end_time INTEGER,
                created_at TEXT NOT NULL,
                output_path TEXT
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS executions (
                execution_id TEXT PRIMARY KEY,
                batch_id TEXT,
                workflow_file_name TEXT,
                workflow_path TEXT,
                status TEXT NOT NULL,
                worker_id INTEGER,
                start_time INTEGER,
                end_time INTEGER,
                error TEXT,
                FOREIGN KEY (batch_id) REFERENCES batches(batch_id) ON DELETE CASCADE
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_executions_batch ON executions(batch_id)");
        exec("CREATE INDEX IF NOT EXISTS idx_executions_status ON executions(status)");
        exec("CREATE INDEX IF NOT EXISTS idx_batches_status ON batches(status)");
        exec("CREATE INDEX IF NOT EXISTS idx_batches_start ON batches(start_time DESC)");
    }

    // === Batches ===

    void saveBatch(const BatchMetadata& batch) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, std::string("INSERT INTO batches (") + kBatchColumns + R"()
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(batch_id) DO UPDATE SET
                status = excluded.status,
                source_type = excluded.source_type,
                folder_path = excluded.folder_path,
                total_workflows = excluded.total_workflows,
                valid_workflows = excluded.valid_workflows,
                invalid_workflows = excluded.invalid_workflows,
                completed = excluded.completed,
                running = excluded.running,
                queued = excluded.queued,
                failed = excluded.failed,
                workers = excluded.workers,
                priority = excluded.priority,
                start_time = excluded.start_time,
                end_time = excluded.end_time,
                output_path = excluded.output_path
        )");
        stmt.bindText(1, batch.batchId);
        stmt.bindText(2, batch.status);
        stmt.bindText(3, batch.sourceType);
        stmt.bindTextOrNull(4, batch.folderPath);
        stmt.bindInt64(5, batch.totalWorkflows);
        stmt.bindInt64(6, batch.validWorkflows);
        stmt.bindInt64(7, batch.invalidWorkflows);
        stmt.bindInt64(8, batch.completed);
        stmt.bindInt64(9, batch.running);
        stmt.bindInt64(10, batch.queued);
        stmt.bindInt64(11, batch.failed);
        stmt.bindInt64(12, batch.workers);
        stmt.bindInt64(13, batch.priority);
        stmt.bindInt64(14, batch.startTime);
        stmt.bindInt64(15, batch.endTime);
        stmt.bindText(16, batch.createdAt.empty() ? currentTimestamp() : batch.createdAt);
        stmt.bindTextOrNull(17, batch.outputPath);
        stmt.step();
    }

    std::optional<BatchMetadata> getBatch(const std::string& batchId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, std::string("SELECT ") + kBatchColumns + " FROM batches WHERE batch_id = ?");
        stmt.bindText(1, batchId);
        if (!stmt.step()) {
            return std::nullopt;
        }
        BatchMetadata batch = readBatch(stmt);
        batch.executionIds = executionIdsOf(batchId);
        return batch;
    }

    std::vector<BatchMetadata> getBatches(const BatchFilter& filter) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string sql = std::string("SELECT ") + kBatchColumns + " FROM batches";
        if (filter.status) {
            sql += " WHERE status = ?";
        }
        sql += " ORDER BY start_time DESC, rowid DESC LIMIT ? OFFSET ?";

        Statement stmt(m_db, sql);
        int index = 1;
        if (filter.status) {
            stmt.bindText(index++, *filter.status);
        }
        stmt.bindInt64(index++, filter.limit > 0 ? filter.limit : -1);
        stmt.bindInt64(index, filter.offset > 0 ? filter.offset : 0);

        std::vector<BatchMetadata> result;
        while (stmt.step()) {
            result.push_back(readBatch(stmt));
        }
        for (auto& batch : result) {
            batch.executionIds = executionIdsOf(batch.batchId);
        }
        return result;
    }

    std::vector<BatchMetadata> loadActiveBatches() {
        BatchFilter filter;
        filter.status = "running";
        filter.limit = 0;
        return getBatches(filter);
    }

    void updateBatchProgress(const std::string& batchId, const BatchProgress& progress) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, R"(
            UPDATE batches
            SET completed = ?, running = ?, queued = ?, failed = ?, status = ?,
                end_time = COALESCE(?, end_time)
            WHERE batch_id = ?
        )");
        stmt.bindInt64(1, progress.completed);
        stmt.bindInt64(2, progress.running);
        stmt.bindInt64(3, progress.queued);
        stmt.bindInt64(4, progress.failed);
        stmt.bindText(5, progress.status);
        stmt.bindInt64(6, progress.endTime);
        stmt.bindText(7, batchId);
        stmt.step();
    }

    void markBatchStopped(const std::string& batchId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        int64_t now = nowMs();
        {
            Statement stmt(m_db, R"(
                UPDATE batches
                SET status = 'stopped', running = 0, queued = 0, end_time = COALESCE(end_time, ?)
                WHERE batch_id = ?
            )");
            stmt.bindInt64(1, now);
            stmt.bindText(2, batchId);
            stmt.step();
        }
        {
            Statement stmt(m_db, R"(
                UPDATE executions
                SET status = 'stopped', end_time = COALESCE(end_time, ?)
                WHERE batch_id = ? AND status IN ('idle', 'running')
            )");
            stmt.bindInt64(1, now);
            stmt.bindText(2, batchId);
            stmt.step();
        }
    }

    bool deleteBatch(const std::string& batchId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM batches WHERE batch_id = ?");
        stmt.bindText(1, batchId);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    int cleanupOldBatches(int retentionDays) {
        std::lock_guard<std::mutex> lock(m_mutex);
        int64_t cutoff = nowMs() - static_cast<int64_t>(retentionDays) * 24 * 60 * 60 * 1000;
        Statement stmt(m_db, R"(
            DELETE FROM batches
            WHERE status != 'running' AND end_time IS NOT NULL AND end_time < ?
        )");
        stmt.bindInt64(1, cutoff);
        stmt.step();
        return sqlite3_changes(m_db);
    }

    int clearAllBatches() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM batches");
        stmt.step();
        return sqlite3_changes(m_db);
    }

    // === Executions ===

    void saveExecution(const ExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, std::string("INSERT INTO executions (") + kExecutionColumns + R"()
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(execution_id) DO UPDATE SET
                batch_id = excluded.batch_id,
                workflow_file_name = excluded.workflow_file_name,
                workflow_path = excluded.workflow_path,
                status = excluded.status,
                worker_id = excluded.worker_id,
                start_time = excluded.start_time,
                end_time = excluded.end_time,
                error = excluded.error
        )");
        stmt.bindText(1, record.executionId);
        stmt.bindTextOrNull(2, record.batchId);
        stmt.bindText(3, record.workflowFileName);
        stmt.bindTextOrNull(4, record.workflowPath);
        stmt.bindText(5, record.status);
        if (record.workerId) {
            stmt.bindInt64(6, *record.workerId);
        } else {
            stmt.bindNull(6);
        }
        stmt.bindInt64(7, record.startTime);
        stmt.bindInt64(8, record.endTime);
        stmt.bindTextOrNull(9, record.error);
        stmt.step();
    }

    std::optional<ExecutionRecord> getExecution(const std::string& executionId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, std::string("SELECT ") + kExecutionColumns +
                             " FROM executions WHERE execution_id = ?");
        stmt.bindText(1, executionId);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readExecution(stmt);
    }

    std::vector<ExecutionRecord> getBatchExecutions(const std::string& batchId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, std::string("SELECT ") + kExecutionColumns +
                             " FROM executions WHERE batch_id = ? ORDER BY rowid");
        stmt.bindText(1, batchId);
        std::vector<ExecutionRecord> result;
        while (stmt.step()) {
            result.push_back(readExecution(stmt));
        }
        return result;
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    // Caller holds m_mutex
    std::vector<std::string> executionIdsOf(const std::string& batchId) {
        Statement stmt(m_db, "SELECT execution_id FROM executions WHERE batch_id = ? ORDER BY rowid");
        stmt.bindText(1, batchId);
        std::vector<std::string> ids;
        while (stmt.step()) {
            ids.push_back(stmt.getText(0));
        }
        return ids;
    }

    std::string m_dbPath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

// =============================================================================
// BatchStorage Public Interface
// =============================================================================

BatchStorage::BatchStorage(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

BatchStorage::~BatchStorage() = default;

BatchStorage::BatchStorage(BatchStorage&&) noexcept = default;
BatchStorage& BatchStorage::operator=(BatchStorage&&) noexcept = default;

void BatchStorage::saveBatch(const BatchMetadata& batch) {
    m_impl->saveBatch(batch);
}

std::optional<BatchMetadata> BatchStorage::getBatch(const std::string& batchId) {
    return m_impl->getBatch(batchId);
}

std::vector<BatchMetadata> BatchStorage::getBatches(const BatchFilter& filter) {
    return m_impl->getBatches(filter);
}

std::vector<BatchMetadata> BatchStorage::loadActiveBatches() {
    return m_impl->loadActiveBatches();
}

void BatchStorage::updateBatchProgress(const std::string& batchId, const BatchProgress& progress) {
    m_impl->updateBatchProgress(batchId, progress);
}

void BatchStorage::markBatchStopped(const std::string& batchId) {
    m_impl->markBatchStopped(batchId);
}

bool BatchStorage::deleteBatch(const std::string& batchId) {
    return m_impl->deleteBatch(batchId);
}

int BatchStorage::cleanupOldBatches(int retentionDays) {
    return m_impl->cleanupOldBatches(retentionDays);
}

int BatchStorage::clearAllBatches() {
    return m_impl->clearAllBatches();
}

void BatchStorage::saveExecution(const ExecutionRecord& record) {
    m_impl->saveExecution(record);
}

std::optional<ExecutionRecord> BatchStorage::getExecution(const std::string& executionId) {
    return m_impl->getExecution(executionId);
}

std::vector<ExecutionRecord> BatchStorage::getBatchExecutions(const std::string& batchId) {
    return m_impl->getBatchExecutions(batchId);
}

const std::string& BatchStorage::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
} // namespace automflow
