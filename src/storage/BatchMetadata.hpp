#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace automflow {
namespace storage {

/**
 * Progress counters of a batch, as written by the scheduler after every
 * member transition
 */
struct BatchProgress {
    int completed = 0;
    int running = 0;
    int queued = 0;
    int failed = 0;
    std::string status = "running";          // running | completed | error | stopped
    std::optional<int64_t> endTime;          // set once the batch is terminal
};

/**
 * One batch submission
 *
 * Invariants kept by the scheduler:
 *   completed + failed <= validWorkflows
 *   running <= min(workers, global worker cap)
 */
struct BatchMetadata {
    std::string batchId;
    std::string status = "running";          // running | completed | error | stopped
    std::string sourceType = "workflows";    // folder | files | workflows
    std::string folderPath;                  // folder submissions only
    int totalWorkflows = 0;
    int validWorkflows = 0;
    int invalidWorkflows = 0;
    int completed = 0;
    int running = 0;
    int queued = 0;
    int failed = 0;
    int workers = 1;                         // batch worker ceiling
    int priority = 0;
    int64_t startTime = 0;                   // ms since epoch
    std::optional<int64_t> endTime;
    std::string createdAt;                   // ISO 8601, set by storage
    std::string outputPath = "./output";
    std::vector<std::string> executionIds;   // member order

    bool isTerminal() const { return status != "running"; }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"batchId", batchId},
            {"status", status},
            {"sourceType", sourceType},
            {"totalWorkflows", totalWorkflows},
            {"validWorkflows", validWorkflows},
            {"invalidWorkflows", invalidWorkflows},
            {"completed", completed},
            {"running", running},
            {"queued", queued},
            {"failed", failed},
            {"workers", workers},
            {"priority", priority},
            {"startTime", startTime},
            {"endTime", endTime ? nlohmann::json(*endTime) : nlohmann::json(nullptr)},
            {"outputPath", outputPath},
            {"executionIds", executionIds}
        };
        if (!folderPath.empty()) j["folderPath"] = folderPath;
        if (!createdAt.empty()) j["createdAt"] = createdAt;
        return j;
    }
};

/**
 * Durable summary of one execution (batch member or single run)
 */
struct ExecutionRecord {
    std::string executionId;
    std::string batchId;                     // empty for single runs
    std::string workflowFileName;
    std::string workflowPath;
    std::string status = "idle";             // idle | running | completed | error | stopped
    std::optional<int> workerId;
    std::optional<int64_t> startTime;
    std::optional<int64_t> endTime;
    std::string error;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"executionId", executionId},
            {"workflowFileName", workflowFileName},
            {"status", status},
            {"workerId", workerId ? nlohmann::json(*workerId) : nlohmann::json(nullptr)},
            {"startTime", startTime ? nlohmann::json(*startTime) : nlohmann::json(nullptr)},
            {"endTime", endTime ? nlohmann::json(*endTime) : nlohmann::json(nullptr)},
            {"error", error.empty() ? nlohmann::json(nullptr) : nlohmann::json(error)}
        };
        if (!batchId.empty()) j["batchId"] = batchId;
        if (!workflowPath.empty()) j["workflowPath"] = workflowPath;
        return j;
    }
};

/**
 * Filter for batch listings
 */
struct BatchFilter {
    std::optional<std::string> status;
    int limit = 50;
    int offset = 0;
};

} // namespace storage
} // namespace automflow
