#pragma once

#include "workflow/Workflow.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace automflow {
namespace workflow {

/**
 * One workflow submitted as part of a batch
 *
 * Invalid entries (unreadable file, malformed JSON, failed validation) are
 * counted by the batch but never executed.
 */
struct WorkflowEntry {
    std::string fileName;
    std::string filePath;   // empty for inline workflows
    Workflow workflow;
    bool valid = false;
    std::vector<std::string> errors;
};

/**
 * Builds WorkflowEntry lists from the three batch sources
 */
class WorkflowScanner {
public:
    /**
     * Every *.json file of a folder, sorted by path
     * Throws std::runtime_error if the folder does not exist
     */
    static std::vector<WorkflowEntry> scanFolder(const std::string& folderPath, bool recursive = false);

    /**
     * Explicit file list, in the given order
     */
    static std::vector<WorkflowEntry> loadFiles(const std::vector<std::string>& paths);

    /**
     * Inline list: each item is either a workflow object or
     * {"fileName": "...", "workflow": {...}}
     */
    static std::vector<WorkflowEntry> fromJsonArray(const nlohmann::json& items);

    /**
     * Validate an already-parsed workflow into an entry
     */
    static WorkflowEntry makeEntry(const std::string& fileName, const std::string& filePath, Workflow workflow);

private:
    static WorkflowEntry loadFile(const std::string& path);
    static WorkflowEntry invalidEntry(const std::string& fileName, const std::string& filePath, const std::string& error);
};

} // namespace workflow
} // namespace automflow
