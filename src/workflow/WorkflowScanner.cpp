#include "workflow/WorkflowScanner.hpp"
#include "workflow/WorkflowParser.hpp"
#include "workflow/WorkflowSerializer.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace automflow {
namespace workflow {

namespace fs = std::filesystem;

namespace {

bool isJsonFile(const fs::path& path) {
    return path.extension() == ".json";
}

} // anonymous namespace

WorkflowEntry WorkflowScanner::invalidEntry(const std::string& fileName, const std::string& filePath,
                                            const std::string& error) {
    WorkflowEntry entry;
    entry.fileName = fileName;
    entry.filePath = filePath;
    entry.valid = false;
    entry.errors.push_back(error);
    return entry;
}

WorkflowEntry WorkflowScanner::makeEntry(const std::string& fileName, const std::string& filePath,
                                         Workflow workflow) {
    WorkflowEntry entry;
    entry.fileName = fileName;
    entry.filePath = filePath;

    auto validation = WorkflowParser(workflow).validate();
    entry.valid = validation.valid;
    entry.errors = std::move(validation.errors);
    entry.workflow = std::move(workflow);
    return entry;
}

WorkflowEntry WorkflowScanner::loadFile(const std::string& path) {
    std::string fileName = fs::path(path).filename().string();
    try {
        return makeEntry(fileName, path, WorkflowSerializer::fromFile(path));
    } catch (const std::exception& e) {
        LOG_WARN("Invalid workflow file " + path + ": " + e.what());
        return invalidEntry(fileName, path, e.what());
    }
}

std::vector<WorkflowEntry> WorkflowScanner::scanFolder(const std::string& folderPath, bool recursive) {
    std::error_code ec;
    if (!fs::is_directory(folderPath, ec)) {
        throw std::runtime_error("Folder not found: " + folderPath);
    }

    std::vector<std::string> paths;
    if (recursive) {
        for (const auto& item : fs::recursive_directory_iterator(folderPath)) {
            if (item.is_regular_file() && isJsonFile(item.path())) {
                paths.push_back(item.path().string());
            }
        }
    } else {
        for (const auto& item : fs::directory_iterator(folderPath)) {
            if (item.is_regular_file() && isJsonFile(item.path())) {
                paths.push_back(item.path().string());
            }
        }
    }
    std::sort(paths.begin(), paths.end());

    LOG_INFO("Found " + std::to_string(paths.size()) + " workflow files in " + folderPath);
    return loadFiles(paths);
}

std::vector<WorkflowEntry> WorkflowScanner::loadFiles(const std::vector<std::string>& paths) {
    std::vector<WorkflowEntry> entries;
    entries.reserve(paths.size());
    for (const auto& path : paths) {
        entries.push_back(loadFile(path));
    }
    return entries;
}

std::vector<WorkflowEntry> WorkflowScanner::fromJsonArray(const nlohmann::json& items) {
    if (!items.is_array()) {
        throw std::invalid_argument("Expected an array of workflows");
    }

    std::vector<WorkflowEntry> entries;
    size_t index = 0;
    for (const auto& item : items) {
        ++index;
        bool wrapped = item.is_object() && item.contains("workflow");
        std::string fileName = wrapped && item.contains("fileName") && item["fileName"].is_string()
            ? item["fileName"].get<std::string>()
            : "workflow-" + std::to_string(index) + ".json";

        try {
            entries.push_back(makeEntry(fileName, "", WorkflowSerializer::fromJson(wrapped ? item["workflow"] : item)));
        } catch (const std::exception& e) {
            entries.push_back(invalidEntry(fileName, "", e.what()));
        }
    }
    return entries;
}

} // namespace workflow
} // namespace automflow
