#include <catch2/catch.hpp>
#include "workflow/WorkflowScanner.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace automflow::workflow;
namespace fs = std::filesystem;

// Helper to create a temporary folder of workflow files
class TempFolder {
public:
    TempFolder() : m_path(fs::temp_directory_path() / ("test_workflow_scanner_" + std::to_string(std::rand()))) {
        fs::create_directories(m_path);
    }

    ~TempFolder() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    std::string write(const std::string& relative, const std::string& content) {
        fs::path file = m_path / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file.string();
    }

    std::string path() const { return m_path.string(); }

private:
    fs::path m_path;
};

namespace {

const char* kValidWorkflow = R"({
    "nodes": [{"id": "s", "type": "start"}, {"id": "w", "type": "wait", "data": {"waitType": "timeout", "value": 1}}],
    "edges": [{"source": "s", "target": "w"}]
})";

const char* kNoStartWorkflow = R"({
    "nodes": [{"id": "w", "type": "wait"}],
    "edges": []
})";

} // anonymous namespace

TEST_CASE("WorkflowScanner scanFolder reads json files sorted by path", "[WorkflowScanner]") {
    TempFolder folder;
    folder.write("b.json", kValidWorkflow);
    folder.write("a.json", kValidWorkflow);
    folder.write("notes.txt", "ignored");
    folder.write("nested/c.json", kValidWorkflow);

    auto entries = WorkflowScanner::scanFolder(folder.path());
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].fileName == "a.json");
    REQUIRE(entries[1].fileName == "b.json");
    REQUIRE(entries[0].valid);
    REQUIRE(entries[0].workflow.nodeCount() == 2);
    REQUIRE(!entries[0].filePath.empty());
}

TEST_CASE("WorkflowScanner scanFolder recursive", "[WorkflowScanner]") {
    TempFolder folder;
    folder.write("a.json", kValidWorkflow);
    folder.write("nested/c.json", kValidWorkflow);

    auto entries = WorkflowScanner::scanFolder(folder.path(), true);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[1].fileName == "c.json");
}

TEST_CASE("WorkflowScanner scanFolder on a missing folder throws", "[WorkflowScanner]") {
    REQUIRE_THROWS_AS(WorkflowScanner::scanFolder("/nonexistent/folder/for/tests"), std::runtime_error);
}

TEST_CASE("WorkflowScanner loadFiles marks invalid entries", "[WorkflowScanner]") {
    TempFolder folder;
    auto good = folder.write("good.json", kValidWorkflow);
    auto broken = folder.write("broken.json", "{ nope");
    auto noStart = folder.write("nostart.json", kNoStartWorkflow);

    auto entries = WorkflowScanner::loadFiles({good, broken, noStart, folder.path() + "/missing.json"});
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].valid);

    REQUIRE_FALSE(entries[1].valid);
    REQUIRE(entries[1].errors.size() == 1);
    REQUIRE(entries[1].errors[0].find("Invalid workflow JSON") != std::string::npos);

    REQUIRE_FALSE(entries[2].valid);
    REQUIRE(entries[2].errors[0] == "Workflow must contain a Start node");

    REQUIRE_FALSE(entries[3].valid);
    REQUIRE(entries[3].fileName == "missing.json");
}

TEST_CASE("WorkflowScanner fromJsonArray accepts bare and wrapped workflows", "[WorkflowScanner]") {
    auto valid = nlohmann::json::parse(kValidWorkflow);
    nlohmann::json items = nlohmann::json::array({
        valid,
        {{"fileName", "named.json"}, {"workflow", valid}},
        {{"nodes", "oops"}}
    });

    auto entries = WorkflowScanner::fromJsonArray(items);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].fileName == "workflow-1.json");
    REQUIRE(entries[0].valid);
    REQUIRE(entries[0].filePath.empty());
    REQUIRE(entries[1].fileName == "named.json");
    REQUIRE(entries[1].valid);
    REQUIRE(entries[2].fileName == "workflow-3.json");
    REQUIRE_FALSE(entries[2].valid);

    REQUIRE_THROWS_AS(WorkflowScanner::fromJsonArray(nlohmann::json::object()), std::invalid_argument);
}
