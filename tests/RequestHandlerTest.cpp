#include <catch2/catch.hpp>
#include "engine/ExecutionManager.hpp"
#include "nodes/register.hpp"
#include "server/EventHub.hpp"
#include "server/RequestHandler.hpp"
#include <chrono>
#include <functional>
#include <thread>

using namespace automflow;
using namespace automflow::server;

namespace {

const char* kWorkflow = R"({
    "nodes": [
        {"id": "start", "type": "start", "data": {}},
        {"id": "n", "type": "intValue", "data": {"value": 3}}
    ],
    "edges": [{"id": "e1", "source": "start", "target": "n"}]
})";

const char* kPausingWorkflow = R"({
    "nodes": [
        {"id": "start", "type": "start", "data": {}},
        {"id": "w", "type": "wait", "data": {"pause": true}}
    ],
    "edges": [{"id": "e1", "source": "start", "target": "w"}]
})";

bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Handler over a real manager without storage
class HandlerFixture {
public:
    HandlerFixture()
        : manager(makeConfig(), registerAll(registry))
        , handler(manager, registry) {}

    std::string executionStatus(const std::string& executionId) {
        auto [code, body] = handler.handleExecutionStatus(executionId);
        return code == 200 ? body["execution"]["status"].get<std::string>() : "";
    }

    engine::NodeHandlerRegistry registry;
    engine::ExecutionManager manager;
    RequestHandler handler;

private:
    static engine::ExecutionManagerConfig makeConfig() {
        engine::ExecutionManagerConfig config;
        config.maxWorkers = 2;
        return config;
    }

    static const engine::NodeHandlerRegistry& registerAll(engine::NodeHandlerRegistry& registry) {
        nodes::registerBuiltinNodes(registry);
        return registry;
    }
};

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("RequestHandler splitTarget decodes the query string", "[RequestHandler]") {
    QueryParams query;
    REQUIRE(RequestHandler::splitTarget("/api/batches?status=running&limit=10&name=a%20b+c&flag", query)
            == "/api/batches");
    REQUIRE(query.size() == 4);
    REQUIRE(query["status"] == "running");
    REQUIRE(query["limit"] == "10");
    REQUIRE(query["name"] == "a b c");
    REQUIRE(query["flag"] == "");

    QueryParams none;
    REQUIRE(RequestHandler::splitTarget("/api/health", none) == "/api/health");
    REQUIRE(none.empty());
}

TEST_CASE("RequestHandler error bodies", "[RequestHandler]") {
    auto [code, body] = RequestHandler::error(404, "Batch not found: x");
    REQUIRE(code == 404);
    REQUIRE(body["status"] == "error");
    REQUIRE(body["message"] == "Batch not found: x");
}

// =============================================================================
// General routes
// =============================================================================

TEST_CASE("RequestHandler health and node listing", "[RequestHandler]") {
    HandlerFixture f;

    auto [code, health] = f.handler.handleHealth();
    REQUIRE(code == 200);
    REQUIRE(health["status"] == "ok");
    REQUIRE(health["maxWorkers"] == 2);
    REQUIRE(health["activeWorkers"] == 0);

    auto [nodesCode, nodes] = f.handler.handleListNodes();
    REQUIRE(nodesCode == 200);
    REQUIRE(nodes["nodes"].size() == f.registry.size());
    REQUIRE(nodes["nodes"][0].contains("category"));
    REQUIRE_FALSE(nodes["categories"].empty());
}

// =============================================================================
// Single runs
// =============================================================================

TEST_CASE("RequestHandler execute validates the workflow", "[RequestHandler]") {
    HandlerFixture f;

    REQUIRE(f.handler.handleExecute(json::object()).first == 400);
    REQUIRE(f.handler.handleExecute({{"workflow", "nope"}}).first == 400);

    auto [code, body] = f.handler.handleExecute({{"workflow", {{"nodes", json::array()}}}});
    REQUIRE(code == 400);
    REQUIRE(body["message"].get<std::string>().find("Invalid workflow format") == 0);
}

TEST_CASE("RequestHandler execute and status", "[RequestHandler]") {
    HandlerFixture f;

    auto [code, body] = f.handler.handleExecute({{"workflow", json::parse(kWorkflow)}, {"workflowFileName", "a.json"}});
    REQUIRE(code == 200);
    REQUIRE(body["status"] == "ok");
    std::string executionId = body["executionId"];

    REQUIRE(waitFor([&]() { return f.executionStatus(executionId) == "completed"; }));

    auto [latestCode, latest] = f.handler.handleLatestExecutionStatus();
    REQUIRE(latestCode == 200);
    REQUIRE(latest["execution"]["executionId"] == executionId);
    REQUIRE(latest["execution"]["workflowFileName"] == "a.json");

    REQUIRE(f.handler.handleExecutionStatus("exec_missing").first == 404);
    REQUIRE(f.handler.handleStopExecution("exec_missing").first == 404);
}

TEST_CASE("RequestHandler latest status without executions", "[RequestHandler]") {
    HandlerFixture f;
    auto [code, body] = f.handler.handleLatestExecutionStatus();
    REQUIRE(code == 200);
    REQUIRE(body["execution"].is_null());
}

TEST_CASE("RequestHandler pause control", "[RequestHandler]") {
    HandlerFixture f;
    auto [code, body] = f.handler.handleExecute({{"workflow", json::parse(kPausingWorkflow)}});
    REQUIRE(code == 200);
    std::string executionId = body["executionId"];

    REQUIRE(f.handler.handlePauseControl(executionId, json::object()).first == 400);
    REQUIRE(f.handler.handlePauseControl(executionId, {{"action", "rewind"}}).first == 400);
    REQUIRE(f.handler.handlePauseControl("exec_missing", {{"action", "continue"}}).first == 404);

    REQUIRE(waitFor([&]() {
        auto [statusCode, status] = f.handler.handleExecutionStatus(executionId);
        return statusCode == 200 && status["execution"]["pauseReason"] == "wait-pause";
    }));

    auto [activeCode, active] = f.handler.handleActiveExecutions();
    REQUIRE(activeCode == 200);
    REQUIRE(active["count"] == 1);
    REQUIRE(active["executions"][0]["paused"] == true);

    auto [continueCode, continued] = f.handler.handlePauseControl(executionId, {{"action", "continue"}});
    REQUIRE(continueCode == 200);
    REQUIRE(continued["action"] == "continue");

    REQUIRE(waitFor([&]() { return f.executionStatus(executionId) == "completed"; }));
    REQUIRE(f.handler.handlePauseControl(executionId, {{"action", "continue"}}).first == 409);
}

// =============================================================================
// Batches
// =============================================================================

TEST_CASE("RequestHandler batch request validation", "[RequestHandler]") {
    HandlerFixture f;

    REQUIRE(f.handler.handleBatchExecute(json::array()).first == 400);
    REQUIRE(f.handler.handleBatchExecute(json::object()).first == 400);
    REQUIRE(f.handler.handleBatchExecute({{"workflows", "x"}}).first == 400);
    REQUIRE(f.handler.handleBatchExecute({{"files", 3}}).first == 400);
    REQUIRE(f.handler.handleBatchExecute({{"workflows", json::array()}}).first == 400);
    REQUIRE(f.handler.handleBatchExecute({{"folderPath", "/nonexistent/automflow/tests"}}).first == 400);

    auto [code, body] = f.handler.handleBatchExecute({
        {"workflows", json::array({json::parse(kWorkflow)})},
        {"workers", 0}
    });
    REQUIRE(code == 400);
    REQUIRE(body["message"] == "workers must be a positive integer");

    // Values that do not fit an int are rejected instead of narrowed
    json workflows = json::array({json::parse(kWorkflow)});
    auto [hugeCode, huge] = f.handler.handleBatchExecute({{"workflows", workflows}, {"workers", 4294967297LL}});
    REQUIRE(hugeCode == 400);
    REQUIRE(huge["message"] == "workers must be a positive integer");
    REQUIRE(f.handler.handleBatchExecute({{"workflows", workflows}, {"workers", 1.5}}).first == 400);

    auto [priorityCode, priority] = f.handler.handleBatchExecute({{"workflows", workflows}, {"priority", -9000000000LL}});
    REQUIRE(priorityCode == 400);
    REQUIRE(priority["message"] == "priority must be an integer");
    REQUIRE(f.handler.handleBatchExecute({{"workflows", workflows}, {"priority", 2.5}}).first == 400);
    REQUIRE(f.handler.handleBatchExecute({{"workflows", workflows}, {"priority", 18446744073709551615ULL}}).first == 400);
}

TEST_CASE("RequestHandler batch lifecycle", "[RequestHandler]") {
    HandlerFixture f;

    json workflows = json::array({
        json::parse(kWorkflow),
        {{"fileName", "broken.json"}, {"workflow", {{"nodes", json::array()}, {"edges", json::array()}}}}
    });
    auto [code, body] = f.handler.handleBatchExecute({{"workflows", workflows}, {"workers", 1}, {"priority", 3}});
    REQUIRE(code == 200);
    std::string batchId = body["batchId"];
    REQUIRE(body["invalid"].size() == 1);
    REQUIRE(body["invalid"][0]["fileName"] == "broken.json");
    REQUIRE(body["batch"]["totalWorkflows"] == 2);
    REQUIRE(body["batch"]["priority"] == 3);

    REQUIRE(waitFor([&]() {
        auto [statusCode, status] = f.handler.handleBatchStatus(batchId);
        return statusCode == 200 && status["batch"]["status"] == "completed";
    }));

    auto [execCode, executions] = f.handler.handleBatchExecutions(batchId);
    REQUIRE(execCode == 200);
    REQUIRE(executions["executions"].size() == 1);
    REQUIRE(executions["executions"][0]["status"] == "completed");

    auto [listCode, list] = f.handler.handleListBatches({{"status", "completed"}});
    REQUIRE(listCode == 200);
    REQUIRE(list["batches"].size() == 1);
    REQUIRE(list["limit"] == 50);

    REQUIRE(f.handler.handleListBatches({{"limit", "ten"}}).first == 400);
    REQUIRE(f.handler.handleBatchStatus("batch_missing").first == 404);
    REQUIRE(f.handler.handleBatchExecutions("batch_missing").first == 404);
    REQUIRE(f.handler.handleStopBatch("batch_missing").first == 404);

    auto [stopCode, stopped] = f.handler.handleStopBatch(batchId);
    REQUIRE(stopCode == 200);
    REQUIRE(stopped["stoppedExecutions"].empty());

    auto [allCode, all] = f.handler.handleStopAll();
    REQUIRE(allCode == 200);
    REQUIRE(all["totalBatches"] == 0);
}

// =============================================================================
// EventHub
// =============================================================================

TEST_CASE("EventHub formats SSE frames", "[EventHub]") {
    REQUIRE(EventHub::formatFrame("node_start", R"({"nodeId":"a"})") ==
            "event: node_start\ndata: {\"nodeId\":\"a\"}\n\n");
}

TEST_CASE("EventHub fans out to subscribers", "[EventHub]") {
    EventHub hub;
    std::vector<std::string> first;
    std::vector<std::string> second;

    auto firstId = hub.subscribe([&](const std::string& frame) { first.push_back(frame); });
    hub.subscribe([&](const std::string& frame) { second.push_back(frame); });
    REQUIRE(hub.subscriberCount() == 2);

    engine::ExecutionEvent event;
    event.type = engine::EventType::NodeComplete;
    event.executionId = "exec_1";
    event.nodeId = "nav";
    event.durationMs = 42;
    hub.sink()(event);

    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    REQUIRE(first[0].rfind("event: node_complete\ndata: ", 0) == 0);

    auto payload = json::parse(first[0].substr(first[0].find("data: ") + 6));
    REQUIRE(payload["type"] == "node_complete");
    REQUIRE(payload["nodeId"] == "nav");
    REQUIRE(payload["durationMs"] == 42);
    REQUIRE_FALSE(payload.contains("batchId"));

    hub.unsubscribe(firstId);
    hub.publish(event);
    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 2);
}
