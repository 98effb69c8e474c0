#include <catch2/catch.hpp>
#include "TestWorkflows.hpp"
#include "engine/Executor.hpp"
#include "nodes/register.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

using namespace automflow;
using namespace automflow::engine;
namespace NodeTypes = automflow::workflow::NodeTypes;

namespace {

/**
 * Records the id of every node it runs, with the loop item and the data it saw
 */
class RecordingNode : public NodeHandler {
public:
    void execute(const workflow::Node& node, ExecutionContext& context) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ids.push_back(node.id);
        m_items.push_back(context.getVariable("item"));
        m_data.push_back(node.data);
    }

    std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_ids;
    }

    std::vector<json> items() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items;
    }

    std::vector<json> data() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_ids;
    std::vector<json> m_items;
    std::vector<json> m_data;
};

class FailingNode : public NodeHandler {
public:
    void execute(const workflow::Node& node, ExecutionContext& /*context*/) override {
        throw std::runtime_error(node.data.value("message", std::string("boom")));
    }
};

// Test fixture: built-in handlers plus "record" and "fail"
class ExecutorFixture {
public:
    ExecutorFixture() : recorder(std::make_shared<RecordingNode>()) {
        nodes::registerBuiltinNodes(registry);
        registry.registerHandler("record", recorder);
        registry.registerHandler("fail", std::make_shared<FailingNode>());
    }

    std::unique_ptr<Executor> make(workflow::Workflow workflow, ExecutorOptions options = {}) {
        auto executor = std::make_unique<Executor>(std::move(workflow), registry, std::move(options));
        executor->setExecutionCallback([this](const ExecutionEvent& event) {
            std::lock_guard<std::mutex> lock(m_eventsMutex);
            m_events.push_back(event);
        });
        return executor;
    }

    std::vector<ExecutionEvent> events() const {
        std::lock_guard<std::mutex> lock(m_eventsMutex);
        return m_events;
    }

    size_t countEvents(EventType type, const std::string& nodeId = "") const {
        size_t count = 0;
        for (const auto& event : events()) {
            if (event.type == type && (nodeId.empty() || event.nodeId == nodeId)) ++count;
        }
        return count;
    }

    NodeHandlerRegistry registry;
    std::shared_ptr<RecordingNode> recorder;

private:
    mutable std::mutex m_eventsMutex;
    std::vector<ExecutionEvent> m_events;
};

bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

bool pausedAt(const Executor& executor, const std::string& nodeId) {
    return waitFor([&]() { return executor.isPaused() && executor.getPausedNodeId() == nodeId; });
}

ExecutorOptions breakpointOptions(BreakpointConfig::At at, BreakpointConfig::Scope scope = BreakpointConfig::Scope::All) {
    ExecutorOptions options;
    options.breakpoints.enabled = true;
    options.breakpoints.at = at;
    options.breakpoints.scope = scope;
    return options;
}

} // anonymous namespace

// =============================================================================
// Plain runs
// =============================================================================

TEST_CASE("Executor runs a linear workflow", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("a", "record"), makeNode("b", "record")}));

    REQUIRE(executor->getStatus() == ExecutorStatus::Idle);
    executor->execute();

    REQUIRE(executor->getStatus() == ExecutorStatus::Completed);
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "b"});
    REQUIRE(f.countEvents(EventType::ExecutionStart) == 1);
    REQUIRE(f.countEvents(EventType::NodeStart, "a") == 1);
    REQUIRE(f.countEvents(EventType::NodeComplete, "b") == 1);
    REQUIRE(f.events().back().type == EventType::ExecutionComplete);
    REQUIRE_FALSE(executor->getCurrentNodeId().has_value());

    REQUIRE_THROWS_WITH(executor->execute(), "Executor has already been started");
}

TEST_CASE("Executor runs unconnected nodes after the start chain", "[Executor]") {
    ExecutorFixture f;
    auto workflow = makeChain({makeNode("a", "record")});
    workflow.addNode(makeNode("orphan", "record"));

    f.make(std::move(workflow))->execute();
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "orphan"});
}

TEST_CASE("Executor reports node failures", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("a", "record"),
        makeNode("b", "fail", {{"message", "element not found"}}),
        makeNode("c", "record")
    }));

    REQUIRE_THROWS_WITH(executor->execute(), "Node b (fail) failed: element not found");
    REQUIRE(executor->getStatus() == ExecutorStatus::Error);
    REQUIRE(executor->getError() == "Node b (fail) failed: element not found");
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a"});
    REQUIRE(f.countEvents(EventType::NodeError, "b") == 1);
    REQUIRE(f.events().back().type == EventType::ExecutionError);
}

TEST_CASE("Executor fails on an unknown node type", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("m", "mystery")}));

    REQUIRE_THROWS_WITH(executor->execute(), "Node m (mystery) failed: Unknown node type: mystery");
}

TEST_CASE("Executor continues past a silent failure", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("a", "fail", {{"failSilently", true}}),
        makeNode("b", "record")
    }));

    REQUIRE_NOTHROW(executor->execute());
    REQUIRE(executor->getStatus() == ExecutorStatus::Completed);
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"b"});

    bool sawSilentError = false;
    for (const auto& event : f.events()) {
        if (event.type == EventType::NodeError && event.nodeId == "a") {
            sawSilentError = event.payload.value("failSilently", false);
        }
    }
    REQUIRE(sawSilentError);
}

TEST_CASE("Executor does not run bypassed nodes", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("a", "fail", {{"bypass", true}}),
        makeNode("b", "record")
    }));

    REQUIRE_NOTHROW(executor->execute());
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"b"});
    REQUIRE(f.countEvents(EventType::NodeStart, "a") == 0);
}

TEST_CASE("Executor validates before running", "[Executor]") {
    ExecutorFixture f;
    workflow::Workflow workflow;
    workflow.addNode(makeNode("a", "record"));
    auto executor = f.make(std::move(workflow));

    REQUIRE_THROWS_WITH(executor->execute(), "Workflow validation failed: Workflow must contain a Start node");
    REQUIRE(executor->getStatus() == ExecutorStatus::Error);
    REQUIRE(f.recorder->ids().empty());
}

// =============================================================================
// Data flow
// =============================================================================

TEST_CASE("Executor fills property inputs from value nodes", "[Executor]") {
    ExecutorFixture f;
    auto workflow = makeChain({makeNode("a", "record", {{"count", 1}})});
    workflow.addNode(makeNode("n", NodeTypes::IntValue, {{"value", "25"}}));
    wireProperty(workflow, "n", "a", "count");

    f.make(std::move(workflow))->execute();

    auto data = f.recorder->data();
    REQUIRE(data.size() == 1);
    REQUIRE(data[0]["count"] == 25);
}

TEST_CASE("Executor runs the loop body once per element", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("loop", NodeTypes::Loop, {{"mode", "forEach"}, {"arrayVariable", "rows"}}),
        makeNode("body", "record")
    }));
    executor->context().setData("rows", {"a", "b", "c"});

    executor->execute();

    REQUIRE(f.recorder->ids() == std::vector<std::string>{"body", "body", "body"});
    REQUIRE(f.recorder->items() == std::vector<json>{"a", "b", "c"});
    REQUIRE(f.countEvents(EventType::NodeComplete, "body") == 3);
}

TEST_CASE("Executor runs a reusable scope through runReusable", "[Executor]") {
    ExecutorFixture f;
    auto workflow = makeChain({
        makeNode("run", NodeTypes::RunReusable, {{"contextName", "login"}}),
        makeNode("after", "record")
    });
    workflow.addNode(makeNode("entry", NodeTypes::Reusable, {{"contextName", "login"}}));
    workflow.addNode(makeNode("inside", "record"));
    workflow.addNode(makeNode("exit", NodeTypes::ReusableEnd));
    workflow.connect("entry", "inside");
    workflow.connect("inside", "exit");

    f.make(std::move(workflow))->execute();

    // Scoped nodes only run when called
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"inside", "after"});
}

TEST_CASE("Executor fails when the reusable scope is missing", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("run", NodeTypes::RunReusable, {{"contextName", "nope"}})}));

    REQUIRE_THROWS_WITH(executor->execute(),
                        "Node run (reusable.runReusable) failed: Reusable node with context name \"nope\" not found");
}

// =============================================================================
// Breakpoints
// =============================================================================

TEST_CASE("Executor pause controls require a pause", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("a", "record")}));

    REQUIRE_FALSE(executor->continueExecution());
    REQUIRE_FALSE(executor->skip());
    REQUIRE_FALSE(executor->continueWithoutBreakpoint());
    REQUIRE_FALSE(executor->stopFromPause());
}

TEST_CASE("Executor pre breakpoints pause before each node", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("a", "record"), makeNode("b", "record"), makeNode("c", "record")}),
                           breakpointOptions(BreakpointConfig::At::Pre));

    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(pausedAt(*executor, "a"));
    REQUIRE(executor->getPauseReason() == PauseReason::Breakpoint);
    REQUIRE(f.recorder->ids().empty());

    REQUIRE(executor->continueExecution());
    REQUIRE(pausedAt(*executor, "b"));
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a"});

    // Skip b, then drop the remaining breakpoints
    REQUIRE(executor->skip());
    REQUIRE(pausedAt(*executor, "c"));
    REQUIRE(executor->continueWithoutBreakpoint());

    run.get();
    REQUIRE(executor->getStatus() == ExecutorStatus::Completed);
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "c"});
    REQUIRE(f.countEvents(EventType::BreakpointTriggered) == 3);
}

TEST_CASE("Executor continueWithoutBreakpoint disables later breakpoints", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("a", "record"), makeNode("b", "record"), makeNode("c", "record")}),
                           breakpointOptions(BreakpointConfig::At::Both));

    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(pausedAt(*executor, "a"));
    REQUIRE(executor->continueWithoutBreakpoint());
    run.get();

    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(f.countEvents(EventType::BreakpointTriggered) == 1);
}

TEST_CASE("Executor post breakpoints on marked nodes", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("a", "record"),
        makeNode("b", "record", {{"breakpoint", true}}),
        makeNode("c", "record")
    }), breakpointOptions(BreakpointConfig::At::Post, BreakpointConfig::Scope::Marked));

    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(pausedAt(*executor, "b"));
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "b"});

    // Skip after a post breakpoint just resumes
    REQUIRE(executor->skip());
    run.get();
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Executor stop while paused ends the run", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({makeNode("a", "record"), makeNode("b", "record")}),
                           breakpointOptions(BreakpointConfig::At::Pre));

    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(pausedAt(*executor, "a"));
    REQUIRE(executor->stopFromPause());
    run.get();

    REQUIRE(executor->getStatus() == ExecutorStatus::Stopped);
    REQUIRE(f.recorder->ids().empty());
    REQUIRE(f.events().back().type == EventType::ExecutionStopped);
}

TEST_CASE("BreakpointConfig parses both key styles", "[Executor]") {
    auto config = BreakpointConfig::fromJson({{"enabled", true}, {"breakpointAt", "both"}, {"breakpointFor", "marked"}});
    REQUIRE(config.enabled);
    REQUIRE(config.at == BreakpointConfig::At::Both);
    REQUIRE(config.scope == BreakpointConfig::Scope::Marked);

    auto shortKeys = BreakpointConfig::fromJson({{"enabled", true}, {"at", "post"}, {"for", "all"}});
    REQUIRE(shortKeys.at == BreakpointConfig::At::Post);
    REQUIRE(shortKeys.scope == BreakpointConfig::Scope::All);

    REQUIRE_FALSE(BreakpointConfig::fromJson(nullptr).enabled);
    REQUIRE(config.toJson()["breakpointAt"] == "both");
}

// =============================================================================
// Wait pauses and stop
// =============================================================================

TEST_CASE("Executor wait-pause suspends until continued", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("w", NodeTypes::Wait, {{"pause", true}}),
        makeNode("a", "record")
    }));

    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(pausedAt(*executor, "w"));
    REQUIRE(executor->getPauseReason() == PauseReason::WaitPause);
    REQUIRE(f.recorder->ids().empty());

    REQUIRE(executor->continueExecution());
    run.get();
    REQUIRE(executor->getStatus() == ExecutorStatus::Completed);
    REQUIRE(f.recorder->ids() == std::vector<std::string>{"a"});
}

TEST_CASE("Executor ignores wait-pause when not interactive", "[Executor]") {
    ExecutorFixture f;
    ExecutorOptions options;
    options.interactive = false;
    auto executor = f.make(makeChain({
        makeNode("w1", NodeTypes::Wait, {{"pause", true}}),
        makeNode("w2", NodeTypes::Wait, {{"pause", true}}),
        makeNode("a", "record")
    }), options);

    executor->execute();

    REQUIRE(executor->getStatus() == ExecutorStatus::Completed);
    REQUIRE(executor->context().getData("_waitPauseWarned") == true);
    REQUIRE(f.countEvents(EventType::ExecutionPaused) == 0);
}

TEST_CASE("Executor stop interrupts a timeout wait", "[Executor]") {
    ExecutorFixture f;
    auto executor = f.make(makeChain({
        makeNode("w", NodeTypes::Wait, {{"waitType", "timeout"}, {"value", 10000}}),
        makeNode("a", "record")
    }));

    auto start = std::chrono::steady_clock::now();
    auto run = std::async(std::launch::async, [&]() { executor->execute(); });

    REQUIRE(waitFor([&]() { return executor->getCurrentNodeId() == std::optional<std::string>("w"); }));
    executor->stop();
    run.get();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    REQUIRE(elapsed < 5000);
    REQUIRE(executor->getStatus() == ExecutorStatus::Stopped);
    REQUIRE(f.recorder->ids().empty());
}

TEST_CASE("Executor trace logs are emitted as log events", "[Executor]") {
    ExecutorFixture f;
    ExecutorOptions options;
    options.traceLogs = true;
    f.make(makeChain({makeNode("a", "record")}), options)->execute();

    REQUIRE(f.countEvents(EventType::Log) > 0);
}
