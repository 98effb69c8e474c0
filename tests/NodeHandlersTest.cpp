#include <catch2/catch.hpp>
#include "FakeBrowserDriver.hpp"
#include "TestWorkflows.hpp"
#include "engine/NodeHandlerRegistry.hpp"
#include "nodes/BrowserNodes.hpp"
#include "nodes/FlowNodes.hpp"
#include "nodes/WaitNode.hpp"
#include "nodes/register.hpp"
#include <algorithm>
#include <chrono>

using namespace automflow;
using namespace automflow::engine;
namespace NodeTypes = automflow::workflow::NodeTypes;

// Helper fixture: a registry with every built-in handler
class HandlerFixture {
public:
    HandlerFixture() {
        nodes::registerBuiltinNodes(registry);
    }

    void run(const workflow::Node& node) {
        auto handler = registry.getHandler(node.type);
        REQUIRE(handler != nullptr);
        handler->execute(node, context);
    }

    NodeHandlerRegistry registry;
    ExecutionContext context;
};

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("NodeHandlerRegistry built-in types", "[NodeHandlerRegistry]") {
    NodeHandlerRegistry registry;
    nodes::registerBuiltinNodes(registry);

    for (const auto& type : {NodeTypes::Start, NodeTypes::OpenBrowser, NodeTypes::Navigation, NodeTypes::Wait,
                             NodeTypes::Loop, NodeTypes::SetVariable, NodeTypes::IntValue,
                             NodeTypes::StringValue, NodeTypes::BooleanValue, NodeTypes::Reusable,
                             NodeTypes::ReusableEnd, NodeTypes::RunReusable}) {
        REQUIRE(registry.hasHandler(type));
    }
    REQUIRE(registry.size() == 12);

    auto types = registry.getTypes();
    REQUIRE(std::is_sorted(types.begin(), types.end()));

    auto categories = registry.getCategories();
    REQUIRE(std::find(categories.begin(), categories.end(), "browser") != categories.end());
    REQUIRE(std::find(categories.begin(), categories.end(), "reusable") != categories.end());
}

TEST_CASE("NodeHandlerRegistry falls back to the unqualified type", "[NodeHandlerRegistry]") {
    NodeHandlerRegistry registry;
    registry.registerHandler("runReusable", std::make_shared<nodes::RunReusableNode>());

    REQUIRE(registry.getHandler("reusable.runReusable") == nullptr);
    REQUIRE(registry.getHandler("plugin/runReusable") != nullptr);
    REQUIRE(registry.getHandler("unknown") == nullptr);

    registry.unregisterHandler("runReusable");
    REQUIRE_FALSE(registry.hasHandler("runReusable"));

    registry.registerHandler("x", std::make_shared<nodes::StartNode>());
    registry.clear();
    REQUIRE(registry.size() == 0);
}

// =============================================================================
// Flow nodes
// =============================================================================

TEST_CASE("LoopNode prepares a forEach loop", "[FlowNodes]") {
    HandlerFixture f;
    f.context.setData("rows", {"a", "b", "c"});

    f.run(makeNode("loop", NodeTypes::Loop, {{"mode", "forEach"}, {"arrayVariable", " rows "}}));

    REQUIRE(f.context.getVariable("index") == 0);
    REQUIRE(f.context.getVariable("item") == "a");
    REQUIRE(f.context.getData("_loopArray").size() == 3);
    REQUIRE(f.context.getData("_loopMode") == "forEach");
}

TEST_CASE("LoopNode errors", "[FlowNodes]") {
    HandlerFixture f;
    f.context.setData("notArray", {{"k", 1}});

    REQUIRE_THROWS_WITH(f.run(makeNode("l", NodeTypes::Loop)), "Loop mode is required. Must be \"forEach\"");
    REQUIRE_THROWS_WITH(f.run(makeNode("l", NodeTypes::Loop, {{"mode", "doWhile"}})),
                        "Unsupported loop mode: doWhile");
    REQUIRE_THROWS_WITH(f.run(makeNode("l", NodeTypes::Loop, {{"mode", "forEach"}})),
                        "Array variable is required for forEach mode");
    REQUIRE_THROWS_WITH(f.run(makeNode("l", NodeTypes::Loop, {{"mode", "forEach"}, {"arrayVariable", "notArray"}})),
                        "Variable notArray is not an array");
    REQUIRE_THROWS_WITH(f.run(makeNode("l", NodeTypes::Loop, {{"mode", "forEach"}, {"arrayVariable", "missing"}})),
                        "Variable missing is not an array");
}

TEST_CASE("SetVariableNode binds an interpolated value", "[FlowNodes]") {
    HandlerFixture f;
    f.context.setData("api", {{"body", {{"token", "t-123"}}}});

    f.run(makeNode("set", NodeTypes::SetVariable, {
        {"variableName", "auth"},
        {"value", {{"header", "Bearer ${data.api.body.token}"}}}
    }));
    REQUIRE(f.context.getVariable("auth")["header"] == "Bearer t-123");

    REQUIRE_THROWS_WITH(f.run(makeNode("set2", NodeTypes::SetVariable, {{"value", 1}})),
                        "Variable name is required for Set Variable node");
}

TEST_CASE("ValueNode coercion", "[FlowNodes]") {
    ExecutionContext context;
    context.setVariable("n", "17");
    using Kind = nodes::ValueNode::Kind;

    REQUIRE(nodes::ValueNode::coerce(Kind::Int, 42, context) == 42);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, 3.9, context) == 3);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, " 12 ", context) == 12);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, "${variables.n}", context) == 17);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, "abc", context) == 0);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, true, context) == 1);
    REQUIRE(nodes::ValueNode::coerce(Kind::Int, json(), context) == 0);

    REQUIRE(nodes::ValueNode::coerce(Kind::String, json(), context) == "");
    REQUIRE(nodes::ValueNode::coerce(Kind::String, 5, context) == "5");
    REQUIRE(nodes::ValueNode::coerce(Kind::String, "id-${variables.n}", context) == "id-17");

    REQUIRE(nodes::ValueNode::coerce(Kind::Boolean, "Yes", context) == true);
    REQUIRE(nodes::ValueNode::coerce(Kind::Boolean, "1", context) == true);
    REQUIRE(nodes::ValueNode::coerce(Kind::Boolean, "no", context) == false);
    REQUIRE(nodes::ValueNode::coerce(Kind::Boolean, 0, context) == false);
    REQUIRE(nodes::ValueNode::coerce(Kind::Boolean, 2, context) == true);
}

TEST_CASE("ValueNode publishes under its id and variable name", "[FlowNodes]") {
    HandlerFixture f;

    f.run(makeNode("timeout1", NodeTypes::IntValue, {{"value", "2500"}, {"variableName", "delay"}}));

    REQUIRE(f.context.getVariable("timeout1") == 2500);
    REQUIRE(f.context.getVariable("delay") == 2500);
    REQUIRE(f.context.getData("value") == 2500);
}

TEST_CASE("RunReusableNode needs a context name and an executor", "[FlowNodes]") {
    HandlerFixture f;

    REQUIRE_THROWS_WITH(f.run(makeNode("r", NodeTypes::RunReusable)),
                        "Context name is required for Run Reusable node");
    REQUIRE_THROWS_WITH(f.run(makeNode("r", NodeTypes::RunReusable, {{"contextName", "login"}})),
                        "Run Reusable node requires a running executor");
}

// =============================================================================
// Browser nodes
// =============================================================================

TEST_CASE("OpenBrowserNode launch options", "[BrowserNodes]") {
    auto defaults = nodes::OpenBrowserNode::launchOptions(json::object());
    REQUIRE(defaults["headless"] == true);
    REQUIRE(defaults["browser"] == "chromium");
    REQUIRE(defaults["maxWindow"] == true);
    REQUIRE(defaults["stealthMode"] == false);
    REQUIRE_FALSE(defaults.contains("viewport"));

    auto custom = nodes::OpenBrowserNode::launchOptions({
        {"headless", false},
        {"browser", "firefox"},
        {"viewportWidth", 1280},
        {"viewportHeight", 720},
        {"jsScript", "console.log(1)"}
    });
    REQUIRE(custom["browser"] == "firefox");
    REQUIRE(custom["viewport"]["width"] == 1280);
    REQUIRE(custom["viewport"]["height"] == 720);
    REQUIRE(custom["jsScript"] == "console.log(1)");
    REQUIRE_FALSE(custom.contains("capabilities"));

    auto halfViewport = nodes::OpenBrowserNode::launchOptions({{"viewportWidth", 1280}});
    REQUIRE_FALSE(halfViewport.contains("viewport"));
}

TEST_CASE("OpenBrowserNode uses the driver factory", "[BrowserNodes]") {
    HandlerFixture f;
    auto node = makeNode("open", NodeTypes::OpenBrowser, {{"browser", "webkit"}});

    REQUIRE_THROWS_WITH(f.run(node), "No browser driver configured");

    auto first = std::make_shared<FakeBrowserDriver>();
    auto second = std::make_shared<FakeBrowserDriver>();
    std::vector<std::shared_ptr<FakeBrowserDriver>> pages{first, second};
    json seenOptions;
    f.context.setDriverFactory([&](const json& options) -> BrowserDriverPtr {
        seenOptions = options;
        auto page = pages.front();
        pages.erase(pages.begin());
        return page;
    });

    f.run(node);
    REQUIRE(f.context.getPage() == first);
    REQUIRE(seenOptions["browser"] == "webkit");

    // A second openBrowser closes the first page
    f.run(node);
    REQUIRE(first->closed.load());
    REQUIRE(f.context.getPage() == second);

    f.context.setDriverFactory([](const json&) -> BrowserDriverPtr { return nullptr; });
    REQUIRE_THROWS_WITH(f.run(node), "Browser driver factory returned no page");
}

TEST_CASE("NavigationNode normalizes URLs", "[BrowserNodes]") {
    REQUIRE(nodes::NavigationNode::normalizeUrl("example.com") == "https://example.com");
    REQUIRE(nodes::NavigationNode::normalizeUrl("  http://example.com/a ") == "http://example.com/a");
    REQUIRE(nodes::NavigationNode::normalizeUrl("HTTPS://Example.com") == "HTTPS://Example.com");
}

TEST_CASE("NavigationNode actions", "[BrowserNodes]") {
    HandlerFixture f;
    auto driver = std::make_shared<FakeBrowserDriver>();
    f.context.setPage(driver);
    f.context.setVariable("host", "shop.example.com");

    f.run(makeNode("n1", NodeTypes::Navigation, {
        {"action", "navigate"},
        {"url", "${variables.host}/cart"},
        {"timeout", "5000"},
        {"waitUntil", "load"}
    }));
    f.run(makeNode("n2", NodeTypes::Navigation, {{"action", "goBack"}}));
    f.run(makeNode("n3", NodeTypes::Navigation, {{"action", "goForward"}}));
    f.run(makeNode("n4", NodeTypes::Navigation, {{"action", "reload"}}));

    auto calls = driver->calls();
    REQUIRE(calls == std::vector<std::string>{"navigate:https://shop.example.com/cart", "goBack", "goForward", "reload"});
    REQUIRE(driver->lastTimeoutMs == 5000);
    REQUIRE(driver->lastWaitUntil == "load");
}

TEST_CASE("NavigationNode errors", "[BrowserNodes]") {
    HandlerFixture f;
    auto navigate = makeNode("n", NodeTypes::Navigation, {{"action", "navigate"}, {"url", "example.com"}});

    REQUIRE_THROWS_WITH(f.run(navigate), "No page available. Ensure Open Browser node is executed first.");

    f.context.setPage(std::make_shared<FakeBrowserDriver>());
    REQUIRE_THROWS_WITH(f.run(makeNode("n", NodeTypes::Navigation)), "Action is required for Navigation node");
    REQUIRE_THROWS_WITH(f.run(makeNode("n", NodeTypes::Navigation, {{"action", "navigate"}})),
                        "URL is required for navigate action");
    REQUIRE_THROWS_WITH(f.run(makeNode("n", NodeTypes::Navigation, {{"action", "teleport"}})),
                        "Invalid navigation action: teleport");
}

TEST_CASE("NavigationNode retries then fails silently", "[BrowserNodes]") {
    HandlerFixture f;
    auto driver = std::make_shared<FakeBrowserDriver>();
    driver->failNavigations = 2;
    f.context.setPage(driver);

    json data = {
        {"action", "navigate"},
        {"url", "example.com"},
        {"retryEnabled", true},
        {"retryCount", 2},
        {"retryDelay", 1}
    };
    REQUIRE_NOTHROW(f.run(makeNode("n", NodeTypes::Navigation, data)));
    REQUIRE(driver->calls().size() == 3);
    REQUIRE(driver->currentUrl() == "https://example.com");

    driver->failNavigations = 10;
    data["failSilently"] = true;
    REQUIRE_THROWS_WITH(f.run(makeNode("n", NodeTypes::Navigation, data)),
                        "Navigation operation failed silently with action: navigate");
}

TEST_CASE("NavigationNode runs its after-operation wait", "[BrowserNodes]") {
    HandlerFixture f;
    auto driver = std::make_shared<FakeBrowserDriver>();
    f.context.setPage(driver);

    REQUIRE_THROWS_WITH(f.run(makeNode("n", NodeTypes::Navigation, {
        {"action", "navigate"},
        {"url", "example.com/login"},
        {"waitForUrl", "/dashboard"},
        {"waitForUrlTimeout", 50},
        {"waitAfterOperation", true}
    })), "Wait after operation: URL did not match pattern \"/dashboard\" within 50ms. "
         "Current URL: https://example.com/login");
    REQUIRE(driver->calls().size() == 1);
}

// =============================================================================
// Wait node
// =============================================================================

TEST_CASE("WaitNode timeout sleeps without a page", "[WaitNode]") {
    HandlerFixture f;

    auto start = std::chrono::steady_clock::now();
    f.run(makeNode("w", NodeTypes::Wait, {{"waitType", "timeout"}, {"value", "60"}}));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    REQUIRE(elapsed >= 60);

    REQUIRE_THROWS_WITH(f.run(makeNode("w", NodeTypes::Wait, {{"waitType", "timeout"}, {"value", "soon"}})),
                        "Invalid timeout value for Wait node");
}

TEST_CASE("WaitNode without a wait type is a no-op", "[WaitNode]") {
    HandlerFixture f;
    REQUIRE_NOTHROW(f.run(makeNode("w", NodeTypes::Wait)));
}

TEST_CASE("WaitNode browser waits need a page", "[WaitNode]") {
    HandlerFixture f;

    REQUIRE_THROWS_WITH(f.run(makeNode("w", NodeTypes::Wait, {{"waitType", "selector"}, {"value", "#a"}})),
                        "Page is required for selector wait");
    REQUIRE_THROWS_WITH(f.run(makeNode("w", NodeTypes::Wait, {{"waitType", "teleport"}})),
                        "Invalid wait type: teleport");

    auto driver = std::make_shared<FakeBrowserDriver>();
    driver->setVisible("//button", true);
    f.context.setPage(driver);
    REQUIRE_NOTHROW(f.run(makeNode("w", NodeTypes::Wait, {
        {"waitType", "selector"}, {"value", "//button"}, {"selectorType", "xpath"}, {"timeout", 200}
    })));
}

TEST_CASE("WaitNode api-response checks", "[WaitNode]") {
    HandlerFixture f;
    f.context.setData("login", {
        {"status", 201},
        {"headers", {{"content-type", "application/json"}}},
        {"body", {{"user", {{"id", 7}, {"role", "admin"}}}}}
    });

    auto apiWait = [](json config) {
        return makeNode("w", NodeTypes::Wait, {{"waitType", "api-response"}, {"apiWaitConfig", std::move(config)}});
    };

    REQUIRE_NOTHROW(f.run(apiWait({{"contextKey", "login"}, {"checkType", "status"}, {"expectedValue", 201}})));
    REQUIRE_NOTHROW(f.run(apiWait({{"contextKey", "login"}, {"checkType", "header"}, {"path", "Content-Type"},
                                   {"expectedValue", "json"}, {"matchType", "contains"}})));
    REQUIRE_NOTHROW(f.run(apiWait({{"contextKey", "login"}, {"checkType", "body-path"}, {"path", "user.role"},
                                   {"expectedValue", "admin"}})));

    REQUIRE_THROWS_WITH(f.run(apiWait({{"contextKey", "login"}, {"checkType", "status"}, {"expectedValue", 200}})),
                        "API response check failed: expected 200, got 201 (match type: equals)");
    REQUIRE_THROWS_WITH(f.run(apiWait({{"contextKey", "login"}, {"checkType", "header"}, {"path", "x-trace"}})),
                        "Header \"x-trace\" not found in API response");
    REQUIRE_THROWS_WITH(f.run(apiWait({{"contextKey", "login"}, {"checkType", "body-path"}, {"path", "user.email"}})),
                        "Path \"user.email\" not found in API response body");
    REQUIRE_THROWS_WITH(f.run(apiWait({{"contextKey", "logout"}, {"checkType", "status"}})),
                        "API response not found in context with key: logout");
    REQUIRE_THROWS_WITH(f.run(apiWait({{"contextKey", "login"}, {"checkType", "cookie"}})),
                        "Invalid check type: cookie");
    REQUIRE_THROWS_WITH(f.run(makeNode("w", NodeTypes::Wait, {{"waitType", "api-response"}})),
                        "apiWaitConfig is required for API response wait");
}

TEST_CASE("WaitNode api-response falls back to value as context key", "[WaitNode]") {
    HandlerFixture f;
    f.context.setData("api1", {{"status", 200}});

    REQUIRE_NOTHROW(f.run(makeNode("w", NodeTypes::Wait, {
        {"waitType", "api-response"},
        {"value", "api1"},
        {"apiWaitConfig", {{"checkType", "status"}, {"expectedValue", "200"}}}
    })));
}

TEST_CASE("WaitNode retries until the api response is ready", "[WaitNode]") {
    HandlerFixture f;
    auto node = makeNode("w", NodeTypes::Wait, {
        {"waitType", "api-response"},
        {"retryEnabled", true},
        {"retryCount", 1},
        {"retryDelay", 1},
        {"failSilently", true},
        {"apiWaitConfig", {{"contextKey", "late"}, {"checkType", "status"}, {"expectedValue", 200}}}
    });

    REQUIRE_THROWS_WITH(f.run(node), "Wait operation failed silently for waitType: api-response");
}
