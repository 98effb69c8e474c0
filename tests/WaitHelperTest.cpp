#include <catch2/catch.hpp>
#include "FakeBrowserDriver.hpp"
#include "engine/WaitHelper.hpp"
#include <chrono>

using namespace automflow::engine;

namespace {

using Clock = std::chrono::steady_clock;

int64_t msSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

} // anonymous namespace

// =============================================================================
// Single conditions
// =============================================================================

TEST_CASE("WaitHelper selector wait succeeds once visible", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;
    driver.setVisible("#ready", true);

    WaitOptions options;
    options.selector = "#ready";
    options.defaultTimeoutMs = 500;

    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, options, context));
    REQUIRE(driver.visibilityChecks == 1);
}

TEST_CASE("WaitHelper selector wait times out", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;

    WaitOptions options;
    options.selector = "#never";
    options.selectorTimeoutMs = 150;

    auto start = Clock::now();
    REQUIRE_THROWS_WITH(WaitHelper::executeWaits(&driver, options, context),
                        "Wait before operation: Selector \"#never\" (css) did not appear within 150ms");
    REQUIRE(msSince(start) >= 150);
}

TEST_CASE("WaitHelper url wait matches literal and regex patterns", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;
    driver.setUrl("https://app.example.com/orders/42");

    WaitOptions literal;
    literal.urlPattern = "/orders/";
    literal.defaultTimeoutMs = 200;
    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, literal, context));

    WaitOptions regex;
    regex.urlPattern = "/orders/[0-9]+$/";
    regex.defaultTimeoutMs = 200;
    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, regex, context));

    WaitOptions miss;
    miss.urlPattern = "/checkout";
    miss.defaultTimeoutMs = 100;
    miss.timing = WaitTiming::After;
    REQUIRE_THROWS_WITH(WaitHelper::executeWaits(&driver, miss, context),
                        "Wait after operation: URL did not match pattern \"/checkout\" within 100ms. "
                        "Current URL: https://app.example.com/orders/42");
}

TEST_CASE("WaitHelper condition wait interpolates the expression", "[WaitHelper]") {
    ExecutionContext context;
    context.setVariable("id", "cart");
    FakeBrowserDriver driver;
    driver.evaluator = [](const std::string& expression) {
        return nlohmann::json(expression == "document.getElementById('cart') !== null");
    };

    WaitOptions options;
    options.condition = "document.getElementById('${variables.id}') !== null";
    options.defaultTimeoutMs = 200;

    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, options, context));
}

TEST_CASE("WaitHelper without a page reports the condition as unmet", "[WaitHelper]") {
    ExecutionContext context;
    WaitOptions options;
    options.selector = "#x";
    options.defaultTimeoutMs = 50;

    REQUIRE_THROWS_AS(WaitHelper::executeWaits(nullptr, options, context), std::runtime_error);
}

// =============================================================================
// Strategies
// =============================================================================

TEST_CASE("WaitHelper parallel failure waits for the slowest check", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;
    const auto start = Clock::now();
    driver.evaluator = [start](const std::string&) {
        return nlohmann::json(msSince(start) >= 300);
    };

    WaitOptions options;
    options.selector = "#missing";
    options.selectorTimeoutMs = 100;
    options.condition = "window.loaded";
    options.conditionTimeoutMs = 1000;

    REQUIRE_THROWS_WITH(WaitHelper::executeWaits(&driver, options, context),
                        "Wait before operation: Selector \"#missing\" (css) did not appear within 100ms");
    REQUIRE(msSince(start) >= 300);
}

TEST_CASE("WaitHelper parallel checks run concurrently", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;
    const auto start = Clock::now();
    driver.evaluator = [start](const std::string&) {
        return nlohmann::json(msSince(start) >= 200);
    };
    driver.setUrl("https://example.com/home");

    WaitOptions options;
    options.urlPattern = "/home";
    options.condition = "ready()";
    options.defaultTimeoutMs = 2000;

    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, options, context));
    REQUIRE(msSince(start) < 1500);
}

TEST_CASE("WaitHelper sequential stops at the first failure", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;

    WaitOptions options;
    options.strategy = WaitStrategy::Sequential;
    options.selector = "#missing";
    options.selectorTimeoutMs = 50;
    options.condition = "true";

    REQUIRE_THROWS_AS(WaitHelper::executeWaits(&driver, options, context), std::runtime_error);
    for (const auto& call : driver.calls()) {
        REQUIRE(call.rfind("evaluate:", 0) != 0);
    }
}

TEST_CASE("WaitHelper fail silently swallows a timeout", "[WaitHelper]") {
    ExecutionContext context;
    FakeBrowserDriver driver;

    WaitOptions options;
    options.selector = "#missing";
    options.selectorTimeoutMs = 50;
    options.failSilently = true;

    REQUIRE_NOTHROW(WaitHelper::executeWaits(&driver, options, context));
}

// =============================================================================
// Node data
// =============================================================================

TEST_CASE("WaitHelper parseOptions reads node data", "[WaitHelper]") {
    ExecutionContext context;
    context.setVariable("t", 750);

    auto options = WaitHelper::parseOptions({
        {"waitForSelector", "#a"},
        {"waitForSelectorType", "xpath"},
        {"waitForSelectorTimeout", "${variables.t}"},
        {"waitForUrl", "/done"},
        {"waitForCondition", "ok()"},
        {"waitForConditionTimeout", 0},
        {"waitStrategy", "sequential"},
        {"timeout", 1200}
    }, WaitTiming::After, context);

    REQUIRE(options.selector == "#a");
    REQUIRE(options.selectorType == "xpath");
    REQUIRE(options.selectorTimeoutMs == std::optional<int64_t>(750));
    REQUIRE(options.urlPattern == "/done");
    REQUIRE_FALSE(options.urlTimeoutMs.has_value());
    REQUIRE_FALSE(options.conditionTimeoutMs.has_value());
    REQUIRE(options.strategy == WaitStrategy::Sequential);
    REQUIRE(options.timing == WaitTiming::After);
    REQUIRE(options.defaultTimeoutMs == 1200);
    REQUIRE(options.hasAny());
}

TEST_CASE("WaitHelper runNodeWaits honours waitAfterOperation", "[WaitHelper]") {
    ExecutionContext context;
    auto driver = std::make_shared<FakeBrowserDriver>();
    context.setPage(driver);

    json data = {{"waitForSelector", "#gone"}, {"waitForSelectorTimeout", 50}, {"waitAfterOperation", true}};

    // Configured for after: the before pass is a no-op
    REQUIRE_NOTHROW(WaitHelper::runNodeWaits(data, WaitTiming::Before, context));
    REQUIRE(driver->visibilityChecks == 0);

    REQUIRE_THROWS_AS(WaitHelper::runNodeWaits(data, WaitTiming::After, context), std::runtime_error);
    REQUIRE(driver->visibilityChecks > 0);
}
