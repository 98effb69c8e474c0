#pragma once

#include "engine/BrowserDriver.hpp"
#include "engine/ExecutionContext.hpp"
#include <optional>
#include <string>

namespace automflow {
namespace engine {

enum class WaitStrategy {
    Parallel,
    Sequential
};

enum class WaitTiming {
    Before,
    After
};

/**
 * Advanced wait configuration attached to a node
 *
 * Up to three independent conditions, each with its own timeout (defaults to
 * defaultTimeoutMs). Values may contain ${...} references, resolved when the
 * wait runs.
 */
struct WaitOptions {
    std::string selector;
    std::string selectorType = "css";
    std::optional<int64_t> selectorTimeoutMs;

    std::string urlPattern;
    std::optional<int64_t> urlTimeoutMs;

    std::string condition;
    std::optional<int64_t> conditionTimeoutMs;

    WaitStrategy strategy = WaitStrategy::Parallel;
    WaitTiming timing = WaitTiming::Before;
    bool failSilently = false;
    int64_t defaultTimeoutMs = 30000;

    bool hasAny() const { return !selector.empty() || !urlPattern.empty() || !condition.empty(); }
};

/**
 * Runs the wait conditions of a node before or after its main action
 *
 * Each condition polls until it holds or its own deadline passes. In parallel
 * mode every check runs to its end before the first failure is reported, so a
 * failing call never returns before the slowest check has finished.
 */
class WaitHelper {
public:
    /**
     * Run every configured condition. Throws std::runtime_error on the first
     * failure unless failSilently is set. ExecutionStopped always propagates.
     */
    static void executeWaits(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context);

    /**
     * Read waitForSelector / waitForUrl / waitForCondition (+ types, timeouts),
     * waitStrategy and failSilently from node data
     */
    static WaitOptions parseOptions(const json& nodeData, WaitTiming timing, const ExecutionContext& context);

    /**
     * Handler helper: run the node's waits if they are configured for `timing`
     * (data.waitAfterOperation selects After, default Before)
     */
    static void runNodeWaits(const json& nodeData, WaitTiming timing, const ExecutionContext& context);

    static std::string timingLabel(WaitTiming timing);

    /// Poll interval between two probes of the same condition
    static constexpr int64_t kPollIntervalMs = 100;

private:
    static void waitForSelector(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context);
    static void waitForUrl(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context);
    static void waitForCondition(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context);
};

} // namespace engine
} // namespace automflow
