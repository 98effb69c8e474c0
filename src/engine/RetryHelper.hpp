#pragma once

#include "engine/BrowserDriver.hpp"
#include "engine/ConditionProbe.hpp"
#include "engine/ExecutionContext.hpp"
#include <functional>
#include <optional>
#include <string>

namespace automflow {
namespace engine {

enum class RetryStrategy {
    Count,
    UntilCondition
};

enum class DelayStrategy {
    Fixed,
    Exponential
};

/**
 * Declarative retry policy, usually parsed from node data
 */
struct RetryOptions {
    bool enabled = false;
    RetryStrategy strategy = RetryStrategy::Count;
    int count = 3;                              // retries after the first attempt
    std::optional<ConditionSpec> untilCondition;
    int64_t conditionTimeoutMs = 30000;
    int64_t delayMs = 1000;
    DelayStrategy delayStrategy = DelayStrategy::Fixed;
    std::optional<int64_t> maxDelayMs;
    bool failSilently = false;
};

enum class RetryOutcome {
    Succeeded,
    ConditionMetAfterFailure,   // operation failed but the until-condition already holds
    FailedSilently
};

/**
 * Retry a unit of work according to a RetryOptions policy
 *
 * Count strategy runs the operation up to count+1 times. Until-condition
 * strategy loops until the operation succeeds and the condition holds, or the
 * condition timeout elapses. Exhaustion either rethrows the last failure or,
 * with failSilently, yields no value.
 *
 * Sleeps go through the context so a stopped execution aborts promptly
 * (ExecutionStopped is never retried).
 */
class RetryHelper {
public:
    /**
     * Run an operation returning a value.
     * Returns nullopt when the policy failed silently, or when the operation
     * failed but the until-condition was met anyway.
     */
    template <typename T>
    static std::optional<T> executeWithRetry(const std::function<T()>& operation,
                                             const RetryOptions& options,
                                             const ExecutionContext& context,
                                             BrowserDriver* driver = nullptr) {
        std::optional<T> result;
        RetryOutcome outcome = run([&]() { result = operation(); }, options, context, driver);
        if (outcome != RetryOutcome::Succeeded) {
            return std::nullopt;
        }
        return result;
    }

    /**
     * Run an operation without a result. Returns false only when the policy
     * failed silently.
     */
    static bool executeWithRetry(const std::function<void()>& operation,
                                 const RetryOptions& options,
                                 const ExecutionContext& context,
                                 BrowserDriver* driver = nullptr);

    /**
     * Core loop shared by both overloads
     */
    static RetryOutcome run(const std::function<void()>& operation,
                            const RetryOptions& options,
                            const ExecutionContext& context,
                            BrowserDriver* driver);

    /**
     * Delay before retry number `attempt` (1-based):
     *   fixed       -> base
     *   exponential -> base * 2^(attempt-1), capped by maxDelay
     */
    static int64_t calculateDelay(int attempt, int64_t baseDelay, DelayStrategy strategy,
                                  std::optional<int64_t> maxDelay = std::nullopt);

    /**
     * Parse retryEnabled, retryStrategy, retryCount, retryUntilCondition,
     * retryDelay, retryDelayStrategy, retryMaxDelay and failSilently from node data.
     * Numeric fields may be templated strings.
     */
    static RetryOptions parseOptions(const json& nodeData, const ExecutionContext& context);

private:
    static RetryOutcome runOnce(const std::function<void()>& operation, const RetryOptions& options);
    static RetryOutcome runCount(const std::function<void()>& operation, const RetryOptions& options,
                                 const ExecutionContext& context);
    static RetryOutcome runUntilCondition(const std::function<void()>& operation, const RetryOptions& options,
                                          const ExecutionContext& context, BrowserDriver* driver);
    static void sleepOrStop(const ExecutionContext& context, int64_t delayMs);
};

} // namespace engine
} // namespace automflow
