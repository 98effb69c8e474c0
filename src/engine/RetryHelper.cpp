#include "engine/RetryHelper.hpp"
#include "engine/VariableInterpolator.hpp"
#include "server/Logger.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>

namespace automflow {
namespace engine {

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsedMs(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

std::string messageOf(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

// Null or mistyped keys fall back to the default
std::string stringOr(const json& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    return it != data.end() && it->is_string() ? it->get<std::string>() : fallback;
}

bool boolOr(const json& data, const char* key, bool fallback) {
    auto it = data.find(key);
    return it != data.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

} // anonymous namespace

int64_t RetryHelper::calculateDelay(int attempt, int64_t baseDelay, DelayStrategy strategy,
                                    std::optional<int64_t> maxDelay) {
    if (strategy == DelayStrategy::Fixed) {
        return baseDelay;
    }
    int shift = attempt > 1 ? attempt - 1 : 0;
    int64_t delay = (shift >= 62 || baseDelay > (INT64_MAX >> shift))
        ? INT64_MAX
        : baseDelay * (int64_t{1} << shift);
    if (maxDelay && delay > *maxDelay) {
        delay = *maxDelay;
    }
    return delay;
}

void RetryHelper::sleepOrStop(const ExecutionContext& context, int64_t delayMs) {
    if (delayMs <= 0) {
        context.throwIfStopped();
        return;
    }
    if (!context.sleepFor(std::chrono::milliseconds(delayMs))) {
        throw ExecutionStopped();
    }
}

bool RetryHelper::executeWithRetry(const std::function<void()>& operation,
                                   const RetryOptions& options,
                                   const ExecutionContext& context,
                                   BrowserDriver* driver) {
    return run(operation, options, context, driver) != RetryOutcome::FailedSilently;
}

RetryOutcome RetryHelper::run(const std::function<void()>& operation,
                              const RetryOptions& options,
                              const ExecutionContext& context,
                              BrowserDriver* driver) {
    if (!options.enabled) {
        return runOnce(operation, options);
    }
    if (options.strategy == RetryStrategy::Count) {
        return runCount(operation, options, context);
    }
    return runUntilCondition(operation, options, context, driver);
}

RetryOutcome RetryHelper::runOnce(const std::function<void()>& operation, const RetryOptions& options) {
    try {
        operation();
        return RetryOutcome::Succeeded;
    } catch (const ExecutionStopped&) {
        throw;
    } catch (const std::exception& e) {
        if (!options.failSilently) {
            throw;
        }
        LOG_WARN(std::string("Operation failed silently: ") + e.what());
        return RetryOutcome::FailedSilently;
    }
}

RetryOutcome RetryHelper::runCount(const std::function<void()>& operation, const RetryOptions& options,
                                   const ExecutionContext& context) {
    const int maxRetries = options.count < 0 ? 0 : options.count;
    std::exception_ptr lastError;

    for (int attempt = 0; attempt <= maxRetries; ++attempt) {
        try {
            operation();
            return RetryOutcome::Succeeded;
        } catch (const ExecutionStopped&) {
            throw;
        } catch (const std::exception&) {
            lastError = std::current_exception();
        }

        if (attempt < maxRetries) {
            int64_t delay = calculateDelay(attempt + 1, options.delayMs, options.delayStrategy, options.maxDelayMs);
            LOG_INFO("Retry attempt " + std::to_string(attempt + 1) + "/" + std::to_string(maxRetries) +
                     " failed: " + messageOf(lastError) + ". Retrying in " + std::to_string(delay) + "ms...");
            sleepOrStop(context, delay);
        }
    }

    if (options.failSilently) {
        LOG_WARN("Retry failed silently after " + std::to_string(maxRetries + 1) + " attempts: " +
                 messageOf(lastError));
        return RetryOutcome::FailedSilently;
    }
    std::rethrow_exception(lastError);
}

RetryOutcome RetryHelper::runUntilCondition(const std::function<void()>& operation, const RetryOptions& options,
                                            const ExecutionContext& context, BrowserDriver* driver) {
    if (!options.untilCondition || options.untilCondition->type.empty()) {
        throw std::runtime_error("Retry until condition requires a condition");
    }
    const ConditionSpec& condition = *options.untilCondition;
    if (!condition.isApiCondition() && !driver) {
        throw std::runtime_error("Retry until condition requires a browser page");
    }

    const int64_t timeout = options.conditionTimeoutMs;
    const auto start = Clock::now();
    int attempt = 0;

    while (true) {
        if (elapsedMs(start) >= timeout) {
            if (options.failSilently) {
                LOG_WARN("Retry until condition timed out after " + std::to_string(timeout) + "ms");
                return RetryOutcome::FailedSilently;
            }
            throw std::runtime_error("Retry until condition timed out after " + std::to_string(timeout) + "ms");
        }

        std::exception_ptr failure;
        try {
            operation();
        } catch (const ExecutionStopped&) {
            throw;
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        ++attempt;

        ConditionResult probe = ConditionProbe::check(condition, driver, context);
        if (probe.met) {
            return failure ? RetryOutcome::ConditionMetAfterFailure : RetryOutcome::Succeeded;
        }

        int64_t delay = calculateDelay(attempt, options.delayMs, options.delayStrategy, options.maxDelayMs);
        if (elapsedMs(start) + delay >= timeout) {
            if (options.failSilently) {
                LOG_WARN("Retry until condition timed out: condition not met after " +
                         std::to_string(attempt) + " attempts");
                return RetryOutcome::FailedSilently;
            }
            if (failure) {
                std::rethrow_exception(failure);
            }
            throw std::runtime_error("Retry until condition timed out: condition not met after " +
                                     std::to_string(attempt) + " attempts (" + probe.details + ")");
        }

        if (failure) {
            LOG_INFO("Retry attempt " + std::to_string(attempt) + " failed: " + messageOf(failure) +
                     ". Retrying in " + std::to_string(delay) + "ms...");
        } else {
            LOG_INFO("Retry [" + std::to_string(attempt) + "]: " + probe.details +
                     " | Retrying in " + std::to_string(delay) + "ms...");
        }
        sleepOrStop(context, delay);
    }
}

RetryOptions RetryHelper::parseOptions(const json& nodeData, const ExecutionContext& context) {
    RetryOptions options;
    if (!nodeData.is_object()) {
        return options;
    }

    options.enabled = boolOr(nodeData, "retryEnabled", false);
    options.failSilently = boolOr(nodeData, "failSilently", false);

    std::string strategy = stringOr(nodeData, "retryStrategy", "count");
    options.strategy = strategy == "untilCondition" ? RetryStrategy::UntilCondition : RetryStrategy::Count;

    auto field = [&](const char* key) { return nodeData.contains(key) ? nodeData[key] : json(); };

    options.count = static_cast<int>(VariableInterpolator::resolveInteger(field("retryCount"), context, 3));
    options.delayMs = VariableInterpolator::resolveInteger(field("retryDelay"), context, 1000);
    options.delayStrategy = stringOr(nodeData, "retryDelayStrategy", "fixed") == "exponential"
        ? DelayStrategy::Exponential
        : DelayStrategy::Fixed;

    if (nodeData.contains("retryMaxDelay") && !nodeData["retryMaxDelay"].is_null()) {
        int64_t maxDelay = VariableInterpolator::resolveInteger(nodeData["retryMaxDelay"], context, -1);
        if (maxDelay >= 0) {
            options.maxDelayMs = maxDelay;
        }
    }

    if (nodeData.contains("retryUntilCondition") && nodeData["retryUntilCondition"].is_object()) {
        const auto& cond = nodeData["retryUntilCondition"];
        options.untilCondition = ConditionSpec::fromJson(cond, context);
        options.conditionTimeoutMs = VariableInterpolator::resolveInteger(
            cond.contains("timeout") ? cond["timeout"] : json(), context, 30000);
    }
    return options;
}

} // namespace engine
} // namespace automflow
