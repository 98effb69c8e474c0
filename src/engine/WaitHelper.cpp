#include "engine/WaitHelper.hpp"
#include "engine/ConditionProbe.hpp"
#include "engine/VariableInterpolator.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <vector>

namespace automflow {
namespace engine {

using server::Logger;
using server::LogLevel;

namespace {

using Clock = std::chrono::steady_clock;

struct PollOutcome {
    bool met = false;
    ConditionResult last;
    int64_t elapsedMs = 0;
};

/**
 * Probe spec until met or timeoutMs elapsed, logging the before/after observation
 */
PollOutcome poll(const ConditionSpec& spec, BrowserDriver* driver, const ExecutionContext& context,
                 int64_t timeoutMs, const std::string& timingLabel) {
    Logger::instance().observation(LogLevel::DEBUG, "[wait:start]", {
        {"timing", timingLabel},
        {"condition", spec.type},
        {"expected", spec.value},
        {"timeoutMs", timeoutMs}
    });

    const auto start = Clock::now();
    PollOutcome outcome;

    while (true) {
        context.throwIfStopped();

        outcome.last = ConditionProbe::check(spec, driver, context);
        outcome.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        if (outcome.last.met) {
            outcome.met = true;
            break;
        }
        if (outcome.elapsedMs >= timeoutMs) {
            break;
        }

        int64_t pause = std::min(WaitHelper::kPollIntervalMs, timeoutMs - outcome.elapsedMs);
        if (!context.sleepFor(std::chrono::milliseconds(pause))) {
            throw ExecutionStopped();
        }
    }

    Logger::instance().observation(outcome.met ? LogLevel::INFO : LogLevel::WARN, "[wait:end]", {
        {"timing", timingLabel},
        {"condition", spec.type},
        {"expected", spec.value},
        {"observed", outcome.last.observed},
        {"timeoutMs", timeoutMs},
        {"result", outcome.met ? "met" : "timeout"},
        {"elapsedMs", outcome.elapsedMs}
    });
    return outcome;
}

std::string stringOr(const json& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    return it != data.end() && it->is_string() ? it->get<std::string>() : fallback;
}

bool boolOr(const json& data, const char* key, bool fallback) {
    auto it = data.find(key);
    return it != data.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

std::string interpolated(const std::string& value, const ExecutionContext& context) {
    return VariableInterpolator::interpolateString(value, context);
}

} // anonymous namespace

std::string WaitHelper::timingLabel(WaitTiming timing) {
    return timing == WaitTiming::After ? "after operation" : "before operation";
}

void WaitHelper::waitForSelector(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context) {
    const std::string label = timingLabel(options.timing);
    ConditionSpec spec;
    spec.type = "selector";
    spec.value = interpolated(options.selector, context);
    spec.selectorType = options.selectorType;
    if (spec.value.empty()) {
        throw std::runtime_error("Wait for selector failed (" + label + "): selector cannot be empty");
    }

    int64_t timeout = options.selectorTimeoutMs.value_or(options.defaultTimeoutMs);
    PollOutcome outcome = poll(spec, driver, context, timeout, label);
    if (!outcome.met) {
        throw std::runtime_error("Wait " + label + ": Selector \"" + spec.value + "\" (" + spec.selectorType +
                                 ") did not appear within " + std::to_string(timeout) + "ms");
    }
}

void WaitHelper::waitForUrl(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context) {
    const std::string label = timingLabel(options.timing);
    ConditionSpec spec;
    spec.type = "url";
    spec.value = interpolated(options.urlPattern, context);
    if (spec.value.empty()) {
        throw std::runtime_error("Wait for URL pattern failed (" + label + "): pattern cannot be empty");
    }

    int64_t timeout = options.urlTimeoutMs.value_or(options.defaultTimeoutMs);
    PollOutcome outcome = poll(spec, driver, context, timeout, label);
    if (!outcome.met) {
        throw std::runtime_error("Wait " + label + ": URL did not match pattern \"" + spec.value + "\" within " +
                                 std::to_string(timeout) + "ms. Current URL: " + outcome.last.observed);
    }
}

void WaitHelper::waitForCondition(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context) {
    const std::string label = timingLabel(options.timing);
    ConditionSpec spec;
    spec.type = "javascript";
    spec.value = interpolated(options.condition, context);
    if (spec.value.empty()) {
        throw std::runtime_error("Wait for condition failed (" + label + "): condition cannot be empty");
    }

    int64_t timeout = options.conditionTimeoutMs.value_or(options.defaultTimeoutMs);
    PollOutcome outcome = poll(spec, driver, context, timeout, label);
    if (!outcome.met) {
        throw std::runtime_error("Wait " + label + ": Condition did not evaluate to true within " +
                                 std::to_string(timeout) + "ms: " + spec.value +
                                 " (last: " + outcome.last.details + ")");
    }
}

void WaitHelper::executeWaits(BrowserDriver* driver, const WaitOptions& options, const ExecutionContext& context) {
    std::vector<std::function<void()>> checks;
    if (!options.selector.empty()) {
        checks.emplace_back([&]() { waitForSelector(driver, options, context); });
    }
    if (!options.urlPattern.empty()) {
        checks.emplace_back([&]() { waitForUrl(driver, options, context); });
    }
    if (!options.condition.empty()) {
        checks.emplace_back([&]() { waitForCondition(driver, options, context); });
    }
    if (checks.empty()) {
        return;
    }

    std::exception_ptr firstError;

    if (options.strategy == WaitStrategy::Sequential || checks.size() == 1) {
        for (const auto& check : checks) {
            try {
                check();
            } catch (const ExecutionStopped&) {
                throw;
            } catch (const std::exception&) {
                firstError = std::current_exception();
                break;
            }
        }
    } else {
        std::vector<std::future<void>> pending;
        pending.reserve(checks.size());
        for (const auto& check : checks) {
            pending.push_back(std::async(std::launch::async, check));
        }
        // Join every check before reporting, a failure never cuts a slower check short
        bool stopped = false;
        for (auto& future : pending) {
            try {
                future.get();
            } catch (const ExecutionStopped&) {
                stopped = true;
            } catch (const std::exception&) {
                if (!firstError) {
                    firstError = std::current_exception();
                }
            }
        }
        if (stopped) {
            throw ExecutionStopped();
        }
    }

    if (!firstError) {
        return;
    }
    if (options.failSilently) {
        try {
            std::rethrow_exception(firstError);
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Advanced wait failed silently: ") + e.what());
        }
        return;
    }
    std::rethrow_exception(firstError);
}

WaitOptions WaitHelper::parseOptions(const json& nodeData, WaitTiming timing, const ExecutionContext& context) {
    WaitOptions options;
    options.timing = timing;
    if (!nodeData.is_object()) {
        return options;
    }

    auto timeoutOf = [&](const char* key) -> std::optional<int64_t> {
        if (!nodeData.contains(key) || nodeData[key].is_null()) return std::nullopt;
        int64_t value = VariableInterpolator::resolveInteger(nodeData[key], context, 0);
        if (value <= 0) return std::nullopt;
        return value;
    };

    options.selector = stringOr(nodeData, "waitForSelector", "");
    options.selectorType = stringOr(nodeData, "waitForSelectorType", "css");
    options.selectorTimeoutMs = timeoutOf("waitForSelectorTimeout");

    options.urlPattern = stringOr(nodeData, "waitForUrl", "");
    options.urlTimeoutMs = timeoutOf("waitForUrlTimeout");

    options.condition = stringOr(nodeData, "waitForCondition", "");
    options.conditionTimeoutMs = timeoutOf("waitForConditionTimeout");

    options.strategy = stringOr(nodeData, "waitStrategy", "parallel") == "sequential"
        ? WaitStrategy::Sequential
        : WaitStrategy::Parallel;
    options.failSilently = boolOr(nodeData, "failSilently", false);
    if (auto defaultTimeout = timeoutOf("timeout")) {
        options.defaultTimeoutMs = *defaultTimeout;
    }
    return options;
}

void WaitHelper::runNodeWaits(const json& nodeData, WaitTiming timing, const ExecutionContext& context) {
    bool waitAfter = nodeData.is_object() && boolOr(nodeData, "waitAfterOperation", false);
    WaitTiming configured = waitAfter ? WaitTiming::After : WaitTiming::Before;
    if (configured != timing) {
        return;
    }

    WaitOptions options = parseOptions(nodeData, timing, context);
    if (!options.hasAny()) {
        return;
    }
    auto page = context.getPage();
    executeWaits(page.get(), options, context);
}

} // namespace engine
} // namespace automflow
