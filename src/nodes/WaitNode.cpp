#include "nodes/WaitNode.hpp"
#include "engine/ConditionProbe.hpp"
#include "engine/RetryHelper.hpp"
#include "engine/VariableInterpolator.hpp"
#include "engine/WaitHelper.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace automflow {
namespace nodes {

using engine::ConditionProbe;
using engine::ExecutionContext;
using engine::PauseReason;
using engine::RetryHelper;
using engine::VariableInterpolator;
using engine::WaitHelper;
using engine::WaitOptions;
using engine::json;
using workflow::Node;

namespace {

const char* kPauseWarnedKey = "_waitPauseWarned";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::string valueText(const Node& node, const ExecutionContext& context) {
    const json& raw = node.data.value("value", json(nullptr));
    std::string text = raw.is_string() ? raw.get<std::string>() : (raw.is_null() ? "" : raw.dump());
    return VariableInterpolator::interpolateString(text, context);
}

std::string stringOf(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // anonymous namespace

void registerWaitNode(engine::NodeHandlerRegistry& registry) {
    registry.registerHandler(workflow::NodeTypes::Wait, std::make_shared<WaitNode>());
}

void WaitNode::execute(const Node& node, ExecutionContext& context) {
    if (node.flag("pause")) {
        auto* control = context.control();
        if (control && control->isInteractive()) {
            control->requestPause(node.id, PauseReason::WaitPause);
        } else if (control && !context.hasData(kPauseWarnedKey)) {
            LOG_WARN("Wait node pause is not supported in batch execution, continuing without pausing");
            context.setData(kPauseWarnedKey, true);
        }
    }

    const std::string waitType = node.stringField("waitType");
    if (waitType.empty()) {
        return;
    }

    auto retry = RetryHelper::parseOptions(node.data, context);
    auto page = context.getPage();
    bool done = RetryHelper::executeWithRetry([&]() { waitOnce(node, context); }, retry, context, page.get());

    if (!done) {
        throw std::runtime_error("Wait operation failed silently for waitType: " + waitType);
    }
}

void WaitNode::waitOnce(const Node& node, ExecutionContext& context) {
    const std::string waitType = node.stringField("waitType");

    if (waitType == "timeout") {
        const json& raw = node.data.value("value", json(nullptr));
        int64_t timeout = VariableInterpolator::resolveInteger(raw, context, -1);
        if (timeout < 0) {
            throw std::runtime_error("Invalid timeout value for Wait node");
        }
        if (!context.sleepFor(std::chrono::milliseconds(timeout))) {
            throw engine::ExecutionStopped();
        }
        return;
    }

    if (waitType == "api-response") {
        checkApiResponse(node, context);
        return;
    }

    if (waitType != "selector" && waitType != "url" && waitType != "condition") {
        throw std::runtime_error("Invalid wait type: " + waitType);
    }

    auto page = context.getPage();
    if (!page) {
        throw std::runtime_error("Page is required for " + waitType + " wait");
    }

    WaitOptions options;
    options.defaultTimeoutMs = VariableInterpolator::resolveInteger(
        node.data.value("timeout", json(nullptr)), context, 30000);
    std::string value = valueText(node, context);
    if (waitType == "selector") {
        options.selector = value;
        options.selectorType = node.stringField("selectorType", "css");
    } else if (waitType == "url") {
        options.urlPattern = value;
    } else {
        options.condition = value;
    }
    WaitHelper::executeWaits(page.get(), options, context);
}

void WaitNode::checkApiResponse(const Node& node, const ExecutionContext& context) {
    const json config = node.data.value("apiWaitConfig", json(nullptr));
    if (!config.is_object()) {
        throw std::runtime_error("apiWaitConfig is required for API response wait");
    }

    std::string contextKey = config.value("contextKey", std::string());
    if (contextKey.empty()) {
        contextKey = valueText(node, context);
    }
    json response = context.getData(contextKey);
    if (response.is_null()) {
        throw std::runtime_error("API response not found in context with key: " + contextKey);
    }

    const std::string checkType = config.value("checkType", std::string());
    const json expected = config.value("expectedValue", json(nullptr));
    const std::string matchType = config.value("matchType", std::string("equals"));
    const std::string path = config.value("path", std::string());
    json actual;

    if (checkType == "status") {
        actual = response.value("status", json(nullptr));
    } else if (checkType == "header") {
        if (path.empty()) {
            throw std::runtime_error("Header name (path) is required for header check");
        }
        const json headers = response.value("headers", json::object());
        if (headers.contains(toLower(path))) {
            actual = headers[toLower(path)];
        } else if (headers.contains(path)) {
            actual = headers[path];
        } else {
            throw std::runtime_error("Header \"" + path + "\" not found in API response");
        }
        actual = stringOf(actual);
    } else if (checkType == "body-path") {
        if (path.empty()) {
            throw std::runtime_error("JSON path is required for body-path check");
        }
        actual = ConditionProbe::getNestedValue(response.value("body", json(nullptr)), path);
        if (actual.is_null()) {
            throw std::runtime_error("Path \"" + path + "\" not found in API response body");
        }
    } else if (checkType == "body-value") {
        actual = response.value("body", json(nullptr));
    } else {
        throw std::runtime_error("Invalid check type: " + checkType);
    }

    if (!ConditionProbe::matchValue(actual, expected, matchType)) {
        throw std::runtime_error("API response check failed: expected " + expected.dump() +
                                 ", got " + actual.dump() + " (match type: " + matchType + ")");
    }
}

} // namespace nodes
} // namespace automflow
