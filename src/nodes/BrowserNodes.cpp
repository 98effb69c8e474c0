#include "nodes/BrowserNodes.hpp"
#include "engine/RetryHelper.hpp"
#include "engine/VariableInterpolator.hpp"
#include "engine/WaitHelper.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>

namespace automflow {
namespace nodes {

using engine::ExecutionContext;
using engine::RetryHelper;
using engine::VariableInterpolator;
using engine::WaitHelper;
using engine::WaitTiming;
using engine::json;
using workflow::Node;
namespace NodeTypes = workflow::NodeTypes;

// ============== Registration ==============

void registerBrowserNodes(engine::NodeHandlerRegistry& registry) {
    registry.registerHandler(NodeTypes::OpenBrowser, std::make_shared<OpenBrowserNode>());
    registry.registerHandler(NodeTypes::Navigation, std::make_shared<NavigationNode>());
}

// ============== openBrowser ==============

json OpenBrowserNode::launchOptions(const json& data) {
    json options = {
        {"headless", data.value("headless", true)},
        {"browser", data.value("browser", std::string("chromium"))},
        {"maxWindow", data.value("maxWindow", true)},
        {"stealthMode", data.value("stealthMode", false)}
    };

    if (data.contains("viewportWidth") && data.contains("viewportHeight")
        && data["viewportWidth"].is_number() && data["viewportHeight"].is_number()) {
        options["viewport"] = {
            {"width", data["viewportWidth"]},
            {"height", data["viewportHeight"]}
        };
    }
    for (const char* key : {"capabilities", "launchOptions", "jsScript"}) {
        if (data.contains(key) && !data[key].is_null()) {
            options[key] = data[key];
        }
    }
    return options;
}

void OpenBrowserNode::execute(const Node& node, ExecutionContext& context) {
    const auto& factory = context.getDriverFactory();
    if (!factory) {
        throw std::runtime_error("No browser driver configured");
    }

    json options = launchOptions(node.data.is_object() ? node.data : json::object());
    context.closePage();

    LOG_DEBUG("Launching " + options["browser"].get<std::string>() + " for " + node.id);
    auto page = factory(options);
    if (!page) {
        throw std::runtime_error("Browser driver factory returned no page");
    }
    context.setPage(std::move(page));
}

// ============== navigation ==============

std::string NavigationNode::normalizeUrl(const std::string& url) {
    auto begin = std::find_if_not(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(url.rbegin(), url.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string trimmed = begin < end ? std::string(begin, end) : std::string();

    static const std::regex scheme("^https?://", std::regex::icase);
    if (!std::regex_search(trimmed, scheme)) {
        trimmed = "https://" + trimmed;
    }
    return trimmed;
}

void NavigationNode::execute(const Node& node, ExecutionContext& context) {
    auto page = context.getPage();
    if (!page) {
        throw std::runtime_error("No page available. Ensure Open Browser node is executed first.");
    }

    const std::string action = node.stringField("action");
    if (action.empty()) {
        throw std::runtime_error("Action is required for Navigation node");
    }

    const int timeout = static_cast<int>(
        VariableInterpolator::resolveInteger(node.data.value("timeout", json(nullptr)), context, 30000));
    const std::string waitUntil = node.stringField("waitUntil", "networkidle");
    auto retry = RetryHelper::parseOptions(node.data, context);

    bool done = RetryHelper::executeWithRetry([&]() {
        WaitHelper::runNodeWaits(node.data, WaitTiming::Before, context);

        if (action == "navigate") {
            std::string url = node.stringField("url");
            if (url.empty()) {
                throw std::runtime_error("URL is required for navigate action");
            }
            url = normalizeUrl(VariableInterpolator::interpolateString(url, context));
            page->navigate(url, timeout, waitUntil);
        } else if (action == "goBack") {
            page->goBack(timeout, waitUntil);
        } else if (action == "goForward") {
            page->goForward(timeout, waitUntil);
        } else if (action == "reload") {
            page->reload(timeout, waitUntil);
        } else {
            throw std::runtime_error("Invalid navigation action: " + action);
        }

        WaitHelper::runNodeWaits(node.data, WaitTiming::After, context);
    }, retry, context, page.get());

    if (!done) {
        throw std::runtime_error("Navigation operation failed silently with action: " + action);
    }
}

} // namespace nodes
} // namespace automflow
