#pragma once

#include "engine/NodeHandler.hpp"
#include "engine/NodeHandlerRegistry.hpp"

namespace automflow {
namespace nodes {

/**
 * Register openBrowser and navigation
 */
void registerBrowserNodes(engine::NodeHandlerRegistry& registry);

/**
 * openBrowser - create a page through the context's DriverFactory
 *
 * Options passed to the factory: headless (default true), browser (default
 * "chromium"), maxWindow (default true), viewport {width, height} when both
 * viewportWidth and viewportHeight are set, plus stealthMode, capabilities,
 * launchOptions and jsScript as given. A page left by an earlier openBrowser
 * is closed first.
 */
class OpenBrowserNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "browser"; }

    static engine::json launchOptions(const engine::json& data);
};

/**
 * navigation - navigate / goBack / goForward / reload on the current page
 *
 * The action and its node waits run inside RetryHelper. URLs without a scheme
 * get "https://" prepended.
 */
class NavigationNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "browser"; }

    static std::string normalizeUrl(const std::string& url);
};

} // namespace nodes
} // namespace automflow
