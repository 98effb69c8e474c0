#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>

namespace automflow {
namespace engine {

/**
 * Handle on one automated browser page
 *
 * Implemented by a browser backend (CDP, WebDriver, ...). All calls may block
 * and may throw std::runtime_error on driver failures.
 */
class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    /**
     * Navigate the page. waitUntil is one of load, domcontentloaded, networkidle, commit
     */
    virtual void navigate(const std::string& url, int timeoutMs, const std::string& waitUntil) = 0;

    virtual void goBack(int timeoutMs, const std::string& waitUntil) = 0;
    virtual void goForward(int timeoutMs, const std::string& waitUntil) = 0;
    virtual void reload(int timeoutMs, const std::string& waitUntil) = 0;

    /**
     * True if an element matching the selector is attached and visible
     * selectorType: "css" or "xpath"
     */
    virtual bool isVisible(const std::string& selector, const std::string& selectorType) = 0;

    virtual std::string currentUrl() = 0;

    /**
     * Evaluate a script expression in the page and return its JSON value
     */
    virtual nlohmann::json evaluate(const std::string& expression) = 0;

    virtual void close() = 0;
};

using BrowserDriverPtr = std::shared_ptr<BrowserDriver>;

/**
 * Creates a driver from "openBrowser" node options (headless, browser, viewport...)
 */
using DriverFactory = std::function<BrowserDriverPtr(const nlohmann::json& options)>;

} // namespace engine
} // namespace automflow
