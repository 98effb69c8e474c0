#pragma once

#include "engine/BrowserDriver.hpp"
#include "engine/ExecutionContext.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace automflow {
namespace engine {

/**
 * A condition checked once per probe
 *
 * Browser kinds:
 *   selector    - value is a selector, visibility "visible" or "invisible"
 *   url         - value is "/regex/" or a literal substring of the current URL
 *   javascript  - value is an expression evaluated in the page, truthy = met
 * Context kinds (read the API response stored under contextKey):
 *   api-status     - response.status == expectedStatus
 *   api-json-path  - response.body at jsonPath matches expectedValue per matchType
 */
struct ConditionSpec {
    std::string type;
    std::string value;
    std::string selectorType = "css";
    std::string visibility = "visible";
    std::string contextKey = "apiResponse";
    std::string jsonPath;
    json expected;                      // expectedStatus / expectedValue
    std::string matchType = "equals";   // equals, contains, startsWith, endsWith, regex

    bool isApiCondition() const { return type.rfind("api-", 0) == 0; }

    /**
     * Build from a node-data object ({type, value, selectorType, visibility, ...}),
     * interpolating templated strings
     */
    static ConditionSpec fromJson(const json& j, const ExecutionContext& context);
};

/**
 * Outcome of a single probe
 */
struct ConditionResult {
    bool met = false;
    std::string observed;   // what was seen (visibility, url, result...)
    std::string details;    // one-line human description for logs and errors
};

class ConditionProbe {
public:
    /**
     * Evaluate the condition once. Never throws for probe failures: a driver
     * error yields {met=false, details="Error: ..."}.
     * Browser conditions need a driver, a null driver is reported as not met.
     */
    static ConditionResult check(const ConditionSpec& spec, BrowserDriver* driver, const ExecutionContext& context);

    /**
     * "/pattern/" is a regular expression, anything else a literal substring
     */
    static bool urlMatches(const std::string& pattern, const std::string& url);

    static bool matchValue(const json& actual, const json& expected, const std::string& matchType);

    static bool isTruthy(const json& value);

    /**
     * Dot/bracket path lookup inside a JSON document, null if missing
     */
    static json getNestedValue(const json& root, const std::string& path);

private:
    static ConditionResult checkBrowser(const ConditionSpec& spec, BrowserDriver& driver);
    static ConditionResult checkApi(const ConditionSpec& spec, const ExecutionContext& context);
};

} // namespace engine
} // namespace automflow
