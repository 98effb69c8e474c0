#include "engine/ConditionProbe.hpp"
#include "engine/VariableInterpolator.hpp"
#include <regex>

namespace automflow {
namespace engine {

namespace {

std::string truncateString(const std::string& s, size_t maxLen) {
    return s.size() <= maxLen ? s : s.substr(0, maxLen) + "...";
}

std::string formatValue(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

// =============================================================================
// ConditionSpec
// =============================================================================

ConditionSpec ConditionSpec::fromJson(const json& j, const ExecutionContext& context) {
    ConditionSpec spec;
    if (!j.is_object()) {
        return spec;
    }

    auto str = [&](const char* key, const std::string& fallback) {
        if (!j.contains(key) || !j[key].is_string()) return fallback;
        return VariableInterpolator::interpolateString(j[key].get<std::string>(), context);
    };

    spec.type = str("type", "");
    spec.value = str("value", "");
    spec.selectorType = str("selectorType", "css");
    spec.visibility = str("visibility", "visible");
    spec.contextKey = str("contextKey", "apiResponse");
    spec.jsonPath = str("jsonPath", "");
    spec.matchType = str("matchType", "equals");

    if (j.contains("expectedStatus")) {
        int64_t status = VariableInterpolator::resolveInteger(j["expectedStatus"], context, -1);
        if (status >= 0) spec.expected = status;
    } else if (j.contains("expectedValue")) {
        spec.expected = VariableInterpolator::interpolateJson(j["expectedValue"], context);
    }
    return spec;
}

// =============================================================================
// ConditionProbe
// =============================================================================

bool ConditionProbe::urlMatches(const std::string& pattern, const std::string& url) {
    if (pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/') {
        try {
            return std::regex_search(url, std::regex(pattern.substr(1, pattern.size() - 2)));
        } catch (const std::regex_error&) {
            return url.find(pattern) != std::string::npos;
        }
    }
    return url.find(pattern) != std::string::npos;
}

bool ConditionProbe::isTruthy(const json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    return true;  // objects and arrays
}

bool ConditionProbe::matchValue(const json& actual, const json& expected, const std::string& matchType) {
    if (matchType == "equals") {
        if (actual == expected) return true;
        return formatValue(actual) == formatValue(expected);
    }

    std::string a = formatValue(actual);
    std::string e = formatValue(expected);
    if (matchType == "contains") return a.find(e) != std::string::npos;
    if (matchType == "startsWith") return startsWith(a, e);
    if (matchType == "endsWith") return endsWith(a, e);
    if (matchType == "regex") {
        try {
            return std::regex_search(a, std::regex(e));
        } catch (const std::regex_error&) {
            return false;
        }
    }
    return false;
}

json ConditionProbe::getNestedValue(const json& root, const std::string& path) {
    json current = root;
    for (const auto& key : VariableInterpolator::splitPath(path)) {
        if (current.is_object() && current.contains(key)) {
            current = current[key];
        } else if (current.is_array()) {
            try {
                size_t index = std::stoul(key);
                if (index >= current.size()) return json();
                current = current[index];
            } catch (const std::exception&) {
                return json();
            }
        } else {
            return json();
        }
    }
    return current;
}

ConditionResult ConditionProbe::check(const ConditionSpec& spec, BrowserDriver* driver, const ExecutionContext& context) {
    if (spec.isApiCondition()) {
        return checkApi(spec, context);
    }
    if (!driver) {
        return {false, "no page", spec.type + " | no browser page available"};
    }
    try {
        return checkBrowser(spec, *driver);
    } catch (const std::exception& e) {
        return {false, "error", std::string("Error: ") + e.what()};
    }
}

ConditionResult ConditionProbe::checkBrowser(const ConditionSpec& spec, BrowserDriver& driver) {
    ConditionResult result;

    if (spec.type == "selector") {
        bool visible = driver.isVisible(spec.value, spec.selectorType);
        bool wantInvisible = spec.visibility == "invisible";
        result.met = wantInvisible ? !visible : visible;
        result.observed = visible ? "visible" : "invisible";
        result.details = "selector | selector: " + spec.value + " | expected: " + spec.visibility +
                         " | got: " + result.observed;
    } else if (spec.type == "url") {
        std::string url = driver.currentUrl();
        result.met = urlMatches(spec.value, url);
        result.observed = url;
        result.details = "url | pattern: " + spec.value + " | got: " + truncateString(url, 100);
    } else if (spec.type == "javascript") {
        json value = driver.evaluate(spec.value);
        result.met = isTruthy(value);
        result.observed = formatValue(value);
        result.details = "javascript | expression: " + truncateString(spec.value, 100) +
                         " | result: " + (result.met ? "true" : "false");
    } else {
        result.details = "Unknown condition type: " + spec.type;
    }
    return result;
}

ConditionResult ConditionProbe::checkApi(const ConditionSpec& spec, const ExecutionContext& context) {
    json response = context.getData(spec.contextKey);
    if (response.is_null()) {
        return {false, "missing", "API response not found"};
    }

    ConditionResult result;
    if (spec.type == "api-status") {
        if (spec.expected.is_null()) {
            return {false, "", "Expected status not specified"};
        }
        json actual = response.contains("status") ? response["status"] : json();
        result.met = matchValue(actual, spec.expected, "equals");
        result.observed = formatValue(actual);
        result.details = "api-status | expected: " + formatValue(spec.expected) + " | equals | got: " + result.observed;
    } else if (spec.type == "api-json-path") {
        if (spec.jsonPath.empty() || spec.expected.is_null()) {
            return {false, "", "JSON path or expected value not specified"};
        }
        json body = response.contains("body") ? response["body"] : json();
        json actual = getNestedValue(body, spec.jsonPath);
        result.observed = actual.is_null() ? "undefined" : formatValue(actual);
        result.met = !actual.is_null() && matchValue(actual, spec.expected, spec.matchType);
        result.details = "api-json-path | jsonPath: " + spec.jsonPath + " | expected: " +
                         formatValue(spec.expected) + " | " + spec.matchType + " | got: " + result.observed;
    } else {
        result.details = "Unknown condition type: " + spec.type;
    }
    return result;
}

} // namespace engine
} // namespace automflow
