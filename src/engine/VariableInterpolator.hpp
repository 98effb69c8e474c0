#pragma once

#include "engine/ExecutionContext.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace automflow {
namespace engine {

/**
 * Resolves ${data.path} and ${variables.path} references against a context
 *
 * Paths use dot or bracket notation: ${data.api1.body.items[0]},
 * ${data.headers['content-type']}. Unresolvable references are left untouched.
 */
class VariableInterpolator {
public:
    static std::string interpolateString(const std::string& text, const ExecutionContext& context);

    /**
     * Interpolate every string inside a JSON value (objects and arrays recurse)
     */
    static json interpolateJson(const json& value, const ExecutionContext& context);

    /**
     * Resolve a single "data.x.y" / "variables.x" path, nullopt if missing
     */
    static std::optional<json> resolvePath(const std::string& path, const ExecutionContext& context);

    /**
     * Read a numeric node setting that may be a number or a templated string
     * ("${variables.delay}"). Returns fallback when absent or not numeric.
     */
    static int64_t resolveInteger(const json& value, const ExecutionContext& context, int64_t fallback);

    static bool containsReference(const std::string& text);

    static std::vector<std::string> splitPath(const std::string& path);

private:
    static std::string stringify(const json& value);
};

} // namespace engine
} // namespace automflow
