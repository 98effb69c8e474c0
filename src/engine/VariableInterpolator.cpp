#include "engine/VariableInterpolator.hpp"
#include <cmath>
#include <cstdlib>

namespace automflow {
namespace engine {

std::vector<std::string> VariableInterpolator::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    bool inBrackets = false;
    char quote = 0;

    for (char c : path) {
        if (inBrackets) {
            if ((c == '\'' || c == '"') && (quote == 0 || quote == c)) {
                quote = quote ? 0 : c;
            } else if (c == ']' && quote == 0) {
                parts.push_back(current);
                current.clear();
                inBrackets = false;
            } else {
                current += c;
            }
        } else if (c == '[') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
            inBrackets = true;
        } else if (c == '.') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::optional<json> VariableInterpolator::resolvePath(const std::string& path, const ExecutionContext& context) {
    auto parts = splitPath(path);
    if (parts.size() < 2) {
        return std::nullopt;
    }

    json current;
    if (parts[0] == "data") {
        current = context.getAllData();
    } else if (parts[0] == "variables") {
        current = context.getAllVariables();
    } else {
        return std::nullopt;
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        const auto& key = parts[i];
        if (current.is_object()) {
            auto it = current.find(key);
            if (it == current.end()) return std::nullopt;
            current = *it;
        } else if (current.is_array()) {
            char* end = nullptr;
            unsigned long index = std::strtoul(key.c_str(), &end, 10);
            if (key.empty() || *end != '\0' || index >= current.size()) return std::nullopt;
            current = current[index];
        } else {
            return std::nullopt;
        }
    }
    return current;
}

std::string VariableInterpolator::stringify(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::floor(d) == d && std::abs(d) < 1e15) {
            return std::to_string(static_cast<int64_t>(d));
        }
    }
    return value.dump();
}

bool VariableInterpolator::containsReference(const std::string& text) {
    return text.find("${data.") != std::string::npos || text.find("${variables.") != std::string::npos;
}

std::string VariableInterpolator::interpolateString(const std::string& text, const ExecutionContext& context) {
    if (text.find("${") == std::string::npos) {
        return text;
    }

    std::string result;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("${", pos);
        if (open == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        size_t close = text.find('}', open + 2);
        if (close == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }

        result.append(text, pos, open - pos);
        std::string path = text.substr(open + 2, close - open - 2);
        auto value = resolvePath(path, context);
        if (value) {
            result += stringify(*value);
        } else {
            result.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

json VariableInterpolator::interpolateJson(const json& value, const ExecutionContext& context) {
    if (value.is_string()) {
        return interpolateString(value.get<std::string>(), context);
    }
    if (value.is_object()) {
        json result = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            result[it.key()] = interpolateJson(it.value(), context);
        }
        return result;
    }
    if (value.is_array()) {
        json result = json::array();
        for (const auto& item : value) {
            result.push_back(interpolateJson(item, context));
        }
        return result;
    }
    return value;
}

int64_t VariableInterpolator::resolveInteger(const json& value, const ExecutionContext& context, int64_t fallback) {
    if (value.is_number()) {
        return static_cast<int64_t>(value.get<double>());
    }
    if (!value.is_string()) {
        return fallback;
    }

    std::string text = interpolateString(value.get<std::string>(), context);
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (text.empty() || end == text.c_str()) {
        return fallback;
    }
    return static_cast<int64_t>(parsed);
}

} // namespace engine
} // namespace automflow
