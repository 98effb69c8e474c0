#include "nodes/FlowNodes.hpp"
#include "engine/VariableInterpolator.hpp"
#include "server/Logger.hpp"
#include "workflow/ReusableScope.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace automflow {
namespace nodes {

using engine::ExecutionContext;
using engine::VariableInterpolator;
using engine::json;
using workflow::Node;
namespace NodeTypes = workflow::NodeTypes;

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // anonymous namespace

// ============== Registration ==============

void registerFlowNodes(engine::NodeHandlerRegistry& registry) {
    registry.registerHandler(NodeTypes::Start, std::make_shared<StartNode>());
    registry.registerHandler(NodeTypes::Loop, std::make_shared<LoopNode>());
    registry.registerHandler(NodeTypes::SetVariable, std::make_shared<SetVariableNode>());
    registry.registerHandler(NodeTypes::IntValue, std::make_shared<ValueNode>(ValueNode::Kind::Int));
    registry.registerHandler(NodeTypes::StringValue, std::make_shared<ValueNode>(ValueNode::Kind::String));
    registry.registerHandler(NodeTypes::BooleanValue, std::make_shared<ValueNode>(ValueNode::Kind::Boolean));

    auto marker = std::make_shared<ReusableMarkerNode>();
    registry.registerHandler(NodeTypes::Reusable, marker);
    registry.registerHandler(NodeTypes::ReusableEnd, marker);
    registry.registerHandler(NodeTypes::RunReusable, std::make_shared<RunReusableNode>());
}

// ============== Flow nodes ==============

void StartNode::execute(const Node& /*node*/, ExecutionContext& /*context*/) {
}

void LoopNode::execute(const Node& node, ExecutionContext& context) {
    std::string mode = node.stringField("mode");
    if (mode.empty()) {
        throw std::runtime_error("Loop mode is required. Must be \"forEach\"");
    }
    if (mode != "forEach") {
        throw std::runtime_error("Unsupported loop mode: " + mode);
    }

    std::string arrayVariable = trim(node.stringField("arrayVariable"));
    if (arrayVariable.empty()) {
        throw std::runtime_error("Array variable is required for forEach mode");
    }

    json items = context.getData(arrayVariable);
    if (!items.is_array()) {
        throw std::runtime_error("Variable " + arrayVariable + " is not an array");
    }

    context.setVariable("index", 0);
    context.setVariable("item", items.empty() ? json(nullptr) : items.front());
    context.setData("_loopArray", items);
    context.setData("_loopMode", mode);
}

void SetVariableNode::execute(const Node& node, ExecutionContext& context) {
    std::string name = trim(node.stringField("variableName"));
    if (name.empty()) {
        throw std::runtime_error("Variable name is required for Set Variable node");
    }
    json value = node.data.contains("value")
        ? VariableInterpolator::interpolateJson(node.data["value"], context)
        : json(nullptr);
    context.setVariable(name, value);
}

// ============== Value nodes ==============

json ValueNode::coerce(Kind kind, const json& raw, const ExecutionContext& context) {
    json value = raw.is_string()
        ? json(VariableInterpolator::interpolateString(raw.get<std::string>(), context))
        : raw;

    switch (kind) {
        case Kind::Int:
            if (value.is_number_integer()) return value;
            if (value.is_number()) return static_cast<int64_t>(std::trunc(value.get<double>()));
            if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
            if (value.is_string()) {
                try {
                    return static_cast<int64_t>(std::stoll(trim(value.get<std::string>())));
                } catch (const std::exception&) {
                    return 0;
                }
            }
            return 0;

        case Kind::String:
            if (value.is_null()) return "";
            if (value.is_string()) return value;
            return value.dump();

        case Kind::Boolean:
            if (value.is_boolean()) return value;
            if (value.is_number()) return value.get<double>() != 0.0;
            if (value.is_string()) {
                std::string text = toLower(trim(value.get<std::string>()));
                return text == "true" || text == "1" || text == "yes";
            }
            return false;
    }
    return nullptr;
}

void ValueNode::execute(const Node& node, ExecutionContext& context) {
    json value = coerce(m_kind, node.data.value("value", json(nullptr)), context);

    context.setVariable(node.id, value);
    std::string name = trim(node.stringField("variableName"));
    if (!name.empty()) {
        context.setVariable(name, value);
    }
    context.setData("value", value);
}

// ============== Reusable nodes ==============

void ReusableMarkerNode::execute(const Node& /*node*/, ExecutionContext& /*context*/) {
}

void RunReusableNode::execute(const Node& node, ExecutionContext& context) {
    std::string contextName = trim(node.stringField("contextName"));
    if (contextName.empty()) {
        throw std::runtime_error("Context name is required for Run Reusable node");
    }

    auto* control = context.control();
    if (!control) {
        throw std::runtime_error("Run Reusable node requires a running executor");
    }

    const auto& workflow = control->getWorkflow();
    auto entryId = workflow::ReusableScope::findByContext(workflow, contextName);
    if (!entryId) {
        throw std::runtime_error("Reusable node with context name \"" + contextName + "\" not found");
    }

    auto subflow = workflow::ReusableScope::extract(workflow, *entryId);
    if (!subflow || subflow->empty()) {
        LOG_WARN("Reusable \"" + contextName + "\" has no connected nodes");
        return;
    }

    LOG_DEBUG("Running reusable \"" + contextName + "\" from " + node.id);
    control->runSubflow(*subflow);
}

} // namespace nodes
} // namespace automflow
