#pragma once

#include "engine/NodeHandler.hpp"
#include "engine/NodeHandlerRegistry.hpp"

namespace automflow {
namespace nodes {

/**
 * Register start, loop, setVariable, the value nodes and the reusable nodes
 */
void registerFlowNodes(engine::NodeHandlerRegistry& registry);

/** start - marks the beginning of the workflow, no-op */
class StartNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "flow"; }
};

/**
 * loop - forEach over the array stored in data[arrayVariable]
 *
 * Sets variables index=0 / item=first element and hands the array to the
 * executor through data "_loopArray". The executor then runs the loop body
 * once per element.
 */
class LoopNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "flow"; }
};

/** setVariable - binds data.value (interpolated) to variables[data.variableName] */
class SetVariableNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "flow"; }
};

/**
 * intValue / stringValue / booleanValue
 *
 * Publish data.value under the node id (read by property-input edges), under
 * data.variableName when set, and as data "value".
 */
class ValueNode : public engine::NodeHandler {
public:
    enum class Kind { Int, String, Boolean };

    explicit ValueNode(Kind kind) : m_kind(kind) {}

    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "value"; }

    /**
     * Coerce a raw data.value to the node kind
     *   Int:     numbers are truncated, strings parsed, anything else 0
     *   Boolean: true, non-zero, "true" / "1" / "yes"
     */
    static engine::json coerce(Kind kind, const engine::json& raw, const engine::ExecutionContext& context);

private:
    Kind m_kind;
};

/** reusable.reusable / reusable.end - scope markers, never executed in the main flow */
class ReusableMarkerNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "reusable"; }
};

/**
 * reusable.runReusable - runs the reusable scope whose entry has the same
 * data.contextName, sharing the caller's context
 */
class RunReusableNode : public engine::NodeHandler {
public:
    void execute(const workflow::Node& node, engine::ExecutionContext& context) override;
    std::string category() const override { return "reusable"; }
};

} // namespace nodes
} // namespace automflow
