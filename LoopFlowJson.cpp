// LoopFlowJson.cpp
//
// Flow documents list "nodes" (id/type/parameters) and "connections"
// (fromNode/fromPort/toNode/toPort). Ports come from the node kind, not the
// document.
#include "LoopFlowJson.hpp"
#include "LoopFlowErrors.hpp"
#include "LoopFlowLog.hpp"
#include <cstdint>
#include <fmt/core.h>
#include <fstream>
#include <limits>

namespace LoopFlow {

namespace {

const nlohmann::json& requireField(const nlohmann::json& obj, const char* key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw StructuralError(fmt::format("{}: missing field \"{}\"", where, key));
    }
    return obj.at(key);
}

std::string requireString(const nlohmann::json& obj, const char* key, const std::string& where) {
    const auto& v = requireField(obj, key, where);
    if (!v.is_string()) {
        throw StructuralError(fmt::format("{}: field \"{}\" must be a string", where, key));
    }
    return v.get<std::string>();
}

// JSON integers are int64/uint64; true only when v fits in an int
bool intValue(const nlohmann::json& v, int& out) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(u);
        return true;
    }
    const auto i = v.get<std::int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(i);
    return true;
}

Edge connectionFromJson(const nlohmann::json& c, size_t index) {
    const std::string where = fmt::format("connections[{}]", index);
    Edge edge;
    if (c.is_object() && c.contains("id")) {
        edge.id = requireString(c, "id", where);
    } else {
        edge.id = fmt::format("c{}", index);
    }
    edge.fromNodeId = requireString(c, "fromNode", where);
    edge.fromPortId = requireString(c, "fromPort", where);
    edge.toNodeId = requireString(c, "toNode", where);
    edge.toPortId = requireString(c, "toPort", where);
    return edge;
}

} // namespace

Record recordFromJson(const nlohmann::json& json, const std::string& where) {
    if (!json.is_object()) {
        throw StructuralError(fmt::format("{}: expected an object", where));
    }
    Record record;
    for (const auto& item : json.items()) {
        const auto& v = item.value();
        if (v.is_string()) {
            record[item.key()] = v.get<std::string>();
        } else if (v.is_boolean()) {
            record[item.key()] = v.get<bool>() ? 1 : 0;
        } else if (v.is_number_integer()) {
            int i = 0;
            if (intValue(v, i)) {
                record[item.key()] = i;
            } else {
                record[item.key()] = v.get<double>(); // wider than int
            }
        } else if (v.is_number_float()) {
            record[item.key()] = v.get<double>();
        } else {
            throw StructuralError(fmt::format("{}: field \"{}\" must be a string, number or boolean", where, item.key()));
        }
    }
    return record;
}

nlohmann::json valueToJson(const Value& v) {
    if (std::holds_alternative<int>(v)) return std::get<int>(v);
    if (std::holds_alternative<float>(v)) return std::get<float>(v);
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    return std::get<std::string>(v);
}

nlohmann::json recordToJson(const Record& record) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, v] : record) out[key] = valueToJson(v);
    return out;
}

StrategyConfig strategyFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw StructuralError("strategy: expected an object");
    }
    StrategyConfig config;
    if (json.contains("kind")) {
        config.kind = parseStrategyKind(requireString(json, "kind", "strategy"));
    }
    if (json.contains("maxIterations")) {
        const auto& v = json.at("maxIterations");
        if (!v.is_number_integer()) throw StructuralError("strategy: field \"maxIterations\" must be an integer");
        if (!intValue(v, config.maxIterations)) {
            throw StructuralError(fmt::format("strategy: field \"maxIterations\" is out of range ({})", v.dump()));
        }
    }
    if (json.contains("threshold")) {
        const auto& v = json.at("threshold");
        if (!v.is_number()) throw StructuralError("strategy: field \"threshold\" must be a number");
        config.threshold = v.get<double>();
    }
    return config;
}

FlowDescription loadFlow(const nlohmann::json& json, const NodeRegistry& registry) {
    if (!json.is_object()) {
        throw StructuralError("flow: expected a JSON object");
    }
    FlowDescription flow;
    Graph graph = createGraph();

    const auto& nodes = requireField(json, "nodes", "flow");
    if (!nodes.is_array()) throw StructuralError("flow: field \"nodes\" must be an array");
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& nodeJson = nodes[i];
        const std::string where = fmt::format("nodes[{}]", i);
        const std::string id = requireString(nodeJson, "id", where);
        const std::string type = requireString(nodeJson, "type", where);
        Record params;
        if (nodeJson.contains("parameters")) {
            params = recordFromJson(nodeJson.at("parameters"), where + ".parameters");
        }
        graph = addNode(std::move(graph), registry.create(type, id, params));
    }

    if (json.contains("connections")) {
        const auto& connections = json.at("connections");
        if (!connections.is_array()) throw StructuralError("flow: field \"connections\" must be an array");
        for (size_t i = 0; i < connections.size(); ++i) {
            graph = addEdge(std::move(graph), connectionFromJson(connections[i], i));
        }
    }

    validateGraph(graph);

    if (json.contains("strategy")) {
        flow.strategy = strategyFromJson(json.at("strategy"));
    }

    if (json.contains("initialState")) {
        const auto& init = json.at("initialState");
        if (!init.is_object()) throw StructuralError("flow: field \"initialState\" must be an object");
        for (const auto& item : init.items()) {
            if (!graph.contains(item.key())) {
                throw StructuralError(fmt::format("initialState: unknown node \"{}\"", item.key()));
            }
            flow.initialState[item.key()] = recordFromJson(item.value(), "initialState." + item.key());
        }
    }

    logDebug("loaded flow: nodes={} connections={} strategy={}", graph.size(), graph.edges().size(),
             strategyKindName(flow.strategy.kind));
    flow.graph = std::move(graph);
    return flow;
}

FlowDescription loadFlowFile(const std::string& path, const NodeRegistry& registry) {
    std::ifstream f(path);
    if (!f.good()) {
        throw StructuralError(fmt::format("Could not open flow file: {}", path));
    }
    nlohmann::json json;
    try {
        f >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw StructuralError(fmt::format("Could not parse flow file {}: {}", path, e.what()));
    }
    return loadFlow(json, registry);
}

nlohmann::json resultToJson(const ExecutionResult& result) {
    nlohmann::json out;
    out["iterations"] = result.iterations;
    nlohmann::json outputs = nlohmann::json::object();
    for (const auto& [nodeId, record] : result.outputs) outputs[nodeId] = recordToJson(record);
    nlohmann::json state = nlohmann::json::object();
    for (const auto& [nodeId, record] : result.state) state[nodeId] = recordToJson(record);
    out["outputs"] = std::move(outputs);
    out["state"] = std::move(state);
    out["stats"] = {
        {"nodesEvaluated", result.stats.nodesEvaluated},
        {"forwardEdgesResolved", result.stats.forwardEdgesResolved},
        {"backEdgesResolved", result.stats.backEdgesResolved},
        {"evalTimeNs", result.stats.evalTimeNs},
    };
    return out;
}

} // namespace LoopFlow
