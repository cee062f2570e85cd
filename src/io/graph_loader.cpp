#include "QCalib/graph_loader.hpp"
#include "QCalib/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace qcalib {

using json = nlohmann::json;

static ValueInfo parse_value_info(const json& j) {
    if (!j.is_object() || !j.contains("name")) {
        throw std::runtime_error("Value info missing required field 'name'");
    }
    ValueInfo vi;
    vi.name = j.at("name").get<std::string>();
    vi.elem_type = j.value("elem_type", "float32");
    if (j.contains("shape")) {
        vi.shape = j.at("shape").get<Shape>();
    }
    return vi;
}

static Attribute parse_attribute(const std::string& key, const json& j) {
    if (j.is_number_integer()) return Attribute::fromInt(j.get<int64_t>());
    if (j.is_number()) return Attribute::fromFloat(j.get<float>());
    if (j.is_string()) return Attribute::fromString(j.get<std::string>());
    if (j.is_array()) {
        bool all_int = std::all_of(j.begin(), j.end(), [](const json& e){ return e.is_number_integer(); });
        if (all_int) return Attribute::fromInts(j.get<std::vector<int64_t>>());
        return Attribute::fromFloats(j.get<std::vector<float>>());
    }
    throw std::runtime_error("Unsupported value for attribute '" + key + "'");
}

static json attribute_to_json(const Attribute& attr) {
    switch (attr.kind) {
        case Attribute::Kind::FLOAT:  return attr.f;
        case Attribute::Kind::INT:    return attr.i;
        case Attribute::Kind::STRING: return attr.s;
        case Attribute::Kind::FLOATS: return attr.floats;
        case Attribute::Kind::INTS:   return attr.ints;
    }
    return nullptr;
}

static Tensor parse_initializer(const std::string& name, const json& j) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Initializer '" + name + "' missing 'data'");
    }
    Tensor t;
    t.shape = j.value("shape", Shape{});
    t.data = j.at("data").get<std::vector<float>>();
    t.validate("Initializer '" + name + "'");
    return t;
}

ComputationGraph parse_graph_json(const json& root) {
    // Accept {"graph": {...}} wrappers the same way as a bare graph
    const json& g = root.contains("graph") ? root.at("graph") : root;

    if (!g.contains("nodes") || !g.contains("outputs")) {
        throw std::runtime_error("Graph JSON is missing 'nodes' or 'outputs' fields");
    }
    if (!g.at("nodes").is_array()) {
        throw std::runtime_error("'nodes' must be a JSON array");
    }

    ComputationGraph graph;
    graph.name = g.value("name", "");

    for (const auto& in_j : g.value("inputs", json::array())) {
        graph.inputs.push_back(parse_value_info(in_j));
    }
    for (const auto& out_j : g.at("outputs")) {
        graph.outputs.push_back(parse_value_info(out_j));
    }
    if (g.contains("initializers")) {
        for (const auto& item : g.at("initializers").items()) {
            graph.initializers.emplace(item.key(), parse_initializer(item.key(), item.value()));
        }
    }

    for (const auto& node_j : g.at("nodes")) {
        OperatorNode node;
        node.op_type = node_j.at("op_type").get<std::string>();
        node.name = node_j.value("name", "");
        node.inputs = node_j.value("inputs", std::vector<std::string>{});
        node.outputs = node_j.value("outputs", std::vector<std::string>{});
        if (node_j.contains("attributes")) {
            for (const auto& attr_it : node_j.at("attributes").items()) {
                node.attributes[attr_it.key()] = parse_attribute(attr_it.key(), attr_it.value());
            }
        }
        graph.nodes.push_back(std::move(node));
    }

    return graph;
}

ComputationGraph load_graph_from_json(const std::string& json_path) {
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open graph JSON file: " + json_path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return parse_graph_json(json::parse(buffer.str()));
}

json graph_to_json(const ComputationGraph& graph) {
    auto value_info_json = [](const ValueInfo& vi) {
        return json{{"name", vi.name}, {"elem_type", vi.elem_type}, {"shape", vi.shape}};
    };

    json root;
    root["name"] = graph.name;
    root["inputs"] = json::array();
    for (const auto& vi : graph.inputs) root["inputs"].push_back(value_info_json(vi));
    root["outputs"] = json::array();
    for (const auto& vi : graph.outputs) root["outputs"].push_back(value_info_json(vi));

    json inits = json::object();
    for (const auto& kv : graph.initializers) {
        inits[kv.first] = json{{"shape", kv.second.shape}, {"data", kv.second.data}};
    }
    root["initializers"] = inits;

    root["nodes"] = json::array();
    for (const auto& node : graph.nodes) {
        json attrs = json::object();
        for (const auto& kv : node.attributes) attrs[kv.first] = attribute_to_json(kv.second);
        root["nodes"].push_back(json{
            {"name", node.name},
            {"op_type", node.op_type},
            {"inputs", node.inputs},
            {"outputs", node.outputs},
            {"attributes", attrs}
        });
    }
    return root;
}

void save_graph_to_json(const ComputationGraph& graph, const std::string& json_path) {
    std::ofstream ofs(json_path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open graph JSON file for writing: " + json_path);
    }
    ofs << graph_to_json(graph).dump(2) << "\n";
    if (!ofs) {
        throw std::runtime_error("Failed to write graph JSON file: " + json_path);
    }
}

} // namespace qcalib
