#include "QCalib/ir.hpp"

#include <algorithm>

namespace qcalib {

Attribute Attribute::fromFloat(float v) {
    Attribute a;
    a.kind = Kind::FLOAT;
    a.f = v;
    return a;
}

Attribute Attribute::fromInt(int64_t v) {
    Attribute a;
    a.kind = Kind::INT;
    a.i = v;
    return a;
}

Attribute Attribute::fromString(std::string v) {
    Attribute a;
    a.kind = Kind::STRING;
    a.s = std::move(v);
    return a;
}

Attribute Attribute::fromFloats(std::vector<float> v) {
    Attribute a;
    a.kind = Kind::FLOATS;
    a.floats = std::move(v);
    return a;
}

Attribute Attribute::fromInts(std::vector<int64_t> v) {
    Attribute a;
    a.kind = Kind::INTS;
    a.ints = std::move(v);
    return a;
}

const Attribute* OperatorNode::findAttribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? &it->second : nullptr;
}

float OperatorNode::floatAttribute(const std::string& key, float fallback) const {
    const Attribute* attr = findAttribute(key);
    if (!attr) return fallback;
    if (attr->kind == Attribute::Kind::INT) return static_cast<float>(attr->i);
    return attr->kind == Attribute::Kind::FLOAT ? attr->f : fallback;
}

int64_t OperatorNode::intAttribute(const std::string& key, int64_t fallback) const {
    const Attribute* attr = findAttribute(key);
    return (attr && attr->kind == Attribute::Kind::INT) ? attr->i : fallback;
}

std::vector<int64_t> OperatorNode::intsAttribute(const std::string& key, const std::vector<int64_t>& fallback) const {
    const Attribute* attr = findAttribute(key);
    return (attr && attr->kind == Attribute::Kind::INTS) ? attr->ints : fallback;
}

bool ComputationGraph::isGraphOutput(const std::string& tensor_name) const {
    return std::any_of(outputs.begin(), outputs.end(),
                       [&](const ValueInfo& v){ return v.name == tensor_name; });
}

std::vector<const ValueInfo*> ComputationGraph::runtimeInputs() const {
    std::vector<const ValueInfo*> result;
    for (const auto& in : inputs) {
        if (!isInitializer(in.name)) result.push_back(&in);
    }
    return result;
}

const std::vector<int32_t> ConsumerIndex::kNoConsumers;

ConsumerIndex::ConsumerIndex(const ComputationGraph& graph) {
    for (int32_t idx = 0; idx < static_cast<int32_t>(graph.nodes.size()); ++idx) {
        const auto& node = graph.nodes[idx];
        for (const auto& in : node.inputs) {
            if (in.empty()) continue;
            auto& list = consumers_[in];
            // a node reading the same tensor twice (e.g. Mul(x, x)) counts once
            if (list.empty() || list.back() != idx) list.push_back(idx);
        }
    }
    for (const auto& out : graph.outputs) {
        graph_outputs_.insert(out.name);
    }
}

const std::vector<int32_t>& ConsumerIndex::consumersOf(const std::string& tensor_name) const {
    auto it = consumers_.find(tensor_name);
    return it != consumers_.end() ? it->second : kNoConsumers;
}

} // namespace qcalib
