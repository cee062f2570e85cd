#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "QCalib/tensor.hpp"

namespace qcalib {

struct Attribute {
    enum class Kind { FLOAT, INT, STRING, FLOATS, INTS };

    Kind kind{Kind::FLOAT};
    float f{0.0f};
    int64_t i{0};
    std::string s;
    std::vector<float> floats;
    std::vector<int64_t> ints;

    static Attribute fromFloat(float v);
    static Attribute fromInt(int64_t v);
    static Attribute fromString(std::string v);
    static Attribute fromFloats(std::vector<float> v);
    static Attribute fromInts(std::vector<int64_t> v);
};

struct OperatorNode {
    std::string name;
    std::string op_type;
    std::vector<std::string> inputs;   // "" marks an omitted optional input
    std::vector<std::string> outputs;
    std::map<std::string, Attribute> attributes;

    const Attribute* findAttribute(const std::string& key) const;
    float floatAttribute(const std::string& key, float fallback) const;
    int64_t intAttribute(const std::string& key, int64_t fallback) const;
    std::vector<int64_t> intsAttribute(const std::string& key, const std::vector<int64_t>& fallback = {}) const;
};

struct ValueInfo {
    std::string name;
    std::string elem_type{"float32"};
    Shape shape;   // -1 marks a symbolic dimension
};

/**
 * Computation graph: nodes in serialized order plus declared inputs,
 * outputs and constant initializers. Passed by const reference through
 * every stage; augmentation builds a new value.
 */
struct ComputationGraph {
    std::string name;
    std::vector<OperatorNode> nodes;
    std::vector<ValueInfo> inputs;
    std::vector<ValueInfo> outputs;
    std::map<std::string, Tensor> initializers;

    bool isGraphOutput(const std::string& tensor_name) const;
    bool isInitializer(const std::string& tensor_name) const { return initializers.count(tensor_name) > 0; }

    /** Graph inputs that are not backed by an initializer. */
    std::vector<const ValueInfo*> runtimeInputs() const;
};

/**
 * Consumer lookup built from tensor names. Indices refer to positions
 * in ComputationGraph::nodes.
 */
class ConsumerIndex {
public:
    explicit ConsumerIndex(const ComputationGraph& graph);

    /** Nodes reading tensor_name, in node order. Each node listed once. */
    const std::vector<int32_t>& consumersOf(const std::string& tensor_name) const;

    bool isGraphOutput(const std::string& tensor_name) const { return graph_outputs_.count(tensor_name) > 0; }

private:
    std::unordered_map<std::string, std::vector<int32_t>> consumers_;
    std::unordered_set<std::string> graph_outputs_;
    static const std::vector<int32_t> kNoConsumers;
};

} // namespace qcalib
