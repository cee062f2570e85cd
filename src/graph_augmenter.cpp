#include "QCalib/graph_augmenter.hpp"
#include "QCalib/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace qcalib {

const std::vector<std::string>& default_candidate_op_types() {
    // extend when more operators get quantized kernels
    static const std::vector<std::string> kCandidates = {"Conv", "MatMul"};
    return kCandidates;
}

namespace {

class NameRegistry {
public:
    explicit NameRegistry(std::unordered_set<std::string> used) : used_(std::move(used)) {}

    /** base if unused, else base_1, base_2, ... */
    std::string claim(const std::string& base) {
        std::string candidate = base;
        for (int suffix = 1; used_.count(candidate); ++suffix) {
            candidate = base + "_" + std::to_string(suffix);
        }
        used_.insert(candidate);
        return candidate;
    }

private:
    std::unordered_set<std::string> used_;
};

std::unordered_set<std::string> tensor_names(const ComputationGraph& graph) {
    std::unordered_set<std::string> names;
    for (const auto& node : graph.nodes) {
        names.insert(node.inputs.begin(), node.inputs.end());
        names.insert(node.outputs.begin(), node.outputs.end());
    }
    for (const auto& vi : graph.inputs) names.insert(vi.name);
    for (const auto& vi : graph.outputs) names.insert(vi.name);
    for (const auto& kv : graph.initializers) names.insert(kv.first);
    return names;
}

std::unordered_set<std::string> node_names(const ComputationGraph& graph) {
    std::unordered_set<std::string> names;
    for (const auto& node : graph.nodes) {
        if (!node.name.empty()) names.insert(node.name);
    }
    return names;
}

OperatorNode make_reduce_node(const std::string& op_type, const std::string& name,
                              const std::string& input, const std::string& output) {
    OperatorNode node;
    node.op_type = op_type;
    node.name = name;
    node.inputs = {input};
    node.outputs = {output};
    node.attributes["keepdims"] = Attribute::fromInt(0);
    return node;
}

ValueInfo scalar_output(const std::string& name) {
    ValueInfo vi;
    vi.name = name;
    vi.elem_type = "float32";
    return vi;
}

} // namespace

AugmentedGraph augment_graph(const ComputationGraph& graph, const AugmentOptions& options) {
    AugmentedGraph result;
    result.graph = graph;
    result.manifest.original_output_count = graph.outputs.size();

    const std::unordered_set<std::string> candidates(options.candidate_op_types.begin(),
                                                     options.candidate_op_types.end());
    NameRegistry tensors(tensor_names(graph));
    NameRegistry nodes(node_names(graph));

    std::vector<OperatorNode> added_nodes;
    std::vector<ValueInfo> added_outputs;

    for (const auto& node : graph.nodes) {
        if (!candidates.count(node.op_type)) continue;
        if (node.outputs.empty() || node.outputs[0].empty()) {
            QCALIB_WARN("Candidate node '{}' ({}) has no output; skipped", node.name, node.op_type);
            continue;
        }
        if (node.outputs.size() > 1) {
            QCALIB_WARN("Candidate node '{}' has {} outputs; only '{}' is probed",
                        node.name, node.outputs.size(), node.outputs[0]);
        }

        const std::string& tensor = node.outputs[0];
        const std::string owner = node.name.empty() ? tensor : node.name;

        ProbePair probe;
        probe.owner_node = node.name;
        probe.owner_output = tensor;

        probe.min_output = tensors.claim(tensor + "_ReduceMin");
        added_nodes.push_back(make_reduce_node("ReduceMin", nodes.claim(owner + "_ReduceMin"), tensor, probe.min_output));
        added_outputs.push_back(scalar_output(probe.min_output));

        probe.max_output = tensors.claim(tensor + "_ReduceMax");
        added_nodes.push_back(make_reduce_node("ReduceMax", nodes.claim(owner + "_ReduceMax"), tensor, probe.max_output));
        added_outputs.push_back(scalar_output(probe.max_output));

        result.manifest.probes.push_back(std::move(probe));
    }

    result.graph.nodes.insert(result.graph.nodes.end(), added_nodes.begin(), added_nodes.end());
    result.graph.outputs.insert(result.graph.outputs.end(), added_outputs.begin(), added_outputs.end());

    QCALIB_INFO("Augmented graph '{}': {} probe pair(s) on {} node(s)",
                graph.name, result.manifest.probes.size(), graph.nodes.size());
    return result;
}

} // namespace qcalib
