#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "QCalib/ir.hpp"

namespace qcalib {

/** Quantization candidates probed when nothing else is configured. */
const std::vector<std::string>& default_candidate_op_types();

struct AugmentOptions {
    std::vector<std::string> candidate_op_types = default_candidate_op_types();
};

/** One ReduceMin/ReduceMax pair attached to a candidate node. */
struct ProbePair {
    std::string owner_node;
    std::string owner_output;   // key of PerNodeStatistics and of the parameter map
    std::string min_output;
    std::string max_output;
};

struct ProbeManifest {
    size_t original_output_count{0};
    std::vector<ProbePair> probes;   // traversal order of the owners
};

struct AugmentedGraph {
    ComputationGraph graph;
    ProbeManifest manifest;
};

/**
 * Append a ReduceMin and a ReduceMax node (keepdims=0) on the first
 * output of every candidate node, and expose both scalars as graph
 * outputs, min first. Existing nodes and outputs are not touched; the
 * input graph is left as is.
 */
AugmentedGraph augment_graph(const ComputationGraph& graph, const AugmentOptions& options = AugmentOptions());

} // namespace qcalib
