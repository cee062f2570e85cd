#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "QCalib/ir.hpp"

namespace qcalib {

/** Load a computation graph from a JSON file; throws on failure. */
ComputationGraph load_graph_from_json(const std::string& json_path);

/** Build a graph from an already parsed JSON document. */
ComputationGraph parse_graph_json(const nlohmann::json& root);

nlohmann::json graph_to_json(const ComputationGraph& graph);

/** Write graph as indented JSON; throws std::runtime_error if the file cannot be written. */
void save_graph_to_json(const ComputationGraph& graph, const std::string& json_path);

} // namespace qcalib
