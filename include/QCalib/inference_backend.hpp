#pragma once

#include <string>
#include <vector>

#include "QCalib/ir.hpp"
#include "QCalib/tensor.hpp"

namespace qcalib {

/**
 * Execution capability used during calibration. run() must return the
 * graph's declared outputs in declaration order.
 */
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    /** Called once per graph before the first run(); sessions are built here. */
    virtual void prepare(const ComputationGraph& graph) { (void)graph; }

    virtual std::vector<NamedTensor> run(const ComputationGraph& graph, const Tensor& input) = 0;

    virtual std::string name() const = 0;
};

} // namespace qcalib
