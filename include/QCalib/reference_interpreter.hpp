#pragma once

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "QCalib/inference_backend.hpp"

namespace qcalib {

/**
 * Straightforward float32 interpreter for single-input graphs. Nodes run
 * in list order, so the graph must be topologically sorted.
 *
 * Supported: Conv, MatMul, Gemm, Add, Mul, Relu, Clip, Identity, Flatten,
 * Reshape, ReduceMin, ReduceMax.
 */
class ReferenceInterpreter : public InferenceBackend {
public:
    using Environment = std::unordered_map<std::string, Tensor>;
    using Kernel = std::function<std::vector<Tensor>(const OperatorNode&, const std::vector<const Tensor*>&)>;

    ReferenceInterpreter();

    std::vector<NamedTensor> run(const ComputationGraph& graph, const Tensor& input) override;
    std::string name() const override { return "reference"; }

    bool supports(const std::string& op_type) const { return kernels_.count(op_type) > 0; }

    /** Register or replace the kernel for an op type. */
    void registerKernel(const std::string& op_type, Kernel kernel);

private:
    std::map<std::string, Kernel> kernels_;

    void registerBuiltinKernels();
};

} // namespace qcalib
