#include "QCalib/reference_interpreter.hpp"
#include "QCalib/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace qcalib {

namespace {

std::vector<int64_t> contiguous_strides(const Shape& shape) {
    std::vector<int64_t> strides(shape.size(), 1);
    for (int64_t i = static_cast<int64_t>(shape.size()) - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

Shape broadcast_shapes(const Shape& a, const Shape& b, const std::string& op) {
    const size_t rank = std::max(a.size(), b.size());
    Shape out(rank, 1);
    for (size_t i = 0; i < rank; ++i) {
        const int64_t da = i < rank - a.size() ? 1 : a[i - (rank - a.size())];
        const int64_t db = i < rank - b.size() ? 1 : b[i - (rank - b.size())];
        if (da != db && da != 1 && db != 1) {
            throw ExecutionFailure(op + ": shapes " + shape_to_string(a) + " and " +
                                   shape_to_string(b) + " are not broadcastable");
        }
        out[i] = std::max(da, db);
    }
    return out;
}

/** Maps a linear index of the broadcast output to an offset into one input. */
class BroadcastIndexer {
public:
    BroadcastIndexer(const Shape& in_shape, const Shape& out_shape)
        : out_strides_(contiguous_strides(out_shape)), in_strides_(out_shape.size(), 0) {
        const auto in_contig = contiguous_strides(in_shape);
        const size_t lead = out_shape.size() - in_shape.size();
        for (size_t i = 0; i < in_shape.size(); ++i) {
            in_strides_[lead + i] = in_shape[i] == 1 ? 0 : in_contig[i];
        }
    }

    int64_t offset(int64_t linear) const {
        int64_t off = 0;
        for (size_t d = 0; d < out_strides_.size(); ++d) {
            const int64_t idx = linear / out_strides_[d];
            linear %= out_strides_[d];
            off += idx * in_strides_[d];
        }
        return off;
    }

private:
    std::vector<int64_t> out_strides_;
    std::vector<int64_t> in_strides_;
};

const Tensor& require_input(const OperatorNode& node, const std::vector<const Tensor*>& inputs, size_t i) {
    if (i >= inputs.size() || inputs[i] == nullptr) {
        throw ExecutionFailure(node.op_type + " node '" + node.name + "' is missing input " + std::to_string(i));
    }
    return *inputs[i];
}

const Tensor* optional_input(const std::vector<const Tensor*>& inputs, size_t i) {
    return i < inputs.size() ? inputs[i] : nullptr;
}

int64_t normalize_axis(int64_t axis, int64_t rank, const OperatorNode& node) {
    const int64_t normalized = axis < 0 ? axis + rank : axis;
    if (normalized < 0 || normalized >= rank) {
        throw ExecutionFailure(node.op_type + " node '" + node.name + "': axis " + std::to_string(axis) +
                               " out of range for rank " + std::to_string(rank));
    }
    return normalized;
}

template <typename Fn>
std::vector<Tensor> elementwise_binary(const OperatorNode& node, const std::vector<const Tensor*>& inputs, Fn fn) {
    const Tensor& a = require_input(node, inputs, 0);
    const Tensor& b = require_input(node, inputs, 1);
    const Shape out_shape = broadcast_shapes(a.shape, b.shape, node.op_type);
    Tensor out = Tensor::zeros(out_shape);
    BroadcastIndexer ia(a.shape, out_shape), ib(b.shape, out_shape);
    for (int64_t i = 0; i < out.numel(); ++i) {
        out.data[i] = fn(a.data[ia.offset(i)], b.data[ib.offset(i)]);
    }
    return {std::move(out)};
}

std::vector<Tensor> identity_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    return {require_input(node, inputs, 0)};
}

std::vector<Tensor> relu_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    Tensor out = require_input(node, inputs, 0);
    for (auto& v : out.data) v = std::max(v, 0.0f);
    return {std::move(out)};
}

std::vector<Tensor> clip_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    Tensor out = require_input(node, inputs, 0);
    float lo = node.floatAttribute("min", std::numeric_limits<float>::lowest());
    float hi = node.floatAttribute("max", std::numeric_limits<float>::max());
    if (const Tensor* t = optional_input(inputs, 1)) lo = t->data.at(0);
    if (const Tensor* t = optional_input(inputs, 2)) hi = t->data.at(0);
    for (auto& v : out.data) v = std::min(std::max(v, lo), hi);
    return {std::move(out)};
}

std::vector<Tensor> matmul_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    Tensor a = require_input(node, inputs, 0);
    Tensor b = require_input(node, inputs, 1);
    const bool a_vec = a.rank() == 1;
    const bool b_vec = b.rank() == 1;
    if (a_vec) a.shape.insert(a.shape.begin(), 1);
    if (b_vec) b.shape.push_back(1);
    if (a.rank() < 2 || b.rank() < 2) {
        throw ExecutionFailure("MatMul node '" + node.name + "' requires operands of rank >= 1");
    }

    const int64_t m = a.shape[a.rank() - 2];
    const int64_t k = a.shape[a.rank() - 1];
    const int64_t n = b.shape[b.rank() - 1];
    if (b.shape[b.rank() - 2] != k) {
        throw ExecutionFailure("MatMul node '" + node.name + "': inner dimensions differ, " +
                               shape_to_string(a.shape) + " x " + shape_to_string(b.shape));
    }

    const Shape a_batch(a.shape.begin(), a.shape.end() - 2);
    const Shape b_batch(b.shape.begin(), b.shape.end() - 2);
    const Shape batch = broadcast_shapes(a_batch, b_batch, "MatMul");
    const int64_t batch_count = element_count(batch);
    BroadcastIndexer ia(a_batch, batch), ib(b_batch, batch);

    Shape out_shape = batch;
    out_shape.push_back(m);
    out_shape.push_back(n);
    Tensor out = Tensor::zeros(out_shape);

    for (int64_t bi = 0; bi < batch_count; ++bi) {
        const float* pa = a.data.data() + ia.offset(bi) * m * k;
        const float* pb = b.data.data() + ib.offset(bi) * k * n;
        float* po = out.data.data() + bi * m * n;
        for (int64_t i = 0; i < m; ++i) {
            for (int64_t p = 0; p < k; ++p) {
                const float av = pa[i * k + p];
                for (int64_t j = 0; j < n; ++j) {
                    po[i * n + j] += av * pb[p * n + j];
                }
            }
        }
    }

    if (a_vec) out.shape.erase(out.shape.end() - 2);
    if (b_vec) out.shape.pop_back();
    return {std::move(out)};
}

std::vector<Tensor> gemm_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    const Tensor& a = require_input(node, inputs, 0);
    const Tensor& b = require_input(node, inputs, 1);
    if (a.rank() != 2 || b.rank() != 2) {
        throw ExecutionFailure("Gemm node '" + node.name + "' requires 2-D operands");
    }
    const bool trans_a = node.intAttribute("transA", 0) != 0;
    const bool trans_b = node.intAttribute("transB", 0) != 0;
    const float alpha = node.floatAttribute("alpha", 1.0f);
    const float beta = node.floatAttribute("beta", 1.0f);

    const int64_t m = trans_a ? a.shape[1] : a.shape[0];
    const int64_t k = trans_a ? a.shape[0] : a.shape[1];
    const int64_t kb = trans_b ? b.shape[1] : b.shape[0];
    const int64_t n = trans_b ? b.shape[0] : b.shape[1];
    if (k != kb) {
        throw ExecutionFailure("Gemm node '" + node.name + "': inner dimensions differ");
    }

    Tensor out = Tensor::zeros({m, n});
    for (int64_t i = 0; i < m; ++i) {
        for (int64_t j = 0; j < n; ++j) {
            float acc = 0.0f;
            for (int64_t p = 0; p < k; ++p) {
                const float av = trans_a ? a.data[p * m + i] : a.data[i * k + p];
                const float bv = trans_b ? b.data[j * k + p] : b.data[p * n + j];
                acc += av * bv;
            }
            out.data[i * n + j] = alpha * acc;
        }
    }
    if (const Tensor* c = optional_input(inputs, 2)) {
        broadcast_shapes(c->shape, out.shape, "Gemm");
        BroadcastIndexer ic(c->shape, out.shape);
        for (int64_t i = 0; i < out.numel(); ++i) out.data[i] += beta * c->data[ic.offset(i)];
    }
    return {std::move(out)};
}

std::vector<Tensor> conv_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    const Tensor& x = require_input(node, inputs, 0);
    const Tensor& w = require_input(node, inputs, 1);
    const Tensor* bias = optional_input(inputs, 2);
    if (x.rank() != 4 || w.rank() != 4) {
        throw ExecutionFailure("Conv node '" + node.name + "': only 2-D convolution (NCHW) is supported");
    }
    const std::string auto_pad = node.findAttribute("auto_pad") ? node.findAttribute("auto_pad")->s : "NOTSET";
    if (auto_pad != "NOTSET" && auto_pad != "VALID") {
        throw ExecutionFailure("Conv node '" + node.name + "': auto_pad " + auto_pad + " is not supported");
    }

    const int64_t batch = x.shape[0], channels = x.shape[1], height = x.shape[2], width = x.shape[3];
    const int64_t out_channels = w.shape[0], group_channels = w.shape[1], kh = w.shape[2], kw = w.shape[3];
    const int64_t group = node.intAttribute("group", 1);
    const auto strides = node.intsAttribute("strides", {1, 1});
    const auto pads = node.intsAttribute("pads", {0, 0, 0, 0});
    const auto dilations = node.intsAttribute("dilations", {1, 1});
    if (group <= 0 || channels != group_channels * group || out_channels % group != 0 ||
        strides.size() != 2 || pads.size() != 4 || dilations.size() != 2) {
        throw ExecutionFailure("Conv node '" + node.name + "': inconsistent weights " + shape_to_string(w.shape) +
                               " for input " + shape_to_string(x.shape));
    }

    const int64_t out_h = (height + pads[0] + pads[2] - dilations[0] * (kh - 1) - 1) / strides[0] + 1;
    const int64_t out_w = (width + pads[1] + pads[3] - dilations[1] * (kw - 1) - 1) / strides[1] + 1;
    if (out_h <= 0 || out_w <= 0) {
        throw ExecutionFailure("Conv node '" + node.name + "': kernel larger than padded input");
    }

    Tensor out = Tensor::zeros({batch, out_channels, out_h, out_w});
    const int64_t oc_per_group = out_channels / group;
    for (int64_t nb = 0; nb < batch; ++nb) {
        for (int64_t oc = 0; oc < out_channels; ++oc) {
            const int64_t g = oc / oc_per_group;
            const float b0 = bias ? bias->data.at(static_cast<size_t>(oc)) : 0.0f;
            for (int64_t oy = 0; oy < out_h; ++oy) {
                for (int64_t ox = 0; ox < out_w; ++ox) {
                    float acc = b0;
                    for (int64_t ic = 0; ic < group_channels; ++ic) {
                        const int64_t c = g * group_channels + ic;
                        for (int64_t ky = 0; ky < kh; ++ky) {
                            const int64_t iy = oy * strides[0] - pads[0] + ky * dilations[0];
                            if (iy < 0 || iy >= height) continue;
                            for (int64_t kx = 0; kx < kw; ++kx) {
                                const int64_t ix = ox * strides[1] - pads[1] + kx * dilations[1];
                                if (ix < 0 || ix >= width) continue;
                                acc += x.data[((nb * channels + c) * height + iy) * width + ix] *
                                       w.data[((oc * group_channels + ic) * kh + ky) * kw + kx];
                            }
                        }
                    }
                    out.data[((nb * out_channels + oc) * out_h + oy) * out_w + ox] = acc;
                }
            }
        }
    }
    return {std::move(out)};
}

std::vector<Tensor> flatten_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    Tensor out = require_input(node, inputs, 0);
    const int64_t rank = out.rank();
    int64_t axis = node.intAttribute("axis", 1);
    if (axis < 0) axis += rank;
    if (axis < 0 || axis > rank) {
        throw ExecutionFailure("Flatten node '" + node.name + "': axis out of range");
    }
    int64_t outer = 1;
    for (int64_t i = 0; i < axis; ++i) outer *= out.shape[i];
    out.shape = {outer, out.numel() / std::max<int64_t>(outer, 1)};
    return {std::move(out)};
}

std::vector<Tensor> reshape_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs) {
    Tensor out = require_input(node, inputs, 0);
    const Tensor& target = require_input(node, inputs, 1);
    Shape shape;
    int64_t infer_at = -1, known = 1;
    for (size_t i = 0; i < target.data.size(); ++i) {
        int64_t d = static_cast<int64_t>(target.data[i]);
        if (d == 0 && i < out.shape.size()) d = out.shape[i];
        if (d == -1) {
            if (infer_at >= 0) throw ExecutionFailure("Reshape node '" + node.name + "': more than one -1");
            infer_at = static_cast<int64_t>(i);
        } else {
            known *= d;
        }
        shape.push_back(d);
    }
    if (infer_at >= 0) {
        if (known == 0 || out.numel() % known != 0) {
            throw ExecutionFailure("Reshape node '" + node.name + "': cannot infer dimension");
        }
        shape[infer_at] = out.numel() / known;
    }
    if (element_count(shape) != out.numel()) {
        throw ExecutionFailure("Reshape node '" + node.name + "': cannot reshape " + shape_to_string(out.shape) +
                               " to " + shape_to_string(shape));
    }
    out.shape = shape;
    return {std::move(out)};
}

template <typename Pick>
std::vector<Tensor> reduce_kernel(const OperatorNode& node, const std::vector<const Tensor*>& inputs,
                                  float init, Pick pick) {
    const Tensor& x = require_input(node, inputs, 0);
    if (x.numel() == 0) {
        throw ExecutionFailure(node.op_type + " node '" + node.name + "': cannot reduce an empty tensor");
    }
    const int64_t rank = x.rank();
    const bool keepdims = node.intAttribute("keepdims", 1) != 0;

    std::vector<int64_t> axes = node.intsAttribute("axes");
    if (const Tensor* t = optional_input(inputs, 1)) {
        axes.clear();
        for (float v : t->data) axes.push_back(static_cast<int64_t>(v));
    }
    std::vector<bool> reduced(static_cast<size_t>(rank), axes.empty());
    if (rank > 0) {
        for (auto axis : axes) reduced[normalize_axis(axis, rank, node)] = true;
    }

    Shape kept_shape;   // output shape with keepdims=1
    for (int64_t d = 0; d < rank; ++d) kept_shape.push_back(reduced[d] ? 1 : x.shape[d]);

    Tensor out(kept_shape, std::vector<float>(static_cast<size_t>(element_count(kept_shape)), init));
    const auto in_strides = contiguous_strides(x.shape);
    const auto out_strides = contiguous_strides(kept_shape);
    for (int64_t i = 0; i < x.numel(); ++i) {
        int64_t rem = i, off = 0;
        for (int64_t d = 0; d < rank; ++d) {
            const int64_t idx = rem / in_strides[d];
            rem %= in_strides[d];
            if (!reduced[d]) off += idx * out_strides[d];
        }
        out.data[off] = pick(out.data[off], x.data[i]);
    }

    if (!keepdims) {
        Shape squeezed;
        for (int64_t d = 0; d < rank; ++d) {
            if (!reduced[d]) squeezed.push_back(x.shape[d]);
        }
        out.shape = squeezed;
    }
    return {std::move(out)};
}

} // namespace

ReferenceInterpreter::ReferenceInterpreter() {
    registerBuiltinKernels();
}

void ReferenceInterpreter::registerKernel(const std::string& op_type, Kernel kernel) {
    kernels_[op_type] = std::move(kernel);
}

void ReferenceInterpreter::registerBuiltinKernels() {
    registerKernel("Identity", identity_kernel);
    registerKernel("Relu", relu_kernel);
    registerKernel("Clip", clip_kernel);
    registerKernel("MatMul", matmul_kernel);
    registerKernel("Gemm", gemm_kernel);
    registerKernel("Conv", conv_kernel);
    registerKernel("Flatten", flatten_kernel);
    registerKernel("Reshape", reshape_kernel);
    registerKernel("Add", [](const OperatorNode& n, const std::vector<const Tensor*>& in) {
        return elementwise_binary(n, in, [](float a, float b) { return a + b; });
    });
    registerKernel("Mul", [](const OperatorNode& n, const std::vector<const Tensor*>& in) {
        return elementwise_binary(n, in, [](float a, float b) { return a * b; });
    });
    registerKernel("ReduceMin", [](const OperatorNode& n, const std::vector<const Tensor*>& in) {
        return reduce_kernel(n, in, std::numeric_limits<float>::infinity(),
                             [](float acc, float v) { return std::min(acc, v); });
    });
    registerKernel("ReduceMax", [](const OperatorNode& n, const std::vector<const Tensor*>& in) {
        return reduce_kernel(n, in, -std::numeric_limits<float>::infinity(),
                             [](float acc, float v) { return std::max(acc, v); });
    });
}

std::vector<NamedTensor> ReferenceInterpreter::run(const ComputationGraph& graph, const Tensor& input) {
    const auto runtime_inputs = graph.runtimeInputs();
    if (runtime_inputs.size() != 1) {
        throw ExecutionFailure("Reference interpreter expects exactly one graph input, graph '" + graph.name +
                               "' declares " + std::to_string(runtime_inputs.size()));
    }
    const ValueInfo& in_info = *runtime_inputs.front();
    if (!shape_matches(in_info.shape, input.shape)) {
        throw DataShapeError("Input '" + in_info.name + "' has incorrect shape. The required shape is: " +
                             shape_to_string(in_info.shape) + ". The real shape is: " + shape_to_string(input.shape));
    }

    Environment env(graph.initializers.begin(), graph.initializers.end());
    env[in_info.name] = input;

    for (const auto& node : graph.nodes) {
        auto kernel_it = kernels_.find(node.op_type);
        if (kernel_it == kernels_.end()) {
            throw ExecutionFailure("Reference interpreter does not support op type '" + node.op_type +
                                   "' (node '" + node.name + "')");
        }

        std::vector<const Tensor*> args;
        args.reserve(node.inputs.size());
        for (const auto& name : node.inputs) {
            if (name.empty()) {
                args.push_back(nullptr);
                continue;
            }
            auto it = env.find(name);
            if (it == env.end()) {
                throw ExecutionFailure("Node '" + node.name + "' reads tensor '" + name +
                                       "' before it is produced; nodes must be topologically sorted");
            }
            args.push_back(&it->second);
        }

        std::vector<Tensor> results = kernel_it->second(node, args);
        if (results.size() < node.outputs.size()) {
            throw ExecutionFailure(node.op_type + " node '" + node.name + "' produced " +
                                   std::to_string(results.size()) + " output(s), expected " +
                                   std::to_string(node.outputs.size()));
        }
        for (size_t i = 0; i < node.outputs.size(); ++i) {
            if (!node.outputs[i].empty()) env[node.outputs[i]] = std::move(results[i]);
        }
    }

    std::vector<NamedTensor> outputs;
    outputs.reserve(graph.outputs.size());
    for (const auto& out : graph.outputs) {
        auto it = env.find(out.name);
        if (it == env.end()) {
            throw ExecutionFailure("Graph output '" + out.name + "' was not produced by any node");
        }
        outputs.push_back(NamedTensor{out.name, it->second});
    }
    return outputs;
}

} // namespace qcalib
