#include <gtest/gtest.h>

#include <vector>

#include "QCalib/errors.hpp"
#include "QCalib/graph_augmenter.hpp"
#include "QCalib/reference_interpreter.hpp"
#include "test_helpers.hpp"

using namespace qcalib;
using namespace qcalib::testing;

namespace {

ComputationGraph single_node_graph(const OperatorNode& node, const Shape& input_shape) {
    ComputationGraph g;
    g.name = node.op_type;
    g.inputs = {make_value(node.inputs[0], input_shape)};
    g.nodes = {node};
    g.outputs = {make_value(node.outputs[0])};
    return g;
}

Tensor run_single(const ComputationGraph& g, const Tensor& input) {
    ReferenceInterpreter interpreter;
    const auto outputs = interpreter.run(g, input);
    EXPECT_EQ(outputs.size(), 1u);
    return outputs.at(0).value;
}

Tensor iota(const Shape& shape, float start = 1.0f) {
    Tensor t = Tensor::zeros(shape);
    for (size_t i = 0; i < t.data.size(); ++i) t.data[i] = start + static_cast<float>(i);
    return t;
}

} // namespace

TEST(ReferenceInterpreterTest, RunsSmallCnn) {
    ReferenceInterpreter interpreter;
    const auto outputs = interpreter.run(small_cnn_graph(), iota({1, 1, 3, 3}));

    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].name, "y");
    EXPECT_EQ(outputs[0].value.shape, (Shape{1, 2}));
    EXPECT_FLOAT_EQ(outputs[0].value.data[0], 18.5f);
    EXPECT_FLOAT_EQ(outputs[0].value.data[1], 21.5f);
}

TEST(ReferenceInterpreterTest, AugmentedGraphYieldsScalarProbes) {
    ReferenceInterpreter interpreter;
    const AugmentedGraph augmented = augment_graph(small_cnn_graph());

    const auto outputs = interpreter.run(augmented.graph, iota({1, 1, 3, 3}));

    ASSERT_EQ(outputs.size(), 5u);
    EXPECT_EQ(outputs[1].name, "c0_ReduceMin");
    EXPECT_TRUE(outputs[1].value.shape.empty());
    EXPECT_FLOAT_EQ(outputs[1].value.data[0], 6.0f);
    EXPECT_FLOAT_EQ(outputs[2].value.data[0], 14.0f);
    EXPECT_FLOAT_EQ(outputs[3].value.data[0], 18.0f);
    EXPECT_FLOAT_EQ(outputs[4].value.data[0], 22.0f);
}

TEST(ReferenceInterpreterTest, ConvHonoursPadsAndStrides) {
    ComputationGraph g = single_node_graph(
        make_node("Conv", "conv", {"x", "w"}, {"y"},
                  {{"pads", Attribute::fromInts({1, 1, 1, 1})}, {"strides", Attribute::fromInts({2, 2})}}),
        {1, 1, 3, 3});
    g.initializers["w"] = Tensor({1, 1, 3, 3}, std::vector<float>(9, 1.0f));

    const Tensor y = run_single(g, Tensor({1, 1, 3, 3}, std::vector<float>(9, 1.0f)));

    EXPECT_EQ(y.shape, (Shape{1, 1, 2, 2}));
    EXPECT_EQ(y.data, (std::vector<float>{4, 4, 4, 4}));
}

TEST(ReferenceInterpreterTest, ConvAddsBiasPerChannel) {
    ComputationGraph g = single_node_graph(make_node("Conv", "conv", {"x", "w", "b"}, {"y"}), {1, 1, 1, 2});
    g.initializers["w"] = Tensor({2, 1, 1, 1}, {1.0f, -1.0f});
    g.initializers["b"] = Tensor({2}, {10.0f, 20.0f});

    const Tensor y = run_single(g, Tensor({1, 1, 1, 2}, {1.0f, 2.0f}));

    EXPECT_EQ(y.shape, (Shape{1, 2, 1, 2}));
    EXPECT_EQ(y.data, (std::vector<float>{11, 12, 19, 18}));
}

TEST(ReferenceInterpreterTest, GemmAppliesAlphaBetaAndBias) {
    ComputationGraph g = single_node_graph(
        make_node("Gemm", "gemm", {"a", "b", "c"}, {"y"},
                  {{"alpha", Attribute::fromFloat(2.0f)}, {"transB", Attribute::fromInt(1)}}),
        {2, 2});
    g.initializers["b"] = Tensor({2, 2}, {1.0f, 0.0f, 0.0f, 1.0f});
    g.initializers["c"] = Tensor({2}, {1.0f, -1.0f});

    const Tensor y = run_single(g, Tensor({2, 2}, {1.0f, 2.0f, 3.0f, 4.0f}));

    EXPECT_EQ(y.data, (std::vector<float>{3, 3, 7, 7}));
}

TEST(ReferenceInterpreterTest, MatMulBroadcastsBatches) {
    ComputationGraph g = single_node_graph(make_node("MatMul", "mm", {"a", "b"}, {"y"}), {2, 1, 2});
    g.initializers["b"] = Tensor({2, 1}, {1.0f, 1.0f});

    const Tensor y = run_single(g, Tensor({2, 1, 2}, {1.0f, 2.0f, 3.0f, 4.0f}));

    EXPECT_EQ(y.shape, (Shape{2, 1, 1}));
    EXPECT_EQ(y.data, (std::vector<float>{3, 7}));
}

TEST(ReferenceInterpreterTest, AddBroadcastsTrailingDimensions) {
    ComputationGraph g = single_node_graph(make_node("Add", "add", {"a", "b"}, {"y"}), {2, 3});
    g.initializers["b"] = Tensor({3}, {10.0f, 20.0f, 30.0f});

    const Tensor y = run_single(g, iota({2, 3}));

    EXPECT_EQ(y.data, (std::vector<float>{11, 22, 33, 14, 25, 36}));
}

TEST(ReferenceInterpreterTest, ClipReadsBoundsFromInputs) {
    ComputationGraph g = single_node_graph(make_node("Clip", "clip", {"x", "lo", "hi"}, {"y"}), {4});
    g.initializers["lo"] = Tensor::scalar(0.0f);
    g.initializers["hi"] = Tensor::scalar(2.5f);

    const Tensor y = run_single(g, Tensor({4}, {-1.0f, 1.0f, 2.0f, 3.0f}));

    EXPECT_EQ(y.data, (std::vector<float>{0.0f, 1.0f, 2.0f, 2.5f}));
}

TEST(ReferenceInterpreterTest, ReduceOverAxesAndWholeTensor) {
    const Tensor x = iota({2, 3});

    const Tensor per_row = run_single(
        single_node_graph(make_node("ReduceMax", "r", {"x"}, {"y"},
                                    {{"axes", Attribute::fromInts({1})}, {"keepdims", Attribute::fromInt(0)}}),
                          {2, 3}),
        x);
    EXPECT_EQ(per_row.shape, (Shape{2}));
    EXPECT_EQ(per_row.data, (std::vector<float>{3, 6}));

    const Tensor all = run_single(
        single_node_graph(make_node("ReduceMin", "r", {"x"}, {"y"}, {{"keepdims", Attribute::fromInt(0)}}), {2, 3}),
        x);
    EXPECT_TRUE(all.shape.empty());
    EXPECT_EQ(all.data, (std::vector<float>{1}));

    const Tensor kept = run_single(single_node_graph(make_node("ReduceMin", "r", {"x"}, {"y"}), {2, 3}), x);
    EXPECT_EQ(kept.shape, (Shape{1, 1}));
}

TEST(ReferenceInterpreterTest, FlattenAndReshape) {
    const Tensor flat = run_single(single_node_graph(make_node("Flatten", "f", {"x"}, {"y"}), {2, 3, 2}),
                                   iota({2, 3, 2}));
    EXPECT_EQ(flat.shape, (Shape{2, 6}));

    ComputationGraph g = single_node_graph(make_node("Reshape", "r", {"x", "s"}, {"y"}), {2, 3, 2});
    g.initializers["s"] = Tensor({2}, {0.0f, -1.0f});
    EXPECT_EQ(run_single(g, iota({2, 3, 2})).shape, (Shape{2, 6}));
}

TEST(ReferenceInterpreterTest, UnsupportedOpFails) {
    ReferenceInterpreter interpreter;
    const ComputationGraph g = single_node_graph(make_node("Softmax", "s", {"x"}, {"y"}), {2});
    EXPECT_FALSE(interpreter.supports("Softmax"));
    EXPECT_THROW(interpreter.run(g, Tensor({2}, {1.0f, 2.0f})), ExecutionFailure);
}

TEST(ReferenceInterpreterTest, RegisteredKernelIsUsed) {
    ReferenceInterpreter interpreter;
    interpreter.registerKernel("Negate", [](const OperatorNode&, const std::vector<const Tensor*>& in) {
        Tensor out = *in.at(0);
        for (auto& v : out.data) v = -v;
        return std::vector<Tensor>{out};
    });
    const ComputationGraph g = single_node_graph(make_node("Negate", "n", {"x"}, {"y"}), {2});

    const auto outputs = interpreter.run(g, Tensor({2}, {1.0f, -2.0f}));

    EXPECT_EQ(outputs.at(0).value.data, (std::vector<float>{-1.0f, 2.0f}));
}

TEST(ReferenceInterpreterTest, RejectsUnsortedGraphAndBadInput) {
    ReferenceInterpreter interpreter;
    ComputationGraph g = small_cnn_graph();
    std::swap(g.nodes[0], g.nodes[1]);
    EXPECT_THROW(interpreter.run(g, iota({1, 1, 3, 3})), ExecutionFailure);

    EXPECT_THROW(interpreter.run(small_cnn_graph(), iota({1, 1, 2, 2})), DataShapeError);

    ComputationGraph two_inputs = small_cnn_graph();
    two_inputs.inputs.push_back(make_value("z", {1}));
    EXPECT_THROW(interpreter.run(two_inputs, iota({1, 1, 3, 3})), ExecutionFailure);
}
