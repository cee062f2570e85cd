#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "QCalib/calibration_collector.hpp"
#include "QCalib/calibration_config.hpp"
#include "QCalib/calibration_pipeline.hpp"
#include "QCalib/dataset.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/graph_augmenter.hpp"
#include "QCalib/graph_loader.hpp"
#include "QCalib/inference_backend.hpp"
#include "QCalib/ir.hpp"
#include "QCalib/log.hpp"
#include "QCalib/performance_timer.hpp"
#include "QCalib/quantization_params.hpp"
#include "QCalib/quantization_params_io.hpp"
#include "QCalib/reference_interpreter.hpp"

namespace py = pybind11;
using namespace qcalib;

/** Lets a Python runtime (e.g. an onnxruntime session) serve as the backend. */
class PyInferenceBackend : public InferenceBackend {
public:
    using InferenceBackend::InferenceBackend;

    void prepare(const ComputationGraph& graph) override {
        PYBIND11_OVERRIDE(void, InferenceBackend, prepare, graph);
    }

    std::vector<NamedTensor> run(const ComputationGraph& graph, const Tensor& input) override {
        PYBIND11_OVERRIDE_PURE(std::vector<NamedTensor>, InferenceBackend, run, graph, input);
    }

    std::string name() const override {
        PYBIND11_OVERRIDE_PURE(std::string, InferenceBackend, name, );
    }
};

PYBIND11_MODULE(qcalib_cpp, m) {
    m.doc() = "QCalib post-training quantization calibration bindings";

    // --------------------------------------------------
    // Errors
    // --------------------------------------------------
    auto base_error = py::register_exception<CalibrationError>(m, "CalibrationError", PyExc_RuntimeError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base_error.ptr());
    py::register_exception<DataShapeError>(m, "DataShapeError", base_error.ptr());
    py::register_exception<ExecutionFailure>(m, "ExecutionFailure", base_error.ptr());
    py::register_exception<CalibrationCancelled>(m, "CalibrationCancelled", base_error.ptr());

    py::enum_<LogLevel>(m, "LogLevel")
        .value("INFO", LogLevel::kInfo)
        .value("WARN", LogLevel::kWarn)
        .value("ERROR", LogLevel::kError)
        .value("OFF", LogLevel::kOff);

    m.def("set_log_level", [](LogLevel level) { Logger::level() = level; }, py::arg("level"));

    // --------------------------------------------------
    // Graph IR
    // --------------------------------------------------
    py::class_<Tensor>(m, "Tensor")
        .def(py::init<>())
        .def(py::init<Shape, std::vector<float>>(), py::arg("shape"), py::arg("data"))
        .def_readwrite("shape", &Tensor::shape)
        .def_readwrite("data", &Tensor::data)
        .def("numel", &Tensor::numel)
        .def_static("scalar", &Tensor::scalar)
        .def_static("zeros", &Tensor::zeros);

    py::class_<NamedTensor>(m, "NamedTensor")
        .def(py::init<>())
        .def(py::init([](std::string name, Tensor value) { return NamedTensor{std::move(name), std::move(value)}; }),
             py::arg("name"), py::arg("value"))
        .def_readwrite("name", &NamedTensor::name)
        .def_readwrite("value", &NamedTensor::value);

    py::class_<Attribute> attribute(m, "Attribute");
    py::enum_<Attribute::Kind>(attribute, "Kind")
        .value("FLOAT", Attribute::Kind::FLOAT)
        .value("INT", Attribute::Kind::INT)
        .value("STRING", Attribute::Kind::STRING)
        .value("FLOATS", Attribute::Kind::FLOATS)
        .value("INTS", Attribute::Kind::INTS);
    attribute
        .def(py::init<>())
        .def_readwrite("kind", &Attribute::kind)
        .def_readwrite("f", &Attribute::f)
        .def_readwrite("i", &Attribute::i)
        .def_readwrite("s", &Attribute::s)
        .def_readwrite("floats", &Attribute::floats)
        .def_readwrite("ints", &Attribute::ints)
        .def_static("from_float", &Attribute::fromFloat)
        .def_static("from_int", &Attribute::fromInt)
        .def_static("from_string", &Attribute::fromString)
        .def_static("from_floats", &Attribute::fromFloats)
        .def_static("from_ints", &Attribute::fromInts);

    py::class_<OperatorNode>(m, "OperatorNode")
        .def(py::init<>())
        .def_readwrite("name", &OperatorNode::name)
        .def_readwrite("op_type", &OperatorNode::op_type)
        .def_readwrite("inputs", &OperatorNode::inputs)
        .def_readwrite("outputs", &OperatorNode::outputs)
        .def_readwrite("attributes", &OperatorNode::attributes);

    py::class_<ValueInfo>(m, "ValueInfo")
        .def(py::init<>())
        .def_readwrite("name", &ValueInfo::name)
        .def_readwrite("elem_type", &ValueInfo::elem_type)
        .def_readwrite("shape", &ValueInfo::shape);

    py::class_<ComputationGraph>(m, "ComputationGraph")
        .def(py::init<>())
        .def_readwrite("name", &ComputationGraph::name)
        .def_readwrite("nodes", &ComputationGraph::nodes)
        .def_readwrite("inputs", &ComputationGraph::inputs)
        .def_readwrite("outputs", &ComputationGraph::outputs)
        .def_readwrite("initializers", &ComputationGraph::initializers);

    m.def("load_graph_from_json", &load_graph_from_json, py::arg("path"),
          R"pbdoc(Load a computation graph from a JSON file.)pbdoc");
    m.def("save_graph_to_json", &save_graph_to_json, py::arg("graph"), py::arg("path"));

    // --------------------------------------------------
    // Augmentation
    // --------------------------------------------------
    py::class_<AugmentOptions>(m, "AugmentOptions")
        .def(py::init<>())
        .def_readwrite("candidate_op_types", &AugmentOptions::candidate_op_types);

    py::class_<ProbePair>(m, "ProbePair")
        .def_readonly("owner_node", &ProbePair::owner_node)
        .def_readonly("owner_output", &ProbePair::owner_output)
        .def_readonly("min_output", &ProbePair::min_output)
        .def_readonly("max_output", &ProbePair::max_output);

    py::class_<ProbeManifest>(m, "ProbeManifest")
        .def_readonly("original_output_count", &ProbeManifest::original_output_count)
        .def_readonly("probes", &ProbeManifest::probes);

    py::class_<AugmentedGraph>(m, "AugmentedGraph")
        .def_readonly("graph", &AugmentedGraph::graph)
        .def_readonly("manifest", &AugmentedGraph::manifest);

    m.def("augment_graph", &augment_graph, py::arg("graph"), py::arg("options") = AugmentOptions(),
          R"pbdoc(Return a copy of graph with ReduceMin/ReduceMax probes on every candidate output.)pbdoc");

    // --------------------------------------------------
    // Execution backends
    // --------------------------------------------------
    py::class_<InferenceBackend, PyInferenceBackend, std::shared_ptr<InferenceBackend>>(m, "InferenceBackend")
        .def(py::init<>())
        .def("prepare", &InferenceBackend::prepare)
        .def("run", &InferenceBackend::run)
        .def("name", &InferenceBackend::name);

    py::class_<ReferenceInterpreter, InferenceBackend, std::shared_ptr<ReferenceInterpreter>>(m, "ReferenceInterpreter")
        .def(py::init<>())
        .def("supports", &ReferenceInterpreter::supports);

    // --------------------------------------------------
    // Dataset
    // --------------------------------------------------
    py::class_<CalibrationDataset>(m, "CalibrationDataset")
        .def("size", &CalibrationDataset::size)
        .def("at", &CalibrationDataset::at, py::return_value_policy::reference_internal)
        .def("sample_shape", &CalibrationDataset::sampleShape);

    py::class_<TensorDataset, CalibrationDataset>(m, "TensorDataset")
        .def(py::init<Shape>(), py::arg("expected_shape"))
        .def("add", &TensorDataset::add);

    m.def("load_tensor_file", &load_tensor_file, py::arg("path"), py::arg("dataset_size"), py::arg("sample_shape"));

    // --------------------------------------------------
    // Collection
    // --------------------------------------------------
    py::enum_<CalibrationMode>(m, "CalibrationMode")
        .value("NAIVE", CalibrationMode::NAIVE);

    m.def("parse_calibration_mode", &parse_calibration_mode, py::arg("name"));

    py::class_<ValueRange>(m, "ValueRange")
        .def(py::init([](float lo, float hi) { return ValueRange{lo, hi}; }), py::arg("min"), py::arg("max"))
        .def_readwrite("min", &ValueRange::min)
        .def_readwrite("max", &ValueRange::max)
        .def("include_zero", &ValueRange::includeZero);

    py::class_<PerNodeStatistics>(m, "PerNodeStatistics")
        .def(py::init<>())
        .def("merge", &PerNodeStatistics::merge)
        .def("find", [](const PerNodeStatistics& s, const std::string& name) -> py::object {
            const ValueRange* r = s.find(name);
            return r ? py::cast(*r) : py::none();
        })
        .def("entries", &PerNodeStatistics::entries)
        .def("__len__", &PerNodeStatistics::size);

    py::class_<CalibrationCollector::CollectionStats>(m, "CollectionStats")
        .def_readonly("samples_processed", &CalibrationCollector::CollectionStats::samples_processed)
        .def_readonly("probe_pairs", &CalibrationCollector::CollectionStats::probe_pairs);

    py::class_<CalibrationCollector>(m, "CalibrationCollector")
        .def(py::init<std::shared_ptr<InferenceBackend>, const std::string&>(),
             py::arg("backend"), py::arg("mode") = "naive", py::keep_alive<1, 2>())
        .def("collect", &CalibrationCollector::collect, py::arg("augmented"), py::arg("dataset"),
             py::call_guard<py::gil_scoped_release>())
        .def("validate", &CalibrationCollector::validate, py::arg("augmented"), py::arg("dataset"))
        .def("get_last_collection_stats", &CalibrationCollector::getLastCollectionStats);

    // --------------------------------------------------
    // Parameter derivation
    // --------------------------------------------------
    py::class_<QuantizationParameter>(m, "QuantizationParameter")
        .def_readonly("zero_point", &QuantizationParameter::zero_point)
        .def_readonly("scale", &QuantizationParameter::scale);

    py::class_<QuantizationParameterMap>(m, "QuantizationParameterMap")
        .def("entries", &QuantizationParameterMap::entries)
        .def("find", [](const QuantizationParameterMap& p, const std::string& name) -> py::object {
            const QuantizationParameter* q = p.find(name);
            return q ? py::cast(*q) : py::none();
        })
        .def("__len__", &QuantizationParameterMap::size);

    py::class_<NoActivation>(m, "NoActivation").def(py::init<>());
    py::class_<ClipActivation>(m, "ClipActivation")
        .def(py::init([](float lo, float hi) { return ClipActivation{lo, hi}; }), py::arg("min"), py::arg("max"))
        .def_readonly("min", &ClipActivation::min)
        .def_readonly("max", &ClipActivation::max);
    py::class_<ReluActivation>(m, "ReluActivation").def(py::init<>());

    m.def("calculate_scale_zero_point", &calculate_scale_zero_point,
          py::arg("observed"), py::arg("activation") = FusedActivation(NoActivation{}));

    py::enum_<MissingStatisticsPolicy>(m, "MissingStatisticsPolicy")
        .value("SKIP", MissingStatisticsPolicy::kSkip)
        .value("ERROR", MissingStatisticsPolicy::kError);

    py::class_<QuantizationOptions>(m, "QuantizationOptions")
        .def(py::init<>())
        .def_readwrite("bit_width", &QuantizationOptions::bit_width)
        .def_readwrite("missing_statistics", &QuantizationOptions::missing_statistics)
        .def_readwrite("candidate_op_types", &QuantizationOptions::candidate_op_types);

    py::class_<QuantizationParameterCalculator>(m, "QuantizationParameterCalculator")
        .def(py::init<QuantizationOptions>(), py::arg("options") = QuantizationOptions())
        .def("calculate", &QuantizationParameterCalculator::calculate, py::arg("graph"), py::arg("statistics"));

    m.def("write_quantization_params", &write_quantization_params, py::arg("params"), py::arg("path"));
    m.def("load_quantization_params_from_json", &load_quantization_params_from_json, py::arg("path"));

    // --------------------------------------------------
    // Pipeline
    // --------------------------------------------------
    py::class_<LatencyStats>(m, "LatencyStats")
        .def(py::init<>())
        .def_readonly("total_duration_ns", &LatencyStats::total_duration_ns)
        .def_readonly("average_duration_ns", &LatencyStats::average_duration_ns)
        .def_readonly("last_duration_ns", &LatencyStats::last_duration_ns)
        .def_readonly("measurement_count", &LatencyStats::measurement_count);

    py::class_<CalibrationLatencyReport>(m, "CalibrationLatencyReport")
        .def_readonly("augmentation", &CalibrationLatencyReport::augmentation)
        .def_readonly("inference", &CalibrationLatencyReport::inference)
        .def_readonly("aggregation", &CalibrationLatencyReport::aggregation)
        .def_readonly("parameter_derivation", &CalibrationLatencyReport::parameter_derivation)
        .def_readonly("pipeline_total", &CalibrationLatencyReport::pipeline_total)
        .def("generate_report", &CalibrationLatencyReport::generateReport)
        .def_static("format_duration", &CalibrationLatencyReport::formatDuration);

    py::class_<CalibrationConfig>(m, "CalibrationConfig")
        .def(py::init<>())
        .def_readwrite("model_path", &CalibrationConfig::model_path)
        .def_readwrite("dataset_path", &CalibrationConfig::dataset_path)
        .def_readwrite("dataset_size", &CalibrationConfig::dataset_size)
        .def_readwrite("sample_shape", &CalibrationConfig::sample_shape)
        .def_readwrite("output_path", &CalibrationConfig::output_path)
        .def_readwrite("augmented_model_path", &CalibrationConfig::augmented_model_path)
        .def_readwrite("calib_mode", &CalibrationConfig::calib_mode)
        .def_readwrite("candidate_op_types", &CalibrationConfig::candidate_op_types)
        .def_readwrite("bit_width", &CalibrationConfig::bit_width)
        .def_readwrite("missing_statistics", &CalibrationConfig::missing_statistics);

    m.def("load_calibration_config_from_json", &load_calibration_config_from_json, py::arg("path"));

    py::class_<CalibrationReport>(m, "CalibrationReport")
        .def_readonly("manifest", &CalibrationReport::manifest)
        .def_readonly("statistics", &CalibrationReport::statistics)
        .def_readonly("parameters", &CalibrationReport::parameters)
        .def_readonly("latency", &CalibrationReport::latency);

    py::class_<CalibrationPipeline>(m, "CalibrationPipeline")
        .def(py::init<CalibrationConfig, std::shared_ptr<InferenceBackend>>(), py::arg("config"), py::arg("backend"),
             py::keep_alive<1, 3>())
        .def("run", &CalibrationPipeline::run, py::arg("graph"), py::arg("dataset"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_latency_report", &CalibrationPipeline::getLatencyReport);

    m.def("run_calibration", &run_calibration, py::arg("config"), py::arg("backend"),
          py::call_guard<py::gil_scoped_release>(),
          R"pbdoc(Load model and dataset from config, calibrate, and write the parameter file.)pbdoc");
}
