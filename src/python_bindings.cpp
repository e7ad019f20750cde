#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../include/core/training_data.hpp"
#include "../include/core/tuner.hpp"

#include <sstream>

namespace py = pybind11;
using namespace knntune;

namespace {

    template <typename T>
    std::string repr(const T& value) {
        std::ostringstream os;
        os << value;
        return os.str();
    }

} // namespace

PYBIND11_MODULE(knntune, m) {
    m.doc() = "KnnTune: k-NN classifier and hyperparameter grid search (C++ Backend)";

    py::register_exception<KnnError>(m, "KnnError");

    py::enum_<StoreBacking>(m, "StoreBacking")
        .value("Heap", StoreBacking::Heap)
        .value("Shared", StoreBacking::Shared)
        .value("File", StoreBacking::File);

    py::enum_<LoadPolicy>(m, "LoadPolicy")
        .value("Skip", LoadPolicy::Skip)
        .value("Abort", LoadPolicy::Abort);

    py::enum_<Strategy>(m, "Strategy")
        .value("FullSort", Strategy::FullSort)
        .value("BoundedInsertion", Strategy::BoundedInsertion)
        .value("Heap", Strategy::Heap);

    py::enum_<ExecutorKind>(m, "ExecutorKind")
        .value("Inline", ExecutorKind::Inline)
        .value("Threads", ExecutorKind::Threads)
        .value("Processes", ExecutorKind::Processes);

    py::class_<Schema>(m, "Schema")
        .def(py::init<>())
        .def_readwrite("features", &Schema::features)
        .def_readwrite("label", &Schema::label)
        .def_readwrite("classes", &Schema::classes)
        .def_static("iris", &Schema::iris);

    py::enum_<Reduction>(m, "Reduction")
        .value("Sum", Reduction::Sum)
        .value("Max", Reduction::Max);

    py::class_<Metric>(m, "Metric")
        .def_static("parse", &Metric::parse, py::arg("name"))
        .def_static("family", &Metric::family)
        .def_static("minkowski", &Metric::minkowski, py::arg("m"), py::arg("reduction") = Reduction::Sum)
        .def_property_readonly("name", &Metric::name)
        .def("__repr__", [](const Metric& metric) { return "<Metric " + metric.name() + ">"; });

    py::class_<TrialResult>(m, "TrialResult")
        .def_readonly("k", &TrialResult::k)
        .def_readonly("metric", &TrialResult::metric)
        .def_readonly("quality", &TrialResult::quality)
        .def_readonly("elapsed_ms", &TrialResult::elapsed_ms)
        .def_readonly("error", &TrialResult::error)
        .def("ok", &TrialResult::ok)
        .def("__repr__", [](const TrialResult& r) { return "<TrialResult " + repr(r) + ">"; });

    py::class_<TunerConfig>(m, "TunerConfig")
        .def(py::init<>())
        .def_readwrite("executor", &TunerConfig::executor)
        .def_readwrite("workers", &TunerConfig::workers)
        .def_readwrite("strategy", &TunerConfig::strategy)
        .def_readwrite("verbose", &TunerConfig::verbose);

    // Dataset handle: owns the store and its every-nth split.
    py::class_<TrainingData>(m, "TrainingData")
        .def(py::init<std::string>(), py::arg("name"))
        .def("load", [](TrainingData& data, const std::vector<Record>& records, const Schema& schema,
                        size_t test_every, LoadPolicy policy, StoreBacking backing) {
                 std::vector<std::string> rejected;
                 for (const InvalidRecord& e : data.load(records, schema, PartitionRule::every_nth(test_every),
                                                         policy, backing)) {
                     rejected.push_back(e.what());
                 }
                 return rejected;
             },
             py::arg("records"), py::arg("schema") = Schema::iris(), py::arg("test_every") = config::TEST_EVERY,
             py::arg("policy") = LoadPolicy::Skip, py::arg("backing") = StoreBacking::Shared)
        .def_property_readonly("name", &TrainingData::name)
        .def_property_readonly("size", [](const TrainingData& data) { return data.store().size(); })
        .def_property_readonly("training_size", [](const TrainingData& data) { return data.partition().training.size(); })
        .def_property_readonly("testing_size", [](const TrainingData& data) { return data.partition().testing.size(); })

        // Grid search; the GIL is dropped while workers run.
        .def("tune", [](const TrainingData& data, const std::vector<int>& k_values,
                        const std::vector<std::string>& metric_names, const TunerConfig& config) {
                 std::vector<Metric> metrics;
                 for (const std::string& name : metric_names) metrics.push_back(Metric::parse(name));
                 py::gil_scoped_release release;
                 return rank(Tuner(config).tune(k_values, metrics, data.store(), data.partition()));
             },
             py::arg("k_values") = k_range(), py::arg("metrics") = std::vector<std::string>{"ED", "MD", "CD", "SD"},
             py::arg("config") = TunerConfig())

        .def("classify", [](const TrainingData& data, const std::vector<double>& query, int k,
                            const std::string& metric, Strategy strategy) {
                 return classify_one(data.store(), data.partition().training, k, Metric::parse(metric), query, strategy);
             },
             py::arg("query"), py::arg("k") = 5, py::arg("metric") = "ED", py::arg("strategy") = Strategy::FullSort);

    m.def("k_range", &k_range, py::arg("first") = config::K_FIRST, py::arg("last") = config::K_LAST,
          py::arg("step") = config::K_STEP);
}
