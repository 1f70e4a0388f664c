/**
 * Canopy Python Bindings
 *
 * Provides sklearn-style DecisionTree and RandomForest estimators.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <memory>

#include "canopy/canopy.hpp"

namespace py = pybind11;
using namespace canopy;

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

// ============================================================================
// NumPy Conversion Utilities
// ============================================================================

template<typename T>
py::array_t<T> vector_to_numpy(const std::vector<T>& vec) {
    auto result = py::array_t<T>(vec.size());
    auto buf = result.request();
    std::memcpy(buf.ptr, vec.data(), vec.size() * sizeof(T));
    return result;
}

static Matrix numpy_to_matrix(const DoubleArray& X) {
    auto buf = X.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("X must be 2-dimensional");
    }
    const auto rows = static_cast<Eigen::Index>(buf.shape[0]);
    const auto cols = static_cast<Eigen::Index>(buf.shape[1]);
    return Eigen::Map<const Matrix>(static_cast<const double*>(buf.ptr), rows, cols);
}

static Vector numpy_to_vector(const DoubleArray& y) {
    auto buf = y.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("y must be 1-dimensional");
    }
    const double* ptr = static_cast<const double*>(buf.ptr);
    return Vector(ptr, ptr + buf.shape[0]);
}

static PurityFn parse_purity(const std::string& name) {
    if (name == "gini") return purity::gini;
    if (name == "entropy") return purity::entropy;
    if (name == "stdev") return purity::stdev;
    if (name == "variance") return purity::variance;
    throw Error(ErrorKind::InvalidConfig,
                "purity must be 'gini', 'entropy', 'stdev' or 'variance', got '" + name + "'");
}

static std::string default_purity(TaskType mode) {
    return mode == TaskType::Classification ? "gini" : "stdev";
}

// Rows x classes probability matrix, columns ordered as `classes`
static py::array_t<double> probabilities_to_numpy(
    const std::vector<ClassPrediction>& predictions,
    const Vector& classes
) {
    const size_t n_rows = predictions.size();
    const size_t n_classes = classes.size();
    py::array_t<double> result({n_rows, n_classes});
    auto buf = result.request();
    double* out = static_cast<double*>(buf.ptr);

    for (size_t i = 0; i < n_rows; ++i) {
        for (size_t k = 0; k < n_classes; ++k) {
            auto it = predictions[i].probabilities.find(classes[k]);
            out[i * n_classes + k] = it != predictions[i].probabilities.end() ? it->second : 0.0;
        }
    }
    return result;
}

// ============================================================================
// Python Decision Tree
// ============================================================================

class PyDecisionTree {
public:
    PyDecisionTree(
        const std::string& mode = "classify",
        const std::string& purity = "",
        int max_depth = 15,
        int min_rows_per_node = 3,
        int random_features = -1,
        bool bootstrap = false,
        int seed = 42,
        int verbosity = 0
    ) {
        config_.mode = parse_task_type(mode);
        config_.max_depth = checked_count(max_depth, "max_depth");
        config_.min_rows_per_node = checked_count(min_rows_per_node, "min_rows_per_node");
        config_.random_features = random_features;
        config_.bootstrap_sample_data = bootstrap;
        config_.seed = static_cast<uint64_t>(seed);
        config_.verbosity = verbosity;
        config_.validate();
        purity_name_ = purity.empty() ? default_purity(config_.mode) : purity;
        tree_ = std::make_unique<Tree>(config_, parse_purity(purity_name_));
    }

    void fit(DoubleArray X, DoubleArray y) {
        Matrix matrix = numpy_to_matrix(X);
        Vector target = numpy_to_vector(y);
        py::gil_scoped_release release;
        tree_->train(matrix, target);
    }

    py::array_t<double> predict(DoubleArray X) const {
        Matrix matrix = numpy_to_matrix(X);
        return vector_to_numpy(tree_->predict(matrix));
    }

    py::array_t<double> predict_proba(DoubleArray X) const {
        Matrix matrix = numpy_to_matrix(X);
        return probabilities_to_numpy(tree_->predict_with_probabilities(matrix), tree_->classes());
    }

    py::array_t<double> purity_gains() const {
        return vector_to_numpy(tree_->purity_gains());
    }

    py::dict get_params() const {
        py::dict params;
        params["mode"] = task_type_name(config_.mode);
        params["purity"] = purity_name_;
        params["max_depth"] = config_.max_depth;
        params["min_rows_per_node"] = config_.min_rows_per_node;
        params["random_features"] = config_.random_features;
        params["bootstrap"] = config_.bootstrap_sample_data;
        params["seed"] = config_.seed;
        return params;
    }

    Index n_nodes() const { return tree_->n_nodes(); }
    Index n_leaves() const { return tree_->n_leaves(); }
    uint32_t depth() const { return tree_->depth(); }
    py::array_t<double> classes() const { return vector_to_numpy(tree_->classes()); }

private:
    TreeConfig config_;
    std::string purity_name_;
    std::unique_ptr<Tree> tree_;
};

// ============================================================================
// Python Random Forest
// ============================================================================

class PyRandomForest {
public:
    PyRandomForest(
        const std::string& mode = "classify",
        const std::string& purity = "",
        int n_estimators = 103,
        int max_depth = 1000,
        int min_rows_per_node = 3,
        int random_features = 0,
        bool bootstrap = true,
        bool oob_score = false,
        int n_threads = -1,
        int seed = 42,
        int verbosity = 0
    ) {
        config_.mode = parse_task_type(mode);
        config_.tree_count = checked_count(n_estimators, "n_estimators");
        config_.max_depth = checked_count(max_depth, "max_depth");
        config_.min_rows_per_node = checked_count(min_rows_per_node, "min_rows_per_node");
        config_.random_features = random_features;
        config_.bootstrap_sample_data = bootstrap;
        config_.record_out_of_bag = oob_score;
        config_.n_threads = n_threads;
        config_.seed = static_cast<uint64_t>(seed);
        config_.verbosity = verbosity;
        purity_name_ = purity.empty() ? default_purity(config_.mode) : purity;
        forest_ = std::make_unique<Forest>(config_, parse_purity(purity_name_));
    }

    void fit(DoubleArray X, DoubleArray y) {
        Matrix matrix = numpy_to_matrix(X);
        Vector target = numpy_to_vector(y);
        {
            py::gil_scoped_release release;
            forest_->train(matrix, target);
        }
        if (config_.record_out_of_bag) {
            oob_score_ = forest_->oob_score(matrix, target);
        }
    }

    py::array_t<double> predict(DoubleArray X) const {
        Matrix matrix = numpy_to_matrix(X);
        Vector result;
        {
            py::gil_scoped_release release;
            result = forest_->predict(matrix);
        }
        return vector_to_numpy(result);
    }

    py::array_t<double> predict_proba(DoubleArray X) const {
        Matrix matrix = numpy_to_matrix(X);
        std::vector<ClassPrediction> result;
        {
            py::gil_scoped_release release;
            result = forest_->predict_with_probabilities(matrix);
        }
        return probabilities_to_numpy(result, forest_->classes());
    }

    py::array_t<double> purity_gains() const {
        return vector_to_numpy(forest_->purity_gains());
    }

    py::dict get_params() const {
        py::dict params;
        params["mode"] = task_type_name(config_.mode);
        params["purity"] = purity_name_;
        params["n_estimators"] = config_.tree_count;
        params["max_depth"] = config_.max_depth;
        params["min_rows_per_node"] = config_.min_rows_per_node;
        params["random_features"] = config_.random_features;
        params["bootstrap"] = config_.bootstrap_sample_data;
        params["oob_score"] = config_.record_out_of_bag;
        params["n_threads"] = config_.n_threads;
        params["seed"] = config_.seed;
        return params;
    }

    size_t n_trees() const { return forest_->n_trees(); }
    py::array_t<double> classes() const { return vector_to_numpy(forest_->classes()); }

    double oob_score() const {
        if (!config_.record_out_of_bag) {
            throw Error(ErrorKind::InvalidConfig, "construct with oob_score=True to record it");
        }
        if (!forest_->is_trained()) {
            throw Error(ErrorKind::Untrained, messages::kUntrained);
        }
        return oob_score_;
    }

private:
    ForestConfig config_;
    std::string purity_name_;
    std::unique_ptr<Forest> forest_;
    double oob_score_ = 0.0;
};

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_canopy, m) {
    m.doc() = "Canopy: Decision Trees and Random Forests";

    // Version info
    m.attr("__version__") = CANOPY_VERSION_STRING;

    py::register_exception<Error>(m, "CanopyError");

    // Decision tree
    py::class_<PyDecisionTree>(m, "DecisionTree")
        .def(py::init<const std::string&, const std::string&, int, int, int, bool, int, int>(),
             py::arg("mode") = "classify",
             py::arg("purity") = "",
             py::arg("max_depth") = 15,
             py::arg("min_rows_per_node") = 3,
             py::arg("random_features") = -1,
             py::arg("bootstrap") = false,
             py::arg("seed") = 42,
             py::arg("verbosity") = 0)
        .def("fit", &PyDecisionTree::fit, py::arg("X"), py::arg("y"))
        .def("predict", &PyDecisionTree::predict, py::arg("X"))
        .def("predict_proba", &PyDecisionTree::predict_proba, py::arg("X"))
        .def("purity_gains", &PyDecisionTree::purity_gains)
        .def("get_params", &PyDecisionTree::get_params)
        .def_property_readonly("n_nodes", &PyDecisionTree::n_nodes)
        .def_property_readonly("n_leaves", &PyDecisionTree::n_leaves)
        .def_property_readonly("depth", &PyDecisionTree::depth)
        .def_property_readonly("classes_", &PyDecisionTree::classes);

    // Random forest
    py::class_<PyRandomForest>(m, "RandomForest")
        .def(py::init<const std::string&, const std::string&, int, int, int, int,
                      bool, bool, int, int, int>(),
             py::arg("mode") = "classify",
             py::arg("purity") = "",
             py::arg("n_estimators") = 103,
             py::arg("max_depth") = 1000,
             py::arg("min_rows_per_node") = 3,
             py::arg("random_features") = 0,
             py::arg("bootstrap") = true,
             py::arg("oob_score") = false,
             py::arg("n_threads") = -1,
             py::arg("seed") = 42,
             py::arg("verbosity") = 0)
        .def("fit", &PyRandomForest::fit, py::arg("X"), py::arg("y"))
        .def("predict", &PyRandomForest::predict, py::arg("X"))
        .def("predict_proba", &PyRandomForest::predict_proba, py::arg("X"))
        .def("purity_gains", &PyRandomForest::purity_gains)
        .def("get_params", &PyRandomForest::get_params)
        .def_property_readonly("n_trees", &PyRandomForest::n_trees)
        .def_property_readonly("classes_", &PyRandomForest::classes)
        .def_property_readonly("oob_score_", &PyRandomForest::oob_score);

    // Utility functions
    m.def("print_info", &print_info, "Print Canopy library information");
}
