#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "libpheno/calib/calibrator.hpp"
#include "libpheno/compare/comparison.hpp"
#include "libpheno/core/types.hpp"
#include "libpheno/data/parameter_ranges.hpp"
#include "libpheno/data/synthetic.hpp"
#include "libpheno/plot/svg.hpp"
#include "libpheno/stats/metrics.hpp"

namespace py = pybind11;

PYBIND11_MODULE(phenopy, m) {
    m.doc() = "Phenology model calibration and comparison";

    // --- Data ---
    py::class_<pheno::ParameterSpec>(m, "ParameterSpec")
        .def(py::init<std::string,double,double>(),
            py::arg("name"), py::arg("lower"), py::arg("upper"))
        .def_readwrite("name", &pheno::ParameterSpec::name)
        .def_readwrite("lower", &pheno::ParameterSpec::lower)
        .def_readwrite("upper", &pheno::ParameterSpec::upper);

    py::class_<pheno::SiteYear>(m, "SiteYear")
        .def(py::init<>())
        .def_readwrite("site", &pheno::SiteYear::site)
        .def_readwrite("year", &pheno::SiteYear::year)
        .def_readwrite("latitude", &pheno::SiteYear::latitude)
        .def_readwrite("transition_date", &pheno::SiteYear::transition_date)
        .def_readwrite("temperature", &pheno::SiteYear::temperature)
        .def_readwrite("daylength", &pheno::SiteYear::daylength);

    py::class_<pheno::Dataset>(m, "Dataset")
        .def(py::init<>())
        .def_readwrite("doy", &pheno::Dataset::doy)
        .def_readwrite("records", &pheno::Dataset::records);

    py::class_<pheno::data::ParameterRangeTable>(m, "ParameterRangeTable")
        .def(py::init<>())
        .def("add", &pheno::data::ParameterRangeTable::add)
        .def("contains", &pheno::data::ParameterRangeTable::contains)
        .def("at", &pheno::data::ParameterRangeTable::at, py::return_value_policy::copy)
        .def("models", &pheno::data::ParameterRangeTable::models);

    m.def("load_parameter_ranges",
        [](const std::string& path) { return pheno::data::load_parameter_ranges(path); },
        "Load a parameter range table from a CSV file",
        py::arg("path"));

    py::class_<pheno::data::SyntheticConfig>(m, "SyntheticConfig")
        .def(py::init<>())
        .def_readwrite("sites", &pheno::data::SyntheticConfig::sites)
        .def_readwrite("first_year", &pheno::data::SyntheticConfig::first_year)
        .def_readwrite("years", &pheno::data::SyntheticConfig::years)
        .def_readwrite("noise_sd", &pheno::data::SyntheticConfig::noise_sd)
        .def_readwrite("latitude", &pheno::data::SyntheticConfig::latitude)
        .def_readwrite("seed", &pheno::data::SyntheticConfig::seed);

    m.def("synthetic_drivers", &pheno::data::synthetic_drivers, py::arg("cfg"));

    // --- Statistics ---
    py::class_<pheno::stats::AicRecord>(m, "AicRecord")
        .def_readonly("n", &pheno::stats::AicRecord::n)
        .def_readonly("k", &pheno::stats::AicRecord::k)
        .def_readonly("rss", &pheno::stats::AicRecord::rss)
        .def_readonly("aic", &pheno::stats::AicRecord::aic)
        .def_readonly("aicc", &pheno::stats::AicRecord::aicc);

    m.def("rmse", &pheno::stats::rmse, py::arg("measured"), py::arg("predicted"));
    m.def("aicc", &pheno::stats::aicc, py::arg("measured"), py::arg("predicted"), py::arg("k"));

    // --- Calibration ---
    py::enum_<pheno::calib::Method>(m, "Method")
        .value("GenSA", pheno::calib::Method::SimulatedAnnealing)
        .value("genoud", pheno::calib::Method::Genetic)
        .value("BayesianTools", pheno::calib::Method::Bayesian);

    m.def("parse_method", &pheno::calib::parse_method, py::arg("name"));

    py::class_<pheno::calib::OptimizerControl>(m, "OptimizerControl")
        .def(py::init<>())
        .def_readwrite("max_calls", &pheno::calib::OptimizerControl::max_calls)
        .def_readwrite("seed", &pheno::calib::OptimizerControl::seed)
        .def_property("iterations",
            [](const pheno::calib::OptimizerControl& c) { return c.sampler.iterations; },
            [](pheno::calib::OptimizerControl& c, std::size_t n) { c.sampler.iterations = n; })
        .def_property("burn_in",
            [](const pheno::calib::OptimizerControl& c) { return c.sampler.burn_in; },
            [](pheno::calib::OptimizerControl& c, std::size_t n) { c.sampler.burn_in = n; });

    py::class_<pheno::calib::CalibrationResult>(m, "CalibrationResult")
        .def_readonly("model", &pheno::calib::CalibrationResult::model)
        .def_readonly("method", &pheno::calib::CalibrationResult::method)
        .def_readonly("params", &pheno::calib::CalibrationResult::params)
        .def_readonly("bounds", &pheno::calib::CalibrationResult::bounds)
        .def_readonly("measured", &pheno::calib::CalibrationResult::measured)
        .def_readonly("predicted", &pheno::calib::CalibrationResult::predicted)
        .def_readonly("rmse", &pheno::calib::CalibrationResult::rmse)
        .def_readonly("rmse_null", &pheno::calib::CalibrationResult::rmse_null)
        .def_readonly("aic", &pheno::calib::CalibrationResult::aic)
        .def_property_readonly("samples", [](const pheno::calib::CalibrationResult& r) {
            const auto* post = r.optimizer.posterior();
            return post ? post->samples : std::vector<std::vector<double>>{};
        });

    m.def("calibrate",
        [](const std::string& model, const pheno::Dataset& data, const pheno::data::ParameterRangeTable& ranges,
           const std::string& method, const pheno::calib::OptimizerControl& control) {
            return pheno::calib::calibrate(model, data, pheno::calib::parse_method(method), control, ranges);
        },
        "Fit a phenology model within its parameter ranges",
        py::arg("model"), py::arg("data"), py::arg("ranges"), py::arg("method") = "GenSA",
        py::arg("control") = pheno::calib::OptimizerControl{});

    m.def("render_fit", &pheno::plot::render_fit, py::arg("result"));

    // --- Comparison ---
    py::class_<pheno::compare::ComparisonDataset>(m, "ComparisonDataset")
        .def(py::init<std::vector<double>>(), py::arg("measured"))
        .def("add", &pheno::compare::ComparisonDataset::add, py::arg("model"), py::arg("predicted"))
        .def("model_names", &pheno::compare::ComparisonDataset::model_names)
        .def("mean_predictions", &pheno::compare::ComparisonDataset::mean_predictions);

    py::enum_<pheno::compare::Direction>(m, "Direction")
        .value("Rising", pheno::compare::Direction::Rising)
        .value("Falling", pheno::compare::Direction::Falling)
        .value("Unchanged", pheno::compare::Direction::Unchanged);

    py::class_<pheno::compare::Arrow>(m, "Arrow")
        .def_readonly("measured", &pheno::compare::Arrow::measured)
        .def_readonly("start", &pheno::compare::Arrow::from)
        .def_readonly("end", &pheno::compare::Arrow::to)
        .def_readonly("direction", &pheno::compare::Arrow::direction)
        .def_property_readonly("colour", [](const pheno::compare::Arrow& a) {
            return a.colour.transparent() ? std::string("transparent") : a.colour.hex();
        });

    py::class_<pheno::compare::ArrowPlot>(m, "ArrowPlot")
        .def_readonly("from_model", &pheno::compare::ArrowPlot::from_model)
        .def_readonly("to_model", &pheno::compare::ArrowPlot::to_model)
        .def_readonly("arrows", &pheno::compare::ArrowPlot::arrows);

    m.def("arrow_plot",
        [](const pheno::compare::ComparisonDataset& data, std::optional<std::pair<std::string, std::string>> models) {
            return pheno::compare::arrow_plot(data, models);
        },
        py::arg("data"), py::arg("models") = py::none());

    py::class_<pheno::compare::ModelBox>(m, "ModelBox")
        .def_readonly("model", &pheno::compare::ModelBox::model)
        .def_readonly("rmse", &pheno::compare::ModelBox::rmse)
        .def_readonly("median", &pheno::compare::ModelBox::median)
        .def_readonly("mean", &pheno::compare::ModelBox::mean)
        .def_readonly("sd", &pheno::compare::ModelBox::sd);

    py::class_<pheno::compare::RmseBoxplot>(m, "RmseBoxplot")
        .def_readonly("boxes", &pheno::compare::RmseBoxplot::boxes)
        .def_readonly("null_rmse", &pheno::compare::RmseBoxplot::null_rmse);

    m.def("rmse_boxplot", &pheno::compare::rmse_boxplot, py::arg("data"));
    m.def("render_arrows", &pheno::plot::render_arrows, py::arg("plot"));
    m.def("render_boxplot", &pheno::plot::render_boxplot, py::arg("plot"));
}
