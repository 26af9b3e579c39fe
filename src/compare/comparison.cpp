#include "libpheno/compare/comparison.hpp"

#include "libpheno/calib/calibrator.hpp"
#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"
#include "libpheno/data/dataset.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace pheno::compare {

ComparisonDataset::ComparisonDataset(std::vector<double> measured) : measured_(std::move(measured)) {}

void ComparisonDataset::add(const std::string& model, RunMatrix predicted) {
    if (contains(model)) {
        throw ConfigurationError("comparison: model " + model + " added twice");
    }
    if (predicted.size() != measured_.size()) {
        throw ConfigurationError("comparison: " + model + " has " + std::to_string(predicted.size()) +
                                 " rows, expected " + std::to_string(measured_.size()));
    }
    const std::size_t runs = predicted.empty() ? 0 : predicted.front().size();
    if (!predicted.empty() && runs == 0) {
        throw ConfigurationError("comparison: " + model + " has no runs");
    }
    for (const auto& row : predicted) {
        if (row.size() != runs) {
            throw ConfigurationError("comparison: " + model + " has a ragged prediction matrix");
        }
    }
    models_.push_back({model, std::move(predicted)});
}

std::vector<std::string> ComparisonDataset::model_names() const {
    std::vector<std::string> out;
    out.reserve(models_.size());
    for (const auto& m : models_) {
        out.push_back(m.model);
    }
    return out;
}

bool ComparisonDataset::contains(const std::string& model) const {
    return std::any_of(models_.begin(), models_.end(),
        [&](const ModelRuns& m) { return m.model == model; });
}

const ModelRuns& ComparisonDataset::at(const std::string& model) const {
    auto it = std::find_if(models_.begin(), models_.end(),
        [&](const ModelRuns& m) { return m.model == model; });
    if (it == models_.end()) {
        throw ConfigurationError("comparison: model " + model + " is not in the dataset");
    }
    return *it;
}

std::vector<double> ComparisonDataset::mean_predictions(const std::string& model) const {
    const auto& runs = at(model);
    std::vector<double> out;
    out.reserve(runs.predicted.size());
    for (const auto& row : runs.predicted) {
        double sum = 0.0;
        for (double v : row) sum += v;
        out.push_back(sum / static_cast<double>(row.size()));
    }
    return out;
}

ComparisonDataset model_comparison(const Dataset& data,
                                   const std::vector<std::string>& models,
                                   calib::Method method,
                                   const calib::OptimizerControl& control,
                                   const data::ParameterRangeTable& ranges,
                                   const ComparisonConfig& cfg,
                                   const models::ModelRegistry& registry) {
    if (models.empty()) {
        throw ConfigurationError("model_comparison: no models given");
    }
    if (cfg.runs < 1) {
        throw ConfigurationError("model_comparison: runs must be positive");
    }

    ComparisonDataset out(data::flatten(data).transition_dates);
    const std::size_t n_records = out.measured().size();
    const std::size_t runs = static_cast<std::size_t>(cfg.runs);

    for (const auto& model : models) {
        RunMatrix predicted(n_records, std::vector<double>(runs, 0.0));
        for (std::size_t r = 0; r < runs; ++r) {
            calib::OptimizerControl ctl = control;
            ctl.seed = control.seed + r * cfg.seed_stride;
            const auto fit = calib::calibrate(model, data, method, ctl, ranges, registry);
            for (std::size_t i = 0; i < n_records; ++i) {
                predicted[i][r] = fit.predicted[i];
            }
        }
        out.add(model, std::move(predicted));
    }
    return out;
}

std::string Colour::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r & 0xff, g & 0xff, b & 0xff);
    return buf;
}

bool operator==(const Colour& a, const Colour& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.alpha == b.alpha;
}

ArrowPlot arrow_plot(const ComparisonDataset& data,
                     const std::optional<std::pair<std::string, std::string>>& models) {
    const auto names = data.model_names();
    if (names.size() < 2) {
        throw ConfigurationError("arrow_plot: only one model found in the data, need two to compare");
    }

    ArrowPlot plot;
    if (models) {
        plot.from_model = models->first;
        plot.to_model = models->second;
        if (!data.contains(plot.from_model) || !data.contains(plot.to_model)) {
            throw ConfigurationError("arrow_plot: the specified models are not in the dataset");
        }
    } else {
        log::logger()->info("arrow_plot: no models specified, comparing {} and {}", names[0], names[1]);
        plot.from_model = names[0];
        plot.to_model = names[1];
    }

    const auto from = data.mean_predictions(plot.from_model);
    const auto to = data.mean_predictions(plot.to_model);
    const auto& measured = data.measured();

    plot.arrows.reserve(measured.size());
    for (std::size_t i = 0; i < measured.size(); ++i) {
        Arrow a;
        a.measured = measured[i];
        a.from = from[i];
        a.to = to[i];
        const double diff = to[i] - from[i];
        if (diff > 0.0) {
            a.direction = Direction::Rising;
            a.colour = kRisingColour;
        } else if (diff < 0.0) {
            a.direction = Direction::Falling;
            a.colour = kFallingColour;
        } else {
            a.direction = Direction::Unchanged;
            a.colour = kUnchangedColour;
        }
        plot.arrows.push_back(a);
    }

    if (!measured.empty()) {
        const auto [lo_from, hi_from] = std::minmax_element(from.begin(), from.end());
        const auto [lo_to, hi_to] = std::minmax_element(to.begin(), to.end());
        plot.y_min = std::min(*lo_from, *lo_to) - 10.0;
        plot.y_max = std::max(*hi_from, *hi_to) + 10.0;
    }
    return plot;
}

} // namespace pheno::compare
