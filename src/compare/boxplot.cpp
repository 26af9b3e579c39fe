#include "libpheno/compare/comparison.hpp"

#include "libpheno/core/logging.hpp"
#include "libpheno/stats/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace pheno::compare {

namespace {

const std::vector<std::string>& baseline_models() {
    static const std::vector<std::string> names = {"NULL", "LIN"};
    return names;
}

const std::vector<std::string>& warming_models() {
    static const std::vector<std::string> names = {"TT", "TTs", "PTT", "PTTs", "M1", "M1s"};
    return names;
}

const std::vector<std::string>& chilling_models() {
    static const std::vector<std::string> names = {
        "AT", "SQ", "SQb", "SM1", "SM1b", "PA", "PAb", "PM1", "PM1b", "UN", "UM1", "SGSI", "AGSI"};
    return names;
}

bool listed(const std::vector<std::string>& names, const std::string& model) {
    return std::find(names.begin(), names.end(), model) != names.end();
}

// Linear interpolation between order statistics (R type 7).
double quantile(const std::vector<double>& sorted, double p) {
    if (sorted.size() == 1) {
        return sorted.front();
    }
    const double h = (static_cast<double>(sorted.size()) - 1.0) * p;
    const auto lo = static_cast<std::size_t>(std::floor(h));
    const auto hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

ModelBox summarize(const ModelRuns& runs, const std::vector<double>& measured) {
    ModelBox box;
    box.model = runs.model;
    box.colour = family_colour(model_family(runs.model));

    const std::size_t n_runs = runs.predicted.empty() ? 0 : runs.predicted.front().size();
    box.rmse.reserve(n_runs);
    std::vector<double> column(measured.size());
    for (std::size_t r = 0; r < n_runs; ++r) {
        for (std::size_t i = 0; i < measured.size(); ++i) {
            column[i] = runs.predicted[i][r];
        }
        box.rmse.push_back(stats::rmse(measured, column));
    }
    if (box.rmse.empty()) {
        return box;
    }

    const double n = static_cast<double>(box.rmse.size());
    box.mean = std::accumulate(box.rmse.begin(), box.rmse.end(), 0.0) / n;
    double ss = 0.0;
    for (double v : box.rmse) ss += (v - box.mean) * (v - box.mean);
    box.sd = (box.rmse.size() > 1) ? std::sqrt(ss / (n - 1.0)) : 0.0;

    auto sorted = box.rmse;
    std::sort(sorted.begin(), sorted.end());
    box.q1 = quantile(sorted, 0.25);
    box.median = quantile(sorted, 0.5);
    box.q3 = quantile(sorted, 0.75);

    const double iqr = box.q3 - box.q1;
    const double fence_lo = box.q1 - 1.5 * iqr;
    const double fence_hi = box.q3 + 1.5 * iqr;
    box.whisker_low = *std::find_if(sorted.begin(), sorted.end(),
        [&](double v) { return v >= fence_lo; });
    box.whisker_high = *std::find_if(sorted.rbegin(), sorted.rend(),
        [&](double v) { return v <= fence_hi; });
    return box;
}

} // namespace

ModelFamily model_family(const std::string& model) {
    if (listed(baseline_models(), model)) return ModelFamily::Baseline;
    if (listed(warming_models(), model)) return ModelFamily::SpringWarming;
    if (listed(chilling_models(), model)) return ModelFamily::ChillingForcing;
    return ModelFamily::Other;
}

Colour family_colour(ModelFamily family) {
    switch (family) {
    case ModelFamily::Baseline: return {0, 0, 0, 1.0};
    case ModelFamily::SpringWarming: return {0xef, 0x8a, 0x62, 1.0};
    case ModelFamily::ChillingForcing: return {0x67, 0xa9, 0xcf, 1.0};
    case ModelFamily::Other: break;
    }
    return {0x99, 0x99, 0x99, 1.0};
}

RmseBoxplot rmse_boxplot(const ComparisonDataset& data) {
    RmseBoxplot plot;
    plot.null_rmse = stats::null_rmse(data.measured());
    plot.y_max = 1.25 * plot.null_rmse;

    plot.boxes.reserve(data.models().size());
    for (const auto& runs : data.models()) {
        if (model_family(runs.model) == ModelFamily::Other) {
            log::logger()->debug("rmse_boxplot: no colour family for {}", runs.model);
        }
        plot.boxes.push_back(summarize(runs, data.measured()));
    }
    return plot;
}

} // namespace pheno::compare
