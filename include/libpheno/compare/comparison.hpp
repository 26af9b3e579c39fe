#pragma once

#include "libpheno/calib/optimizer.hpp"
#include "libpheno/core/types.hpp"
#include "libpheno/data/parameter_ranges.hpp"
#include "libpheno/models/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pheno::compare {

// rows = records, columns = runs
using RunMatrix = std::vector<std::vector<double>>;

struct ModelRuns {
    std::string model;
    RunMatrix predicted;
};

class ComparisonDataset {
public:
    ComparisonDataset() = default;
    explicit ComparisonDataset(std::vector<double> measured);

    // Throws ConfigurationError on a duplicate name, a row count other than
    // measured().size(), a ragged matrix or a matrix without runs.
    void add(const std::string& model, RunMatrix predicted);

    const std::vector<double>& measured() const { return measured_; }
    const std::vector<ModelRuns>& models() const { return models_; }
    std::vector<std::string> model_names() const;

    bool contains(const std::string& model) const;
    const ModelRuns& at(const std::string& model) const;

    // Per-record mean over runs.
    std::vector<double> mean_predictions(const std::string& model) const;

private:
    std::vector<double> measured_;
    std::vector<ModelRuns> models_;
};

struct ComparisonConfig {
    int runs = 10;
    std::uint64_t seed_stride = 1;
};

// Calibrates every model `runs` times (seed control.seed + r * seed_stride)
// and collects the predictions of each run as one column.
ComparisonDataset model_comparison(const Dataset& data,
                                   const std::vector<std::string>& models,
                                   calib::Method method,
                                   const calib::OptimizerControl& control,
                                   const data::ParameterRangeTable& ranges,
                                   const ComparisonConfig& cfg = {},
                                   const models::ModelRegistry& registry = models::ModelRegistry::builtin());

struct Colour {
    int r = 0;
    int g = 0;
    int b = 0;
    double alpha = 1.0;

    std::string hex() const;
    bool transparent() const { return alpha <= 0.0; }
};

bool operator==(const Colour& a, const Colour& b);

enum class Direction { Rising, Falling, Unchanged };

struct Arrow {
    double measured = 0.0;
    double from = 0.0;
    double to = 0.0;
    Direction direction = Direction::Unchanged;
    Colour colour;
};

struct ArrowPlot {
    std::string from_model;
    std::string to_model;
    std::vector<Arrow> arrows;
    double y_min = 0.0;
    double y_max = 0.0;
};

inline const Colour kRisingColour{241, 163, 64, 1.0};
inline const Colour kFallingColour{153, 142, 195, 1.0};
inline const Colour kUnchangedColour{0, 0, 0, 0.0};

// Mean predictions of two models per record, coloured by the sign of
// (to - from). Without `models` the first two models are compared. Throws
// ConfigurationError when fewer than two models are present or a named
// model is missing.
ArrowPlot arrow_plot(const ComparisonDataset& data,
                     const std::optional<std::pair<std::string, std::string>>& models = std::nullopt);

enum class ModelFamily { Baseline, SpringWarming, ChillingForcing, Other };

ModelFamily model_family(const std::string& model);
Colour family_colour(ModelFamily family);

struct ModelBox {
    std::string model;
    Colour colour;
    std::vector<double> rmse;  // one per run
    double mean = 0.0;
    double sd = 0.0;
    double q1 = 0.0;
    double median = 0.0;
    double q3 = 0.0;
    double whisker_low = 0.0;
    double whisker_high = 0.0;
};

struct RmseBoxplot {
    std::vector<ModelBox> boxes;
    double null_rmse = 0.0;
    double y_max = 0.0;  // 1.25 * null_rmse
};

// Per-run RMSE distributions with the null-model reference line.
RmseBoxplot rmse_boxplot(const ComparisonDataset& data);

} // namespace pheno::compare
