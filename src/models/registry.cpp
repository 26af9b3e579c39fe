#include "libpheno/models/registry.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/models/phenology.hpp"

#include <algorithm>
#include <utility>

namespace pheno::models {

namespace {

ModelRegistry make_builtin() {
    ModelRegistry reg;
    reg.add({"NULL", {}, &null_model, "mean of the measured dates"});
    reg.add({"LIN", {"a", "b"}, &linear, "linear regression on spring temperature"});
    reg.add({"TT", {"t0", "T_base", "F_crit"}, &thermal_time, "thermal time"});
    reg.add({"TTs", {"t0", "b", "c", "F_crit"}, &thermal_time_sigmoid, "thermal time, sigmoid forcing"});
    reg.add({"PTT", {"t0", "T_base", "F_crit"}, &photo_thermal_time, "photo-thermal time"});
    reg.add({"PTTs", {"t0", "b", "c", "F_crit"}, &photo_thermal_time_sigmoid,
             "photo-thermal time, sigmoid forcing"});
    reg.add({"M1", {"t0", "T_base", "k", "F_crit"}, &m1, "M1 photoperiod-scaled thermal time"});
    reg.add({"M1s", {"t0", "b", "c", "k", "F_crit"}, &m1_sigmoid, "M1, sigmoid forcing"});
    reg.add({"AT", {"t0", "T_base", "a", "b", "c"}, &alternating, "alternating chilling/forcing"});
    reg.add({"SQ", {"t0_chill", "T_base", "T_opt", "T_min", "T_max", "C_req", "F_crit"}, &sequential,
             "sequential chilling then forcing"});
    return reg;
}

} // namespace

const ModelRegistry& ModelRegistry::builtin() {
    static const ModelRegistry registry = make_builtin();
    return registry;
}

void ModelRegistry::add(ModelSpec spec) {
    if (spec.name.empty()) {
        throw ConfigurationError("ModelRegistry::add: model name is empty");
    }
    if (!spec.predict) {
        throw ConfigurationError("ModelRegistry::add: model " + spec.name + " has no evaluator");
    }
    if (contains(spec.name)) {
        throw ConfigurationError("ModelRegistry::add: model " + spec.name + " is already registered");
    }
    specs_.push_back(std::move(spec));
}

bool ModelRegistry::contains(const std::string& name) const {
    return std::any_of(specs_.begin(), specs_.end(),
        [&](const ModelSpec& s) { return s.name == name; });
}

const ModelSpec& ModelRegistry::find(const std::string& name) const {
    auto it = std::find_if(specs_.begin(), specs_.end(),
        [&](const ModelSpec& s) { return s.name == name; });
    if (it == specs_.end()) {
        throw ConfigurationError("unknown phenology model: " + name);
    }
    return *it;
}

std::vector<std::string> ModelRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto& s : specs_) {
        out.push_back(s.name);
    }
    return out;
}

std::vector<double> predict(const ModelSpec& model,
                            const std::vector<double>& par,
                            const FlatData& data) {
    auto out = model.predict(par, data);
    if (out.size() != data.n_records) {
        throw EvaluationError(model.name + ": evaluator returned " + std::to_string(out.size()) +
                              " predictions for " + std::to_string(data.n_records) + " records");
    }
    return out;
}

} // namespace pheno::models
