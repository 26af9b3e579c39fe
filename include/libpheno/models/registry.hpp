#pragma once

#include "libpheno/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace pheno::models {

using PredictFn = std::function<std::vector<double>(const std::vector<double>&, const FlatData&)>;

struct ModelSpec {
    std::string name;
    std::vector<std::string> parameters;
    PredictFn predict;
    std::string description;
};

class ModelRegistry {
public:
    ModelRegistry() = default;

    // Read-only registry holding the built-in models.
    static const ModelRegistry& builtin();

    // Throws ConfigurationError on an empty name, a missing evaluator or a
    // name that is already registered.
    void add(ModelSpec spec);

    bool contains(const std::string& name) const;

    // Throws ConfigurationError for an unknown model.
    const ModelSpec& find(const std::string& name) const;

    std::vector<std::string> names() const;
    std::size_t size() const { return specs_.size(); }

private:
    std::vector<ModelSpec> specs_;
};

// Runs the evaluator and checks that it produced one value per record.
std::vector<double> predict(const ModelSpec& model,
                            const std::vector<double>& par,
                            const FlatData& data);

} // namespace pheno::models
