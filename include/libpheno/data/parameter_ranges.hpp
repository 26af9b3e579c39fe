#pragma once

#include "libpheno/core/types.hpp"
#include "libpheno/models/registry.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace pheno::data {

// Model name -> ordered (name, lower, upper) triples. Read-only once loaded.
class ParameterRangeTable {
public:
    ParameterRangeTable() = default;

    // Throws ConfigurationError on a duplicate model, an empty row, a
    // non-finite bound or lower > upper.
    void add(const std::string& model, std::vector<ParameterSpec> specs);

    bool contains(const std::string& model) const;

    // Throws ConfigurationError if the model has no row.
    const std::vector<ParameterSpec>& at(const std::string& model) const;

    std::vector<std::string> models() const;
    std::size_t size() const { return rows_.size(); }

private:
    struct Row {
        std::string model;
        std::vector<ParameterSpec> specs;
    };
    std::vector<Row> rows_;
};

// Comma-delimited table with header `model,bound,<p1>,...,<pn>`. Each model
// has exactly two rows, lower bounds first, upper bounds second (the
// `bound` cell may say `lower` / `upper`). Cells past a model's parameter
// count are blank or NA. Parameter names come from `names` when it knows
// the model and the arity agrees, otherwise from the header, otherwise
// p1..pn. Malformed rows throw ConfigurationError.
ParameterRangeTable load_parameter_ranges(std::istream& in,
                                          const models::ModelRegistry& names = models::ModelRegistry::builtin());

ParameterRangeTable load_parameter_ranges(const std::string& path,
                                          const models::ModelRegistry& names = models::ModelRegistry::builtin());

} // namespace pheno::data
