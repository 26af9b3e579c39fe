#include "libpheno/data/parameter_ranges.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <istream>
#include <iterator>
#include <sstream>

namespace pheno::data {

namespace {

enum class BoundKind { Unlabelled, Lower, Upper };

struct RawRow {
    std::size_t line = 0;
    BoundKind kind = BoundKind::Unlabelled;
    std::vector<double> values;
};

struct RawModel {
    std::string model;
    std::vector<RawRow> rows;
};

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out = s.substr(b, e - b);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::string lower_case(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

bool is_absent(const std::string& cell) {
    const auto c = lower_case(cell);
    return c.empty() || c == "na" || c == "nan";
}

[[noreturn]] void fail(std::size_t line, const std::string& msg) {
    throw ConfigurationError("parameter ranges, line " + std::to_string(line) + ": " + msg);
}

double parse_number(const std::string& cell, std::size_t line) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(cell, &used);
    } catch (const std::exception&) {
        fail(line, "'" + cell + "' is not a number");
    }
    if (used != cell.size()) {
        fail(line, "'" + cell + "' is not a number");
    }
    return v;
}

BoundKind parse_kind(const std::string& cell, std::size_t line) {
    const auto c = lower_case(cell);
    if (c.empty()) return BoundKind::Unlabelled;
    if (c == "lower" || c == "min") return BoundKind::Lower;
    if (c == "upper" || c == "max") return BoundKind::Upper;
    fail(line, "bound column must be 'lower' or 'upper', got '" + cell + "'");
}

std::vector<std::string> resolve_names(const std::string& model,
                                       std::size_t arity,
                                       const std::vector<std::string>& header,
                                       const models::ModelRegistry& names) {
    if (names.contains(model)) {
        const auto& known = names.find(model).parameters;
        if (known.size() == arity) {
            return known;
        }
        log::logger()->warn("parameter ranges: {} declares {} bounds, model expects {}",
                            model, arity, known.size());
    }
    std::vector<std::string> out;
    out.reserve(arity);
    for (std::size_t i = 0; i < arity; ++i) {
        const std::size_t col = i + 2;
        if (col < header.size() && !header[col].empty()) {
            out.push_back(header[col]);
        } else {
            out.push_back("p" + std::to_string(i + 1));
        }
    }
    return out;
}

} // namespace

void ParameterRangeTable::add(const std::string& model, std::vector<ParameterSpec> specs) {
    if (model.empty()) {
        throw ConfigurationError("parameter ranges: empty model name");
    }
    if (contains(model)) {
        throw ConfigurationError("parameter ranges: duplicate row for model " + model);
    }
    if (specs.empty()) {
        throw ConfigurationError("parameter ranges: model " + model + " declares no parameters");
    }
    for (const auto& p : specs) {
        if (!std::isfinite(p.lower) || !std::isfinite(p.upper)) {
            throw ConfigurationError("parameter ranges: non-finite bound for " + model + "." + p.name);
        }
        if (p.lower > p.upper) {
            throw ConfigurationError("parameter ranges: lower > upper for " + model + "." + p.name);
        }
    }
    rows_.push_back({model, std::move(specs)});
}

bool ParameterRangeTable::contains(const std::string& model) const {
    return std::any_of(rows_.begin(), rows_.end(),
        [&](const Row& r) { return r.model == model; });
}

const std::vector<ParameterSpec>& ParameterRangeTable::at(const std::string& model) const {
    auto it = std::find_if(rows_.begin(), rows_.end(),
        [&](const Row& r) { return r.model == model; });
    if (it == rows_.end()) {
        throw ConfigurationError("model not found in parameter ranges: " + model);
    }
    return it->specs;
}

std::vector<std::string> ParameterRangeTable::models() const {
    std::vector<std::string> out;
    out.reserve(rows_.size());
    for (const auto& r : rows_) {
        out.push_back(r.model);
    }
    return out;
}

ParameterRangeTable load_parameter_ranges(std::istream& in, const models::ModelRegistry& names) {
    std::string line;
    std::size_t line_no = 0;
    std::vector<std::string> header;

    while (std::getline(in, line)) {
        ++line_no;
        const auto t = trim(line);
        if (t.empty() || t.front() == '#') continue;
        header = split(t);
        break;
    }
    if (header.size() < 3 || lower_case(header[0]) != "model") {
        throw ConfigurationError("parameter ranges: header must start with 'model,bound,' "
                                 "followed by parameter columns");
    }

    std::vector<RawModel> raw;
    while (std::getline(in, line)) {
        ++line_no;
        const auto t = trim(line);
        if (t.empty() || t.front() == '#') continue;

        auto cells = split(t);
        if (cells.size() > header.size()) {
            fail(line_no, "more cells than header columns");
        }
        cells.resize(header.size());
        if (cells[0].empty()) {
            fail(line_no, "missing model name");
        }

        RawRow row;
        row.line = line_no;
        row.kind = parse_kind(cells[1], line_no);
        bool seen_absent = false;
        for (std::size_t c = 2; c < cells.size(); ++c) {
            if (is_absent(cells[c])) {
                seen_absent = true;
                continue;
            }
            if (seen_absent) {
                fail(line_no, "value after a blank/NA cell in column '" + header[c] + "'");
            }
            row.values.push_back(parse_number(cells[c], line_no));
        }

        auto it = std::find_if(raw.begin(), raw.end(),
            [&](const RawModel& m) { return m.model == cells[0]; });
        if (it == raw.end()) {
            raw.push_back({cells[0], {}});
            it = std::prev(raw.end());
        }
        it->rows.push_back(std::move(row));
    }

    ParameterRangeTable table;
    for (const auto& m : raw) {
        if (m.rows.size() != 2) {
            fail(m.rows.front().line, "model " + m.model + " must have exactly two rows (lower, upper), found " +
                                      std::to_string(m.rows.size()));
        }
        const RawRow* lo = &m.rows[0];
        const RawRow* hi = &m.rows[1];
        if (lo->kind == BoundKind::Upper || hi->kind == BoundKind::Lower) {
            std::swap(lo, hi);
        }
        if (lo->kind == BoundKind::Upper || hi->kind == BoundKind::Lower) {
            fail(m.rows[1].line, "model " + m.model + " has two rows with the same bound label");
        }
        if (lo->values.size() != hi->values.size()) {
            fail(hi->line, "model " + m.model + " declares " + std::to_string(lo->values.size()) +
                           " lower and " + std::to_string(hi->values.size()) + " upper bounds");
        }

        const auto param_names = resolve_names(m.model, lo->values.size(), header, names);
        std::vector<ParameterSpec> specs;
        specs.reserve(lo->values.size());
        for (std::size_t i = 0; i < lo->values.size(); ++i) {
            specs.push_back({param_names[i], lo->values[i], hi->values[i]});
        }
        table.add(m.model, std::move(specs));
    }

    log::logger()->debug("parameter ranges: loaded {} models", table.size());
    return table;
}

ParameterRangeTable load_parameter_ranges(const std::string& path, const models::ModelRegistry& names) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("parameter ranges: cannot open " + path);
    }
    return load_parameter_ranges(in, names);
}

} // namespace pheno::data
