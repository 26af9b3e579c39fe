#pragma once

#include "libpheno/calib/calibrator.hpp"
#include "libpheno/compare/comparison.hpp"

#include <string>

// Diagnostic figures as standalone SVG documents. Rendering never feeds
// back into the results it draws.
namespace pheno::plot {

// Measured vs predicted scatter with a 1:1 line and RMSE / null RMSE /
// AICc annotations. Records with a missing measured date are skipped.
std::string render_fit(const calib::CalibrationResult& result);

// Arrows from the first to the second model's mean prediction per record;
// unchanged records are drawn as faint points instead.
std::string render_arrows(const compare::ArrowPlot& plot);

// Per-model RMSE boxes with a dashed null-model reference line.
std::string render_boxplot(const compare::RmseBoxplot& plot);

// Throws std::runtime_error if the file cannot be written.
void write_svg(const std::string& path, const std::string& svg);

} // namespace pheno::plot
