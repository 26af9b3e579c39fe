#include "libpheno/compare/comparison.hpp"
#include "libpheno/data/parameter_ranges.hpp"
#include "libpheno/data/synthetic.hpp"
#include "libpheno/plot/svg.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// usage: comparison_demo <parameter_ranges.csv> [runs]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <parameter_ranges.csv> [runs]\n";
        return 2;
    }
    try {
        const auto ranges = pheno::data::load_parameter_ranges(std::string(argv[1]));

        pheno::data::SyntheticConfig syn;
        syn.sites = 6;
        syn.years = 6;
        auto dataset = pheno::data::synthetic_drivers(syn);
        pheno::data::assign_transition_dates(dataset, pheno::models::ModelRegistry::builtin().find("PTT"),
                                             {95.0, 3.0, 120.0}, 2.0);

        pheno::calib::OptimizerControl control;
        control.max_calls = 1500;

        pheno::compare::ComparisonConfig cfg;
        cfg.runs = (argc > 2) ? std::stoi(argv[2]) : 4;

        const std::vector<std::string> models = {"TT", "PTT", "M1", "LIN"};
        const auto comparison = pheno::compare::model_comparison(
            dataset, models, pheno::calib::Method::SimulatedAnnealing, control, ranges, cfg);

        const auto boxes = pheno::compare::rmse_boxplot(comparison);
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "RMSE over " << cfg.runs << " runs (null model " << boxes.null_rmse << "):\n";
        for (const auto& b : boxes.boxes) {
            std::cout << "  " << std::setw(4) << b.model << "  mean=" << b.mean << " sd=" << b.sd
                      << " median=" << b.median << "\n";
        }

        const auto arrows = pheno::compare::arrow_plot(comparison);
        std::size_t rising = 0, falling = 0, unchanged = 0;
        for (const auto& a : arrows.arrows) {
            switch (a.direction) {
            case pheno::compare::Direction::Rising: ++rising; break;
            case pheno::compare::Direction::Falling: ++falling; break;
            case pheno::compare::Direction::Unchanged: ++unchanged; break;
            }
        }
        std::cout << "\n" << arrows.from_model << " -> " << arrows.to_model << ": " << rising << " later, "
                  << falling << " earlier, " << unchanged << " unchanged\n";

        pheno::plot::write_svg("comparison_boxplot.svg", pheno::plot::render_boxplot(boxes));
        pheno::plot::write_svg("comparison_arrows.svg", pheno::plot::render_arrows(arrows));
        std::cout << "Wrote comparison_boxplot.svg, comparison_arrows.svg\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
