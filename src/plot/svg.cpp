#include "libpheno/plot/svg.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pheno::plot {

namespace {

constexpr double WIDTH = 640.0;
constexpr double HEIGHT = 640.0;
constexpr double MARGIN = 70.0;

struct Range {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void include(double v) {
        if (!std::isfinite(v)) return;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    void finish() {
        if (!std::isfinite(lo) || !std::isfinite(hi)) {
            lo = 0.0;
            hi = 1.0;
        }
        if (hi - lo <= 0.0) {
            lo -= 1.0;
            hi += 1.0;
        }
    }
};

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '&': out += "&amp;"; break;
        default: out += ch;
        }
    }
    return out;
}

class Canvas {
public:
    Canvas(Range x, Range y) : x_(x), y_(y) {
        out_ << std::fixed << std::setprecision(2);
        out_ << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << WIDTH << "\" height=\"" << HEIGHT
             << "\" viewBox=\"0 0 " << WIDTH << ' ' << HEIGHT << "\">\n";
        out_ << "<rect x=\"0\" y=\"0\" width=\"" << WIDTH << "\" height=\"" << HEIGHT << "\" fill=\"white\"/>\n";
    }

    double px(double x) const { return MARGIN + (x - x_.lo) / (x_.hi - x_.lo) * (WIDTH - 2.0 * MARGIN); }
    double py(double y) const { return HEIGHT - MARGIN - (y - y_.lo) / (y_.hi - y_.lo) * (HEIGHT - 2.0 * MARGIN); }

    std::ostringstream& raw() { return out_; }

    void frame() {
        out_ << "<rect x=\"" << MARGIN << "\" y=\"" << MARGIN << "\" width=\"" << WIDTH - 2.0 * MARGIN
             << "\" height=\"" << HEIGHT - 2.0 * MARGIN << "\" fill=\"none\" stroke=\"black\"/>\n";
    }

    void line(double x0, double y0, double x1, double y1, const std::string& stroke,
              const std::string& extra = "") {
        out_ << "<line x1=\"" << px(x0) << "\" y1=\"" << py(y0) << "\" x2=\"" << px(x1) << "\" y2=\"" << py(y1)
             << "\" stroke=\"" << stroke << "\"" << (extra.empty() ? "" : " " + extra) << "/>\n";
    }

    void point(double x, double y, double r, const std::string& fill, double opacity = 1.0) {
        out_ << "<circle cx=\"" << px(x) << "\" cy=\"" << py(y) << "\" r=\"" << r << "\" fill=\"" << fill
             << "\" fill-opacity=\"" << opacity << "\"/>\n";
    }

    void text(double x_px, double y_px, const std::string& s, const std::string& anchor = "start",
              const std::string& extra = "") {
        out_ << "<text x=\"" << x_px << "\" y=\"" << y_px << "\" font-family=\"sans-serif\" font-size=\"13\""
             << " text-anchor=\"" << anchor << "\"" << (extra.empty() ? "" : " " + extra) << ">" << escape(s)
             << "</text>\n";
    }

    void labels(const std::string& title, const std::string& xlab, const std::string& ylab) {
        text(WIDTH / 2.0, MARGIN / 2.0, title, "middle");
        text(WIDTH / 2.0, HEIGHT - MARGIN / 3.0, xlab, "middle");
        std::ostringstream rot;
        rot << "transform=\"rotate(-90 " << MARGIN / 3.0 << ' ' << HEIGHT / 2.0 << ")\"";
        text(MARGIN / 3.0, HEIGHT / 2.0, ylab, "middle", rot.str());
    }

    std::string finish() {
        out_ << "</svg>\n";
        return out_.str();
    }

private:
    Range x_;
    Range y_;
    std::ostringstream out_;
};

std::string fixed(double v, int digits) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(digits) << v;
    return oss.str();
}

} // namespace

std::string render_fit(const calib::CalibrationResult& result) {
    Range x, y;
    for (std::size_t i = 0; i < result.measured.size(); ++i) {
        if (!std::isfinite(result.measured[i])) continue;
        x.include(result.measured[i]);
        y.include(result.predicted[i]);
    }
    x.finish();
    y.finish();

    Canvas c(x, y);
    c.frame();
    const double lo = std::max(x.lo, y.lo);
    const double hi = std::min(x.hi, y.hi);
    if (lo < hi) {
        c.line(lo, lo, hi, hi, "black");
    }
    for (std::size_t i = 0; i < result.measured.size(); ++i) {
        if (!std::isfinite(result.measured[i])) continue;
        c.point(result.measured[i], result.predicted[i], 3.0, "black");
    }

    c.text(MARGIN + 8.0, MARGIN + 18.0, "RMSE: " + fixed(result.rmse, 1));
    c.text(WIDTH / 2.0, MARGIN + 18.0, "RMSE NULL: " + fixed(result.rmse_null, 1), "middle");
    c.text(WIDTH - MARGIN - 8.0, HEIGHT - MARGIN - 10.0, "AICc: " + fixed(result.aic.aicc, 1), "end");
    c.labels(result.model + ", " + calib::to_string(result.method) + ", evaluations: " +
                 std::to_string(result.optimizer.evaluations()),
             "onset DOY Measured", "onset DOY Modelled");
    return c.finish();
}

std::string render_arrows(const compare::ArrowPlot& plot) {
    Range x, y;
    for (const auto& a : plot.arrows) {
        x.include(a.measured);
    }
    y.include(plot.y_min);
    y.include(plot.y_max);
    x.finish();
    y.finish();

    Canvas c(x, y);
    auto& out = c.raw();
    out << "<defs>\n";
    for (const auto& [id, colour] : {std::make_pair("rising", compare::kRisingColour),
                                     std::make_pair("falling", compare::kFallingColour)}) {
        out << "<marker id=\"" << id << "\" markerWidth=\"8\" markerHeight=\"8\" refX=\"6\" refY=\"3\" "
            << "orient=\"auto\"><path d=\"M0,0 L6,3 L0,6\" fill=\"none\" stroke=\"" << colour.hex()
            << "\"/></marker>\n";
    }
    out << "</defs>\n";

    c.frame();
    const double lo = std::max(x.lo, y.lo);
    const double hi = std::min(x.hi, y.hi);
    if (lo < hi) {
        c.line(lo, lo, hi, hi, "black", "stroke-dasharray=\"6,4\"");
    }

    for (const auto& a : plot.arrows) {
        if (!std::isfinite(a.measured)) continue;
        if (a.direction == compare::Direction::Unchanged) {
            c.point(a.measured, a.from, 1.5, "black", 0.5);
            continue;
        }
        const bool rising = a.direction == compare::Direction::Rising;
        c.line(a.measured, a.from, a.measured, a.to, a.colour.hex(),
               std::string("stroke-width=\"1.3\" marker-end=\"url(#") + (rising ? "rising" : "falling") + ")\"");
    }

    c.labels("Directional change from model: " + plot.from_model + " to " + plot.to_model,
             "Measured values (DOY)", "Estimated values (DOY)");
    return c.finish();
}

std::string render_boxplot(const compare::RmseBoxplot& plot) {
    Range x, y;
    x.include(0.5);
    x.include(static_cast<double>(plot.boxes.size()) + 0.5);
    y.include(0.0);
    y.include(plot.y_max);
    for (const auto& b : plot.boxes) {
        y.include(b.whisker_high);
    }
    x.finish();
    y.finish();

    Canvas c(x, y);
    c.frame();
    for (std::size_t i = 0; i < plot.boxes.size(); ++i) {
        const auto& b = plot.boxes[i];
        const std::string col = b.colour.hex();
        const double xc = static_cast<double>(i) + 1.0;
        const double half = 0.3;

        c.line(xc, b.whisker_low, xc, b.q1, col);
        c.line(xc, b.q3, xc, b.whisker_high, col);
        c.line(xc - half / 2.0, b.whisker_low, xc + half / 2.0, b.whisker_low, col);
        c.line(xc - half / 2.0, b.whisker_high, xc + half / 2.0, b.whisker_high, col);
        c.raw() << "<rect x=\"" << c.px(xc - half) << "\" y=\"" << c.py(b.q3) << "\" width=\""
                << c.px(xc + half) - c.px(xc - half) << "\" height=\"" << c.py(b.q1) - c.py(b.q3)
                << "\" fill=\"none\" stroke=\"" << col << "\"/>\n";
        c.line(xc - half, b.median, xc + half, b.median, col, "stroke-width=\"2\"");

        std::ostringstream rot;
        rot << "transform=\"rotate(-90 " << c.px(xc) << ' ' << HEIGHT - MARGIN + 10.0 << ")\"";
        c.text(c.px(xc), HEIGHT - MARGIN + 10.0, b.model, "end", rot.str());
    }

    if (!plot.boxes.empty()) {
        c.line(0.5, plot.null_rmse, static_cast<double>(plot.boxes.size()) + 0.5, plot.null_rmse, "black",
               "stroke-dasharray=\"6,4\"");
    }
    c.labels("", "", "RMSE (days)");
    return c.finish();
}

void write_svg(const std::string& path, const std::string& svg) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("write_svg: cannot open " + path);
    }
    out << svg;
    if (!out) {
        throw std::runtime_error("write_svg: failed writing " + path);
    }
}

} // namespace pheno::plot
