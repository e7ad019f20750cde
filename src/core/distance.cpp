#include "../../include/core/distance.hpp"
#include "../../include/common/errors.hpp"

#if defined(__AVX2__)
#include <immintrin.h> // The header for AVX intrinsics
#endif
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace knntune {

    double squared_euclidean(const val_t* a, const val_t* b, size_t dim) {
        double total_dist = 0.0;
        size_t i = 0;

#if defined(__AVX2__)
        // ---------------------------------------------------------
        // AVX2 Implementation (Process 4 doubles per cycle)
        // ---------------------------------------------------------
        __m256d sum = _mm256_setzero_pd();

        for (; i + 4 <= dim; i += 4) {
            // Rows sit at stride (dim + 1) in the store, so loads are unaligned.
            __m256d va = _mm256_loadu_pd(a + i);
            __m256d vb = _mm256_loadu_pd(b + i);
            __m256d diff = _mm256_sub_pd(va, vb);
            sum = _mm256_add_pd(sum, _mm256_mul_pd(diff, diff));
        }

        // Horizontal Sum (Reduce 4 lanes to 1 double)
        double temp[4];
        _mm256_storeu_pd(temp, sum);
        total_dist = (temp[0] + temp[1]) + (temp[2] + temp[3]);
#endif

        // Tail Case (or the whole row without AVX2)
        for (; i < dim; ++i) {
            double d = a[i] - b[i];
            total_dist += d * d;
        }

        return total_dist;
    }

    double euclidean_distance(const val_t* a, const val_t* b, size_t dim) {
        return std::sqrt(squared_euclidean(a, b, dim));
    }

    double manhattan_distance(const val_t* a, const val_t* b, size_t dim) {
        double total = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            total += std::fabs(a[i] - b[i]);
        }
        return total;
    }

    double chebyshev_distance(const val_t* a, const val_t* b, size_t dim) {
        double worst = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            worst = std::max(worst, std::fabs(a[i] - b[i]));
        }
        return worst;
    }

    double sorensen_distance(const val_t* a, const val_t* b, size_t dim) {
        double scale = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            scale = std::max(scale, std::max(std::fabs(a[i]), std::fabs(b[i])));
        }
        if (scale == 0.0) return 0.0;

        // Both sums run on values scaled into [-1, 1], so neither can overflow
        // (1e308 vs -1e308 would otherwise give inf / inf).
        double diff = 0.0;
        double total = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            double x = a[i] / scale;
            double y = b[i] / scale;
            diff += std::fabs(x - y);
            total += std::fabs(x) + std::fabs(y);
        }
        return diff / total;
    }

    double minkowski_distance(const val_t* a, const val_t* b, size_t dim, double m, Reduction reduction) {
        double acc = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            double term = std::pow(std::fabs(a[i] - b[i]), m);
            if (reduction == Reduction::Sum) {
                acc += term;
            } else {
                acc = std::max(acc, term);
            }
        }
        return std::pow(acc, 1.0 / m);
    }

    // ---------------------------------------------------------
    // Metric
    // ---------------------------------------------------------

    Metric Metric::euclidean() { return Metric(MetricKind::Euclidean, 2.0, Reduction::Sum); }
    Metric Metric::manhattan() { return Metric(MetricKind::Manhattan, 1.0, Reduction::Sum); }
    Metric Metric::chebyshev() { return Metric(MetricKind::Chebyshev, 1.0, Reduction::Max); }
    Metric Metric::sorensen()  { return Metric(MetricKind::Sorensen, 1.0, Reduction::Sum); }

    Metric Metric::minkowski(double m, Reduction reduction) {
        if (!std::isfinite(m) || m < 1.0) {
            std::ostringstream msg;
            msg << "Minkowski exponent must be >= 1, got " << m;
            throw InvalidHyperparameter(msg.str());
        }
        return Metric(MetricKind::Minkowski, m, reduction);
    }

    std::vector<Metric> Metric::family() {
        return {euclidean(), manhattan(), chebyshev(), sorensen()};
    }

    namespace {

        // "<m>[<sep>sum|max]"
        Metric parse_minkowski(std::string rest, char sep, const std::string& name) {
            Reduction reduction = Reduction::Sum;
            size_t cut = rest.find(sep);
            if (cut != std::string::npos) {
                std::string red = rest.substr(cut + 1);
                rest = rest.substr(0, cut);
                if (red == "max") {
                    reduction = Reduction::Max;
                } else if (red != "sum") {
                    throw InvalidHyperparameter("unknown reduction '" + red + "' in metric '" + name + "'");
                }
            }
            char* end = nullptr;
            double m = std::strtod(rest.c_str(), &end);
            if (rest.empty() || end != rest.c_str() + rest.size()) {
                throw InvalidHyperparameter("bad Minkowski exponent in metric '" + name + "'");
            }
            return Metric::minkowski(m, reduction);
        }

        // Shortest of 15 or 17 significant digits that reads back as the same double.
        std::string exponent_text(double m) {
            std::ostringstream out;
            out << std::setprecision(std::numeric_limits<double>::digits10) << m;
            if (std::strtod(out.str().c_str(), nullptr) != m) {
                out.str("");
                out << std::setprecision(std::numeric_limits<double>::max_digits10) << m;
            }
            return out.str();
        }

    } // namespace

    Metric Metric::parse(const std::string& name) {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });

        if (key == "ed" || key == "euclidean") return euclidean();
        if (key == "md" || key == "manhattan" || key == "cityblock") return manhattan();
        if (key == "cd" || key == "chebyshev") return chebyshev();
        if (key == "sd" || key == "sorensen") return sorensen();

        // minkowski:<m>[:sum|max], or the display form mk(m=<m>,sum|max)
        const std::string prefix = "minkowski:";
        const std::string display = "mk(m=";
        if (key.compare(0, prefix.size(), prefix) == 0) {
            return parse_minkowski(key.substr(prefix.size()), ':', name);
        }
        if (key.size() > display.size() && key.compare(0, display.size(), display) == 0 && key.back() == ')') {
            return parse_minkowski(key.substr(display.size(), key.size() - display.size() - 1), ',', name);
        }

        throw InvalidHyperparameter("unknown metric '" + name + "'");
    }

    double Metric::operator()(const val_t* a, const val_t* b, size_t dim) const {
        switch (kind_) {
            case MetricKind::Euclidean: return euclidean_distance(a, b, dim);
            case MetricKind::Manhattan: return manhattan_distance(a, b, dim);
            case MetricKind::Chebyshev: return chebyshev_distance(a, b, dim);
            case MetricKind::Sorensen:  return sorensen_distance(a, b, dim);
            case MetricKind::Minkowski: return minkowski_distance(a, b, dim, m_, reduction_);
        }
        return 0.0;
    }

    std::string Metric::name() const {
        switch (kind_) {
            case MetricKind::Euclidean: return "ED";
            case MetricKind::Manhattan: return "MD";
            case MetricKind::Chebyshev: return "CD";
            case MetricKind::Sorensen:  return "SD";
            case MetricKind::Minkowski: {
                std::ostringstream out;
                out << "MK(m=" << exponent_text(m_) << "," << (reduction_ == Reduction::Sum ? "sum" : "max") << ")";
                return out.str();
            }
        }
        return "?";
    }

} // namespace knntune
