#pragma once

#include "../common/types.hpp"

#include <cstddef> // for size_t
#include <string>
#include <vector>

namespace knntune {

    // ---------------------------------------------------------
    // Raw kernels
    // ---------------------------------------------------------
    // All kernels take two rows of `dim` contiguous values; they are pure and thread-safe.

    // Sum of squared differences (no sqrt). AVX2 when the build enables it.
    double squared_euclidean(const val_t* a, const val_t* b, size_t dim);

    double euclidean_distance(const val_t* a, const val_t* b, size_t dim);
    double manhattan_distance(const val_t* a, const val_t* b, size_t dim);
    double chebyshev_distance(const val_t* a, const val_t* b, size_t dim);

    // sum|a_i - b_i| / sum(|a_i| + |b_i|); 0 when both rows are all zeros.
    double sorensen_distance(const val_t* a, const val_t* b, size_t dim);

    enum class Reduction { Sum, Max };

    // reduce(|a_i - b_i|^m) ^ (1/m)
    double minkowski_distance(const val_t* a, const val_t* b, size_t dim, double m, Reduction reduction);


    // ---------------------------------------------------------
    // Metric
    // ---------------------------------------------------------

    enum class MetricKind { Euclidean, Manhattan, Chebyshev, Sorensen, Minkowski };

    // A closed, copyable tag for one member of the metric family.
    // Cheap to pass by value into every Trial and every forked worker.
    class Metric {
    public:
        static Metric euclidean();
        static Metric manhattan();
        static Metric chebyshev();
        static Metric sorensen();

        // Throws InvalidHyperparameter when m < 1 or not finite.
        static Metric minkowski(double m, Reduction reduction = Reduction::Sum);

        // Accepts short names (ED, MD, CD, SD), long names (euclidean, manhattan, chebyshev,
        // sorensen), "minkowski:<m>[:sum|max]" and anything name() prints.
        // Throws InvalidHyperparameter otherwise.
        static Metric parse(const std::string& name);

        // ED, MD, CD, SD: the family swept by a default grid search.
        static std::vector<Metric> family();

        double operator()(const val_t* a, const val_t* b, size_t dim) const;

        MetricKind kind() const { return kind_; }
        double exponent() const { return m_; }
        Reduction reduction() const { return reduction_; }

        // Stable display name: ED, MD, CD, SD, MK(m=3,sum)
        std::string name() const;

        bool operator==(const Metric& other) const {
            return kind_ == other.kind_ && m_ == other.m_ && reduction_ == other.reduction_;
        }
        bool operator!=(const Metric& other) const { return !(*this == other); }

    private:
        Metric(MetricKind kind, double m, Reduction reduction)
            : kind_(kind), m_(m), reduction_(reduction) {}

        MetricKind kind_;
        double m_;
        Reduction reduction_;
    };

} // namespace knntune
