#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>
#include <map>
#include <cmath>
#include <limits>

namespace knntune {

    // ---------------------------------------------------------
    // Primitive Aliases
    // ---------------------------------------------------------

    // Row index into a SampleStore (Supports up to 4 Billion rows)
    // We use 32-bit so index lists stay small when shared across workers.
    using row_t = uint32_t;

    // The data type for a single feature value.
    // 64-bit so the class index fits exactly in the label slot of a row.
    using val_t = double;

    // An owned feature vector (e.g., an unknown sample coming from a user)
    using Features = std::vector<val_t>;

    // A raw input record: field name -> unparsed text, as a CSV dict reader would produce.
    using Record = std::map<std::string, std::string>;

    // Row index lists produced by the Partitioner and shared by every Trial.
    using IndexList = std::vector<row_t>;


    // ---------------------------------------------------------
    // Search Structures
    // ---------------------------------------------------------

    // One candidate neighbor: its distance to the query, its position in the
    // training list, and the store row it refers to.
    struct Measured {
        double distance;
        size_t position;
        row_t row;

        // Candidates are ordered by distance, then by training-list position.
        // The position tie-break makes all selection strategies agree exactly.
        // A NaN distance ranks as +inf so the order stays strict weak.
        bool operator<(const Measured& other) const {
            double a = sort_key(distance);
            double b = sort_key(other.distance);
            if (a != b) return a < b;
            return position < other.position;
        }

        bool operator>(const Measured& other) const {
            return other < *this;
        }

        static double sort_key(double d) {
            return std::isnan(d) ? std::numeric_limits<double>::infinity() : d;
        }
    };

} // namespace knntune
