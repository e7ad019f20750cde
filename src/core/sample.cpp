#include "../../include/core/sample.hpp"

namespace knntune {

    namespace {

        // Prints "name=value, " for each feature, using the store's field names when known.
        void print_features(std::ostream& os, const val_t* values, size_t dim,
                            const std::vector<std::string>* names) {
            for (size_t i = 0; i < dim; ++i) {
                if (names && i < names->size()) {
                    os << (*names)[i];
                } else {
                    os << "f" << i;
                }
                os << "=" << values[i] << ", ";
            }
        }

    } // namespace

    bool KnownSample::operator==(const KnownSample& other) const {
        if (dimensions() != other.dimensions()) return false;
        if (label() != other.label()) return false;
        const val_t* a = features();
        const val_t* b = other.features();
        for (size_t i = 0; i < dimensions(); ++i) {
            if (a[i] != b[i]) return false;
        }
        return true;
    }

    std::vector<TrainingKnownSample> training_views(const SampleStore& store, const IndexList& rows) {
        std::vector<TrainingKnownSample> views;
        views.reserve(rows.size());
        for (row_t r : rows) views.emplace_back(store.at(r));
        return views;
    }

    std::vector<TestingKnownSample> testing_views(const SampleStore& store, const IndexList& rows) {
        std::vector<TestingKnownSample> views;
        views.reserve(rows.size());
        for (row_t r : rows) views.emplace_back(store.at(r));
        return views;
    }

    std::ostream& operator<<(std::ostream& os, const KnownSample& s) {
        os << "KnownSample(row=" << s.row() << ", ";
        print_features(os, s.features(), s.dimensions(), &s.store().schema().features);
        return os << "label='" << s.label() << "')";
    }

    std::ostream& operator<<(std::ostream& os, const TrainingKnownSample& s) {
        return os << "TrainingKnownSample(" << s.sample() << ")";
    }

    std::ostream& operator<<(std::ostream& os, const TestingKnownSample& s) {
        os << "TestingKnownSample(" << s.sample() << ", classification=";
        if (s.classification()) {
            os << "'" << *s.classification() << "'";
        } else {
            os << "None";
        }
        return os << ")";
    }

    std::ostream& operator<<(std::ostream& os, const UnknownSample& s) {
        os << "UnknownSample(";
        print_features(os, s.features().data(), s.dimensions(), nullptr);
        return os << ")";
    }

    std::ostream& operator<<(std::ostream& os, const ClassifiedSample& s) {
        os << "ClassifiedSample(";
        print_features(os, s.features().data(), s.features().size(), nullptr);
        return os << "classification='" << s.classification() << "')";
    }

} // namespace knntune
