#pragma once

#include "../common/types.hpp"
#include "../storage/sample_store.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace knntune {

    // ---------------------------------------------------------
    // Flyweight views
    // ---------------------------------------------------------
    // A KnownSample is a (store, row) pair. It never copies the feature values,
    // so any number of views costs O(1) each on top of the single shared block.
    // The store must outlive every view taken from it.

    class KnownSample {
    public:
        KnownSample(const SampleStore& store, row_t row) : store_(&store), row_(row) {}

        row_t row() const { return row_; }
        const SampleStore& store() const { return *store_; }

        const val_t* features() const { return store_->features(row_); }
        size_t dimensions() const { return store_->dimensions(); }
        val_t operator[](size_t i) const { return features()[i]; }

        const std::string& label() const { return store_->label(row_); }

        // Owned copy of the feature values, for callers that must outlive the store.
        Features to_features() const {
            return Features(features(), features() + dimensions());
        }

        // Equal when features and label match, wherever the rows live.
        bool operator==(const KnownSample& other) const;
        bool operator!=(const KnownSample& other) const { return !(*this == other); }

    private:
        const SampleStore* store_;
        row_t row_;
    };

    class TrainingKnownSample {
    public:
        explicit TrainingKnownSample(KnownSample sample) : sample_(sample) {}

        const KnownSample& sample() const { return sample_; }

    private:
        KnownSample sample_;
    };

    // Held-out row. classification stays unset until a Trial tests it;
    // each test run overwrites it.
    class TestingKnownSample {
    public:
        explicit TestingKnownSample(KnownSample sample) : sample_(sample) {}

        const KnownSample& sample() const { return sample_; }

        const std::optional<std::string>& classification() const { return classification_; }
        void set_classification(std::string label) { classification_ = std::move(label); }
        void clear_classification() { classification_.reset(); }

        bool matches() const {
            return classification_.has_value() && *classification_ == sample_.label();
        }

    private:
        KnownSample sample_;
        std::optional<std::string> classification_;
    };

    // A user supplied sample. Owns its values; not part of any store.
    class UnknownSample {
    public:
        explicit UnknownSample(Features features) : features_(std::move(features)) {}

        const Features& features() const { return features_; }
        size_t dimensions() const { return features_.size(); }

    private:
        Features features_;
    };

    // Output of live classification: the unknown's values plus the assigned label.
    class ClassifiedSample {
    public:
        ClassifiedSample(std::string classification, const UnknownSample& unknown)
            : features_(unknown.features()), classification_(std::move(classification)) {}

        const Features& features() const { return features_; }
        const std::string& classification() const { return classification_; }

    private:
        const Features features_;
        const std::string classification_;
    };

    // Views over a whole partition, built on demand from an index list.
    std::vector<TrainingKnownSample> training_views(const SampleStore& store, const IndexList& rows);
    std::vector<TestingKnownSample> testing_views(const SampleStore& store, const IndexList& rows);

    std::ostream& operator<<(std::ostream& os, const KnownSample& s);
    std::ostream& operator<<(std::ostream& os, const TrainingKnownSample& s);
    std::ostream& operator<<(std::ostream& os, const TestingKnownSample& s);
    std::ostream& operator<<(std::ostream& os, const UnknownSample& s);
    std::ostream& operator<<(std::ostream& os, const ClassifiedSample& s);

} // namespace knntune
