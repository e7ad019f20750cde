#pragma once

#include "../common/types.hpp"
#include "../storage/sample_store.hpp"
#include "classifier.hpp"
#include "distance.hpp"
#include "sample.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace knntune {

    // Outcome of one Trial as reported by the tuner.
    // A failed trial carries the error text; its quality is meaningless.
    struct TrialResult {
        int k = 0;
        std::string metric;
        double quality = 0.0;
        double elapsed_ms = 0.0;
        std::string error;

        bool ok() const { return error.empty(); }
    };

    std::ostream& operator<<(std::ostream& os, const TrialResult& r);

    // One hyperparameter configuration (k, metric, strategy) over a fixed split.
    //
    // A Trial borrows the store and both index lists; they must stay alive and
    // unchanged for as long as the Trial is used. The Trial itself never writes to them.
    // When the borrowed data has an owner (see tie_to), a Trial that outlives it
    // throws KnnError instead of reading released memory.
    class Trial {
    public:
        // Throws InvalidHyperparameter for k outside [1, |training|] and
        // std::out_of_range for an index list entry past the end of the store.
        Trial(int k, Metric metric, const SampleStore& store,
              const IndexList& training, const IndexList& testing,
              Strategy strategy = Strategy::FullSort);

        // Classifies every testing row and returns correct / total.
        // Throws EmptyTestSet when there is nothing to test.
        double test();

        // Same, and records each sample's classification (overwriting any earlier run).
        // The views must come from this Trial's store.
        double test(std::vector<TestingKnownSample>& samples);

        std::string classify(const val_t* query) const;
        ClassifiedSample classify(const UnknownSample& unknown) const;

        int k() const { return k_; }
        const Metric& metric() const { return metric_; }
        Strategy strategy() const { return strategy_; }
        const SampleStore& store() const { return store_; }
        const IndexList& training() const { return training_; }
        const IndexList& testing() const { return testing_; }

        // Unset until test() has run.
        const std::optional<double>& quality() const { return quality_; }
        double elapsed_ms() const { return elapsed_ms_; }

        TrialResult result() const;

        // Ties the Trial to whatever owns its store and index lists.
        void tie_to(std::weak_ptr<const void> owner);

    private:
        void check_inputs() const;

        int k_;
        Metric metric_;
        Strategy strategy_;
        const SampleStore& store_;
        const IndexList& training_;
        const IndexList& testing_;

        std::weak_ptr<const void> owner_;
        bool tied_ = false;

        std::optional<double> quality_;
        double elapsed_ms_ = 0.0;
    };

} // namespace knntune
