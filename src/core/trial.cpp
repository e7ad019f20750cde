#include "../../include/core/trial.hpp"
#include "../../include/common/errors.hpp"

#include <chrono>
#include <iomanip>
#include <stdexcept>

namespace knntune {

    namespace {

        void check_rows(const IndexList& rows, const SampleStore& store, const char* which) {
            for (row_t r : rows) {
                if (r >= store.size()) {
                    throw std::out_of_range(std::string(which) + " row " + std::to_string(r)
                                            + " is past the end of the store (size "
                                            + std::to_string(store.size()) + ")");
                }
            }
        }

    } // namespace

    std::ostream& operator<<(std::ostream& os, const TrialResult& r) {
        os << "k=" << std::setw(2) << r.k << " " << std::left << std::setw(4) << r.metric << std::right;
        if (!r.ok()) {
            return os << " FAILED: " << r.error;
        }
        return os << " quality=" << std::fixed << std::setprecision(3) << r.quality
                  << " elapsed=" << r.elapsed_ms << "ms" << std::defaultfloat;
    }

    Trial::Trial(int k, Metric metric, const SampleStore& store,
                 const IndexList& training, const IndexList& testing,
                 Strategy strategy)
        : k_(k), metric_(metric), strategy_(strategy),
          store_(store), training_(training), testing_(testing)
    {
        check_k(k, training.size());
        check_rows(training, store, "training");
        check_rows(testing, store, "testing");
    }

    void Trial::tie_to(std::weak_ptr<const void> owner) {
        owner_ = std::move(owner);
        tied_ = true;
    }

    void Trial::check_inputs() const {
        if (tied_ && owner_.expired()) {
            throw KnnError("trial k=" + std::to_string(k_) + " metric=" + metric_.name()
                           + " outlived its training data (reloaded or destroyed)");
        }
    }

    double Trial::test() {
        check_inputs();
        if (testing_.empty()) {
            throw EmptyTestSet();
        }

        auto start = std::chrono::high_resolution_clock::now();

        size_t pass_count = 0;
        for (row_t r : testing_) {
            auto neighbors = nearest(strategy_, k_, metric_, training_, store_, store_.features(r));
            if (store_.label(r) == vote(store_, neighbors)) {
                pass_count++;
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        elapsed_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
        quality_ = (double)pass_count / (double)testing_.size();
        return *quality_;
    }

    double Trial::test(std::vector<TestingKnownSample>& samples) {
        check_inputs();
        if (samples.empty()) {
            throw EmptyTestSet();
        }
        for (const auto& s : samples) {
            if (&s.sample().store() != &store_) {
                throw KnnError("testing sample row " + std::to_string(s.sample().row())
                               + " belongs to a different store");
            }
        }

        auto start = std::chrono::high_resolution_clock::now();

        size_t pass_count = 0;
        for (auto& s : samples) {
            s.set_classification(classify(s.sample().features()));
            if (s.matches()) pass_count++;
        }

        auto end = std::chrono::high_resolution_clock::now();
        elapsed_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
        quality_ = (double)pass_count / (double)samples.size();
        return *quality_;
    }

    std::string Trial::classify(const val_t* query) const {
        check_inputs();
        return vote(store_, nearest(strategy_, k_, metric_, training_, store_, query));
    }

    ClassifiedSample Trial::classify(const UnknownSample& unknown) const {
        check_inputs();
        if (unknown.dimensions() != store_.dimensions()) {
            throw InvalidHyperparameter("unknown sample has " + std::to_string(unknown.dimensions())
                                        + " features, store has " + std::to_string(store_.dimensions()));
        }
        return ClassifiedSample(classify(unknown.features().data()), unknown);
    }

    TrialResult Trial::result() const {
        TrialResult r;
        r.k = k_;
        r.metric = metric_.name();
        r.quality = quality_.value_or(0.0);
        r.elapsed_ms = elapsed_ms_;
        if (!quality_) r.error = "not tested";
        return r;
    }

} // namespace knntune
