#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../runtime/executor.hpp"
#include "../storage/sample_store.hpp"
#include "classifier.hpp"
#include "distance.hpp"
#include "partitioner.hpp"
#include "trial.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace knntune {

    struct TunerConfig {
        ExecutorKind executor = ExecutorKind::Processes;
        size_t workers = config::DEFAULT_WORKERS;
        Strategy strategy = Strategy::FullSort;
        bool verbose = false;

        // Called in the worker right before a trial runs. Anything it throws fails
        // that trial alone, exactly as if Trial::test had thrown.
        std::function<void(const Trial&)> on_start;
    };

    // first, first + step, ... while < last. Throws InvalidHyperparameter for step <= 0.
    std::vector<int> k_range(int first = config::K_FIRST, int last = config::K_LAST, int step = config::K_STEP);

    // Exhaustive grid search over (k, metric).
    class Tuner {
    public:
        explicit Tuner(TunerConfig config = TunerConfig()) : config_(config) {}

        // One Trial per (k, metric) pair, k-major. Every Trial is constructed (and
        // validated) before anything is scheduled, so an InvalidHyperparameter never
        // reaches a worker. EmptyTestSet is raised up front for an empty testing list.
        //
        // Returns exactly one result per pair, in completion order. A trial that throws
        // or whose worker dies comes back with ok() == false and a WorkerFailure message.
        std::vector<TrialResult> tune(const std::vector<int>& k_values,
                                      const std::vector<Metric>& metrics,
                                      const SampleStore& store,
                                      const IndexList& training,
                                      const IndexList& testing) const;

        std::vector<TrialResult> tune(const std::vector<int>& k_values,
                                      const std::vector<Metric>& metrics,
                                      const SampleStore& store,
                                      const Partition& partition) const {
            return tune(k_values, metrics, store, partition.training, partition.testing);
        }

        const TunerConfig& config() const { return config_; }

    private:
        TunerConfig config_;
    };

    // Successful results by descending quality, then ascending elapsed time,
    // then (k, metric name); failed trials last.
    std::vector<TrialResult> rank(std::vector<TrialResult> results);

    // Top-ranked successful result, if there is one.
    std::optional<TrialResult> best(const std::vector<TrialResult>& results);

} // namespace knntune
