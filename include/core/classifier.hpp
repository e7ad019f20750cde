#pragma once

#include "../common/types.hpp"
#include "../storage/sample_store.hpp"
#include "distance.hpp"

#include <string>
#include <vector>

namespace knntune {

    // ---------------------------------------------------------
    // k nearest selection strategies
    // ---------------------------------------------------------
    // All three return the same k candidates in the same order: ascending
    // (distance, position-in-training-list). Only their cost differs.
    enum class Strategy {
        FullSort,          // measure all N, sort, keep the first k          O(N log N)
        BoundedInsertion,  // sorted k-buffer, reject anything past its max  O(N k) worst, O(N) typical
        Heap               // bounded max-heap of size k                     O(N log k)
    };

    std::string strategy_name(Strategy strategy);

    // "sort", "insertion" (or "bisect"), "heap". Throws InvalidHyperparameter otherwise.
    Strategy parse_strategy(const std::string& name);

    // Throws InvalidHyperparameter unless 1 <= k <= training_size.
    void check_k(int k, size_t training_size);

    std::vector<Measured> nearest_sorted(int k, const Metric& metric, const IndexList& training,
                                         const SampleStore& store, const val_t* query);

    std::vector<Measured> nearest_bounded(int k, const Metric& metric, const IndexList& training,
                                          const SampleStore& store, const val_t* query);

    std::vector<Measured> nearest_heap(int k, const Metric& metric, const IndexList& training,
                                       const SampleStore& store, const val_t* query);

    std::vector<Measured> nearest(Strategy strategy, int k, const Metric& metric, const IndexList& training,
                                  const SampleStore& store, const val_t* query);

    // Majority label among the neighbors. On a frequency tie the label seen first
    // while walking the neighbors nearest-first wins.
    const std::string& vote(const SampleStore& store, const std::vector<Measured>& neighbors);

    // k-NN over `training` rows of `store`. query points to store.dimensions() values.
    // k is validated on every call; Trial validates once and calls nearest() + vote() directly.
    const std::string& classify(Strategy strategy, int k, const Metric& metric, const IndexList& training,
                                const SampleStore& store, const val_t* query);

    // Live classification entry point, usable once tuning picked (k, metric).
    // Also checks the query's dimension against the store.
    std::string classify_one(const SampleStore& store, const IndexList& training, int k,
                             const Metric& metric, const Features& query,
                             Strategy strategy = Strategy::FullSort);

} // namespace knntune
