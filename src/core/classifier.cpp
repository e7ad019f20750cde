#include "../../include/core/classifier.hpp"
#include "../../include/common/errors.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace knntune {

    std::string strategy_name(Strategy strategy) {
        switch (strategy) {
            case Strategy::FullSort:         return "sort";
            case Strategy::BoundedInsertion: return "insertion";
            case Strategy::Heap:             return "heap";
        }
        return "?";
    }

    Strategy parse_strategy(const std::string& name) {
        if (name == "sort") return Strategy::FullSort;
        if (name == "insertion" || name == "bisect") return Strategy::BoundedInsertion;
        if (name == "heap") return Strategy::Heap;
        throw InvalidHyperparameter("unknown selection strategy '" + name + "'");
    }

    void check_k(int k, size_t training_size) {
        if (k < 1) {
            throw InvalidHyperparameter("k must be >= 1, got " + std::to_string(k));
        }
        if ((size_t)k > training_size) {
            throw InvalidHyperparameter("k=" + std::to_string(k) + " exceeds training set size "
                                        + std::to_string(training_size));
        }
    }

    std::vector<Measured> nearest_sorted(int k, const Metric& metric, const IndexList& training,
                                         const SampleStore& store, const val_t* query) {
        const size_t dim = store.dimensions();
        std::vector<Measured> all;
        all.reserve(training.size());
        for (size_t pos = 0; pos < training.size(); ++pos) {
            row_t r = training[pos];
            all.push_back({metric(store.features(r), query, dim), pos, r});
        }
        std::sort(all.begin(), all.end());
        all.resize((size_t)k);
        return all;
    }

    std::vector<Measured> nearest_bounded(int k, const Metric& metric, const IndexList& training,
                                          const SampleStore& store, const val_t* query) {
        const size_t dim = store.dimensions();

        // Seed with k "infinitely far" placeholders; real rows displace them one by one.
        // k <= |training| so every placeholder is gone by the end.
        const Measured placeholder = {std::numeric_limits<double>::infinity(),
                                      std::numeric_limits<size_t>::max(), 0};
        std::vector<Measured> k_nearest((size_t)k, placeholder);

        for (size_t pos = 0; pos < training.size(); ++pos) {
            row_t r = training[pos];
            Measured m = {metric(store.features(r), query, dim), pos, r};
            if (!(m < k_nearest.back())) continue;

            k_nearest.insert(std::upper_bound(k_nearest.begin(), k_nearest.end(), m), m);
            k_nearest.pop_back();
        }
        return k_nearest;
    }

    std::vector<Measured> nearest_heap(int k, const Metric& metric, const IndexList& training,
                                       const SampleStore& store, const val_t* query) {
        const size_t dim = store.dimensions();
        const size_t limit = (size_t)k;

        // Max-Heap on (distance, position): the front is the worst of the k kept so far.
        std::vector<Measured> heap;
        heap.reserve(limit);

        for (size_t pos = 0; pos < training.size(); ++pos) {
            row_t r = training[pos];
            Measured m = {metric(store.features(r), query, dim), pos, r};
            if (heap.size() < limit) {
                heap.push_back(m);
                std::push_heap(heap.begin(), heap.end());
            } else if (m < heap.front()) {
                std::pop_heap(heap.begin(), heap.end());
                heap.back() = m;
                std::push_heap(heap.begin(), heap.end());
            }
        }
        std::sort_heap(heap.begin(), heap.end()); // ascending
        return heap;
    }

    std::vector<Measured> nearest(Strategy strategy, int k, const Metric& metric, const IndexList& training,
                                  const SampleStore& store, const val_t* query) {
        switch (strategy) {
            case Strategy::FullSort:         return nearest_sorted(k, metric, training, store, query);
            case Strategy::BoundedInsertion: return nearest_bounded(k, metric, training, store, query);
            case Strategy::Heap:             return nearest_heap(k, metric, training, store, query);
        }
        throw InvalidHyperparameter("unknown selection strategy");
    }

    const std::string& vote(const SampleStore& store, const std::vector<Measured>& neighbors) {
        if (neighbors.empty()) {
            throw InvalidHyperparameter("cannot vote without neighbors");
        }

        // (class index, votes) in first-seen order.
        std::vector<std::pair<uint32_t, int>> tally;
        for (const Measured& m : neighbors) {
            uint32_t c = store.class_index(m.row);
            auto it = std::find_if(tally.begin(), tally.end(),
                                   [c](const std::pair<uint32_t, int>& t) { return t.first == c; });
            if (it == tally.end()) {
                tally.emplace_back(c, 1);
            } else {
                it->second++;
            }
        }

        // Strict '>' keeps the earliest label on ties.
        auto best = tally.begin();
        for (auto it = tally.begin() + 1; it != tally.end(); ++it) {
            if (it->second > best->second) best = it;
        }
        return store.classes()[best->first];
    }

    const std::string& classify(Strategy strategy, int k, const Metric& metric, const IndexList& training,
                                const SampleStore& store, const val_t* query) {
        check_k(k, training.size());
        return vote(store, nearest(strategy, k, metric, training, store, query));
    }

    std::string classify_one(const SampleStore& store, const IndexList& training, int k,
                             const Metric& metric, const Features& query, Strategy strategy) {
        if (query.size() != store.dimensions()) {
            throw InvalidHyperparameter("query has " + std::to_string(query.size()) + " features, store has "
                                        + std::to_string(store.dimensions()));
        }
        return classify(strategy, k, metric, training, store, query.data());
    }

} // namespace knntune
