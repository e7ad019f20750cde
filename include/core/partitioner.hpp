#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../storage/sample_store.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace knntune {

    // Disjoint training / testing row lists whose union is every row exactly once.
    // Built once per tuning run and shared read-only by every Trial.
    struct Partition {
        IndexList training;
        IndexList testing;
    };

    // How rows are dealt into the two subsets. Every rule is deterministic:
    // the same rule over the same store always yields the same Partition.
    class PartitionRule {
    public:
        enum class Kind { EveryNth, Dealing, Hashed, Shuffled, Custom };

        // Row r is testing when r % n == 0.
        static PartitionRule every_nth(size_t n = config::TEST_EVERY);

        // Row r is training when r % d < n (e.g. 8 of every 10).
        static PartitionRule dealing(size_t n = 8, size_t d = 10);

        // Rows are bucketed by a hash of their feature values; the predicate
        // decides which buckets are training. Good spread on sorted input.
        static PartitionRule hashed(size_t buckets = config::HASH_BUCKETS,
                                    std::function<bool(size_t)> is_training_bucket = nullptr);

        // Seeded permutation; the first floor(N * training_fraction) rows are training.
        static PartitionRule shuffled(double training_fraction = 0.8,
                                      unsigned int seed = config::DEFAULT_SEED);

        // Caller-supplied positional predicate on the row index.
        static PartitionRule custom(std::function<bool(row_t)> is_testing);

        Kind kind() const { return kind_; }
        std::string describe() const;

        // Single linear pass over the store.
        Partition apply(const SampleStore& store) const;

    private:
        PartitionRule() = default;

        Kind kind_ = Kind::EveryNth;
        size_t n_ = config::TEST_EVERY;
        size_t d_ = 0;
        double fraction_ = 0.8;
        unsigned int seed_ = config::DEFAULT_SEED;
        std::function<bool(size_t)> bucket_rule_;
        std::function<bool(row_t)> testing_rule_;
    };

    inline Partition partition(const SampleStore& store, const PartitionRule& rule) {
        return rule.apply(store);
    }

    // FNV-1a over the raw bytes of a row's feature values.
    // Unlike std::hash it is identical across processes and runs.
    uint64_t hash_features(const val_t* values, size_t dim);

} // namespace knntune
