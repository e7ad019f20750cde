#include "../../include/core/partitioner.hpp"
#include "../../include/common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>
#include <random>
#include <sstream>

namespace knntune {

    uint64_t hash_features(const val_t* values, size_t dim) {
        uint64_t h = 14695981039346656037ull;
        for (size_t i = 0; i < dim; ++i) {
            // -0.0 and 0.0 compare equal, so they must hash equal too.
            val_t v = values[i] == 0.0 ? 0.0 : values[i];
            unsigned char bytes[sizeof(val_t)];
            std::memcpy(bytes, &v, sizeof(val_t));
            for (unsigned char b : bytes) {
                h ^= b;
                h *= 1099511628211ull;
            }
        }
        return h;
    }

    PartitionRule PartitionRule::every_nth(size_t n) {
        if (n == 0) throw KnnError("every_nth partition needs n >= 1");
        PartitionRule rule;
        rule.kind_ = Kind::EveryNth;
        rule.n_ = n;
        return rule;
    }

    PartitionRule PartitionRule::dealing(size_t n, size_t d) {
        if (d == 0 || n > d) throw KnnError("dealing partition needs 0 <= n <= d and d >= 1");
        PartitionRule rule;
        rule.kind_ = Kind::Dealing;
        rule.n_ = n;
        rule.d_ = d;
        return rule;
    }

    PartitionRule PartitionRule::hashed(size_t buckets, std::function<bool(size_t)> is_training_bucket) {
        if (buckets == 0) throw KnnError("hashed partition needs at least one bucket");
        PartitionRule rule;
        rule.kind_ = Kind::Hashed;
        rule.n_ = buckets;
        if (is_training_bucket) {
            rule.bucket_rule_ = std::move(is_training_bucket);
        } else {
            // Default: one bucket in five is testing.
            rule.bucket_rule_ = [](size_t bucket) { return bucket % 5 != 0; };
        }
        return rule;
    }

    PartitionRule PartitionRule::shuffled(double training_fraction, unsigned int seed) {
        if (!(training_fraction >= 0.0 && training_fraction <= 1.0)) {
            throw KnnError("shuffled partition needs a training fraction in [0, 1]");
        }
        PartitionRule rule;
        rule.kind_ = Kind::Shuffled;
        rule.fraction_ = training_fraction;
        rule.seed_ = seed;
        return rule;
    }

    PartitionRule PartitionRule::custom(std::function<bool(row_t)> is_testing) {
        if (!is_testing) throw KnnError("custom partition needs a predicate");
        PartitionRule rule;
        rule.kind_ = Kind::Custom;
        rule.testing_rule_ = std::move(is_testing);
        return rule;
    }

    std::string PartitionRule::describe() const {
        std::ostringstream out;
        switch (kind_) {
            case Kind::EveryNth: out << "every " << n_ << "th row is testing"; break;
            case Kind::Dealing:  out << n_ << " of every " << d_ << " rows are training"; break;
            case Kind::Hashed:   out << "feature hash into " << n_ << " buckets"; break;
            case Kind::Shuffled: out << "shuffled, " << fraction_ << " training, seed " << seed_; break;
            case Kind::Custom:   out << "custom predicate"; break;
        }
        return out.str();
    }

    Partition PartitionRule::apply(const SampleStore& store) const {
        Partition p;
        const size_t n = store.size();

        if (kind_ == Kind::Shuffled) {
            // One permutation per rule: the engine is reseeded from seed_ on every call,
            // so repeated applications (and every Trial) see the same split.
            IndexList order(n);
            std::iota(order.begin(), order.end(), row_t(0));
            std::mt19937 rng(seed_);
            std::shuffle(order.begin(), order.end(), rng);

            size_t split = static_cast<size_t>(std::floor(n * fraction_));
            p.training.assign(order.begin(), order.begin() + split);
            p.testing.assign(order.begin() + split, order.end());
            return p;
        }

        p.training.reserve(n);
        p.testing.reserve(n / 4 + 1);
        for (size_t i = 0; i < n; ++i) {
            row_t r = static_cast<row_t>(i);
            bool testing = false;
            switch (kind_) {
                case Kind::EveryNth:
                    testing = (i % n_ == 0);
                    break;
                case Kind::Dealing:
                    testing = !(i % d_ < n_);
                    break;
                case Kind::Hashed: {
                    size_t bucket = hash_features(store.features(r), store.dimensions()) % n_;
                    testing = !bucket_rule_(bucket);
                    break;
                }
                case Kind::Custom:
                    testing = testing_rule_(r);
                    break;
                case Kind::Shuffled:
                    break;
            }
            (testing ? p.testing : p.training).push_back(r);
        }
        return p;
    }

} // namespace knntune
