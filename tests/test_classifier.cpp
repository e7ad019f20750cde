/**
 * Unit Tests for k nearest selection and voting
 *
 * Tests cover:
 * - Exact match classification
 * - All three strategies agree on random data
 * - Tie-breaking on equal distances and equal votes
 * - k validation
 * - Extreme magnitudes and NaN ordering
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "../include/common/errors.hpp"
#include "../include/core/classifier.hpp"
#include "../include/core/partitioner.hpp"
#include "test_helpers.hpp"

using namespace knntune;
using namespace knntune::testing_support;

class ClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        loaded_ = SampleStore::load(abcd_records(), make_schema(4));
        training_ = all_rows(*loaded_.store);
    }

    const SampleStore& store() const { return *loaded_.store; }

    LoadResult loaded_;
    IndexList training_;
};

TEST_F(ClassifierTest, ExactMatchWinsWithKOne) {
    Features query = {2, 3, 4, 5};
    EXPECT_EQ(classify_one(store(), training_, 1, Metric::manhattan(), query), "b");
}

TEST_F(ClassifierTest, NearestIsOrderedByDistance) {
    Features query = {3.9, 4.9, 5.9, 6.9};
    std::vector<Measured> n = nearest_sorted(3, Metric::euclidean(), training_, store(), query.data());

    ASSERT_EQ(n.size(), 3u);
    EXPECT_EQ(n[0].row, 3u);
    EXPECT_EQ(n[1].row, 2u);
    EXPECT_EQ(n[2].row, 1u);
    EXPECT_LE(n[0].distance, n[1].distance);
    EXPECT_LE(n[1].distance, n[2].distance);
}

TEST_F(ClassifierTest, EqualDistancesPreferEarlierTrainingPosition) {
    // (2.5, ...) sits exactly between rows 1 and 2.
    Features query = {2.5, 3.5, 4.5, 5.5};
    for (Strategy s : {Strategy::FullSort, Strategy::BoundedInsertion, Strategy::Heap}) {
        std::vector<Measured> n = nearest(s, 1, Metric::manhattan(), training_, store(), query.data());
        ASSERT_EQ(n.size(), 1u);
        EXPECT_EQ(n[0].row, 1u) << strategy_name(s);
    }

    IndexList reversed = {3, 2, 1, 0};
    EXPECT_EQ(classify(Strategy::Heap, 1, Metric::manhattan(), reversed, store(), query.data()), "c");
}

TEST_F(ClassifierTest, VoteTieGoesToFirstSeenLabel) {
    // b and c each get one vote; b is nearest.
    std::vector<Measured> neighbors = {{0.5, 0, 1}, {0.7, 1, 2}};
    EXPECT_EQ(vote(store(), neighbors), "b");

    std::vector<Measured> flipped = {{0.5, 0, 2}, {0.7, 1, 1}};
    EXPECT_EQ(vote(store(), flipped), "c");
}

TEST_F(ClassifierTest, VoteMajorityBeatsNearest) {
    std::vector<Record> records = {
        make_record(Features{0.0}, "near"),
        make_record(Features{1.0}, "far"),
        make_record(Features{1.1}, "far"),
    };
    LoadResult one_d = SampleStore::load(records, make_schema(1));
    IndexList rows = all_rows(*one_d.store);
    Features query = {0.2};

    EXPECT_EQ(classify_one(*one_d.store, rows, 1, Metric::euclidean(), query), "near");
    EXPECT_EQ(classify_one(*one_d.store, rows, 3, Metric::euclidean(), query), "far");
}

TEST_F(ClassifierTest, VoteWithoutNeighborsThrows) {
    EXPECT_THROW(vote(store(), {}), InvalidHyperparameter);
}

TEST_F(ClassifierTest, KOutOfRangeThrows) {
    Features query = {1, 2, 3, 4};
    EXPECT_THROW(classify_one(store(), training_, 0, Metric::euclidean(), query), InvalidHyperparameter);
    EXPECT_THROW(classify_one(store(), training_, -3, Metric::euclidean(), query), InvalidHyperparameter);
    EXPECT_THROW(classify_one(store(), training_, 5, Metric::euclidean(), query), InvalidHyperparameter);
    EXPECT_NO_THROW(classify_one(store(), training_, 4, Metric::euclidean(), query));
}

TEST_F(ClassifierTest, QueryDimensionMustMatchStore) {
    Features short_query = {1, 2, 3};
    EXPECT_THROW(classify_one(store(), training_, 1, Metric::euclidean(), short_query), InvalidHyperparameter);
}

TEST_F(ClassifierTest, StrategyNamesRoundTrip) {
    for (Strategy s : {Strategy::FullSort, Strategy::BoundedInsertion, Strategy::Heap}) {
        EXPECT_EQ(parse_strategy(strategy_name(s)), s);
    }
    EXPECT_EQ(parse_strategy("bisect"), Strategy::BoundedInsertion);
    EXPECT_THROW(parse_strategy("quickselect"), InvalidHyperparameter);
}

// All strategies must select identical neighbor lists, not just identical labels.
TEST_F(ClassifierTest, StrategiesAgreeOnRandomData) {
    LoadResult random = SampleStore::load(random_records(300, 4, 3, 99), make_schema(4));
    const SampleStore& big = *random.store;
    Partition split = partition(big, PartitionRule::every_nth(4));

    // Coarse values force plenty of equal distances.
    std::mt19937 rng(5);
    std::uniform_int_distribution<int> coarse(0, 9);

    for (const Metric& metric : Metric::family()) {
        for (int k : {1, 3, 7, 25}) {
            for (int q = 0; q < 10; ++q) {
                Features query;
                for (int d = 0; d < 4; ++d) query.push_back(coarse(rng));

                auto sorted = nearest_sorted(k, metric, split.training, big, query.data());
                auto bounded = nearest_bounded(k, metric, split.training, big, query.data());
                auto heap = nearest_heap(k, metric, split.training, big, query.data());

                ASSERT_EQ(sorted.size(), (size_t)k);
                ASSERT_EQ(bounded.size(), (size_t)k);
                ASSERT_EQ(heap.size(), (size_t)k);
                for (int i = 0; i < k; ++i) {
                    EXPECT_EQ(sorted[i].row, bounded[i].row) << metric.name() << " k=" << k;
                    EXPECT_EQ(sorted[i].row, heap[i].row) << metric.name() << " k=" << k;
                }
            }
        }
    }
}

TEST_F(ClassifierTest, KEqualToTrainingSizeUsesEveryRow) {
    Features query = {0, 0, 0, 0};
    for (Strategy s : {Strategy::FullSort, Strategy::BoundedInsertion, Strategy::Heap}) {
        std::vector<Measured> n = nearest(s, 4, Metric::chebyshev(), training_, store(), query.data());
        ASSERT_EQ(n.size(), 4u);
        EXPECT_EQ(n[0].row, 0u);
        EXPECT_EQ(n[3].row, 3u);
    }
}

// Finite but huge values: the Sorensen sums must not overflow into inf / inf.
TEST_F(ClassifierTest, ExtremeMagnitudesKeepStrategiesInAgreement) {
    std::vector<Record> records = {
        make_record(Features{1e308}, "a"),
        make_record(Features{-1e308}, "b"),
        make_record(Features{5.0}, "c"),
        make_record(Features{-1e308}, "d"),
        make_record(Features{1e308}, "e"),
        make_record(Features{3.0}, "f"),
    };
    LoadResult extreme = SampleStore::load(records, make_schema(1));
    ASSERT_EQ(extreme.store->size(), 6u);
    IndexList rows = all_rows(*extreme.store);
    Features query = {-1e308};

    for (row_t r : rows) {
        double d = sorensen_distance(extreme.store->features(r), query.data(), 1);
        EXPECT_FALSE(std::isnan(d)) << "row " << r;
        EXPECT_GE(d, 0.0);
        EXPECT_LE(d, 1.0);
    }
    EXPECT_DOUBLE_EQ(sorensen_distance(extreme.store->features(0), query.data(), 1), 1.0);
    EXPECT_DOUBLE_EQ(sorensen_distance(extreme.store->features(1), query.data(), 1), 0.0);

    for (int k = 1; k <= 6; ++k) {
        auto sorted = nearest_sorted(k, Metric::sorensen(), rows, *extreme.store, query.data());
        auto bounded = nearest_bounded(k, Metric::sorensen(), rows, *extreme.store, query.data());
        auto heap = nearest_heap(k, Metric::sorensen(), rows, *extreme.store, query.data());
        for (int i = 0; i < k; ++i) {
            EXPECT_EQ(sorted[i].row, bounded[i].row) << "k=" << k;
            EXPECT_EQ(sorted[i].row, heap[i].row) << "k=" << k;
        }
    }
    EXPECT_EQ(classify_one(*extreme.store, rows, 1, Metric::sorensen(), query, Strategy::BoundedInsertion), "b");
    EXPECT_EQ(classify_one(*extreme.store, rows, 1, Metric::sorensen(), query, Strategy::Heap), "b");
}

TEST_F(ClassifierTest, NanDistanceSortsAfterEverythingFinite) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    Measured finite = {1.0, 5, 0};
    Measured missing = {nan, 0, 1};
    Measured far = {inf, 1, 2};

    EXPECT_TRUE(finite < missing);
    EXPECT_FALSE(missing < finite);
    EXPECT_TRUE(missing < far);   // same key, earlier position
    EXPECT_FALSE(far < missing);
    EXPECT_FALSE(missing < missing);
}
