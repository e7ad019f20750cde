/**
 * Unit Tests for the distance kernels and Metric
 *
 * Tests cover:
 * - Reference values for the four family metrics
 * - Metric axioms on random rows
 * - Minkowski reductions
 * - Parsing and naming, including parsing a display name back
 */

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <vector>

#include "../include/common/errors.hpp"
#include "../include/core/distance.hpp"

using namespace knntune;

class DistanceTest : public ::testing::Test {
protected:
    const std::vector<val_t> s1_ = {5.1, 3.5, 1.4, 0.2};
    const std::vector<val_t> u_ = {7.9, 3.2, 4.7, 1.4};
};

TEST_F(DistanceTest, EuclideanReferenceValue) {
    EXPECT_NEAR(euclidean_distance(s1_.data(), u_.data(), 4), 4.50111097, 1e-8);
    EXPECT_NEAR(squared_euclidean(s1_.data(), u_.data(), 4), 20.26, 1e-9);
}

TEST_F(DistanceTest, ManhattanReferenceValue) {
    EXPECT_NEAR(manhattan_distance(s1_.data(), u_.data(), 4), 7.6, 1e-9);
}

TEST_F(DistanceTest, ChebyshevReferenceValue) {
    EXPECT_NEAR(chebyshev_distance(s1_.data(), u_.data(), 4), 3.3, 1e-9);
}

TEST_F(DistanceTest, SorensenReferenceValue) {
    EXPECT_NEAR(sorensen_distance(s1_.data(), u_.data(), 4), 0.2773722627, 1e-9);
}

TEST_F(DistanceTest, SorensenOfTwoZeroRowsIsZero) {
    std::vector<val_t> zero(4, 0.0);
    EXPECT_EQ(sorensen_distance(zero.data(), zero.data(), 4), 0.0);
}

TEST_F(DistanceTest, SquaredEuclideanHandlesSimdTail) {
    // 7 values: one full 4-wide block plus a 3 value tail.
    std::vector<val_t> a = {1, 2, 3, 4, 5, 6, 7};
    std::vector<val_t> b = {0, 0, 0, 0, 0, 0, 0};
    EXPECT_DOUBLE_EQ(squared_euclidean(a.data(), b.data(), 7), 140.0);
}

TEST_F(DistanceTest, MinkowskiMatchesFamilyMembers) {
    EXPECT_NEAR(minkowski_distance(s1_.data(), u_.data(), 4, 1.0, Reduction::Sum),
                manhattan_distance(s1_.data(), u_.data(), 4), 1e-9);
    EXPECT_NEAR(minkowski_distance(s1_.data(), u_.data(), 4, 2.0, Reduction::Sum),
                euclidean_distance(s1_.data(), u_.data(), 4), 1e-9);
    EXPECT_NEAR(minkowski_distance(s1_.data(), u_.data(), 4, 1.0, Reduction::Max),
                chebyshev_distance(s1_.data(), u_.data(), 4), 1e-9);
    EXPECT_NEAR(minkowski_distance(s1_.data(), u_.data(), 4, 3.0, Reduction::Max), 3.3, 1e-9);
}

TEST_F(DistanceTest, FamilyMetricsAreMetrics) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> value(0.1, 10.0);

    for (const Metric& metric : Metric::family()) {
        for (int trial = 0; trial < 50; ++trial) {
            std::vector<val_t> a(5), b(5);
            for (size_t i = 0; i < 5; ++i) {
                a[i] = value(rng);
                b[i] = value(rng);
            }
            EXPECT_EQ(metric(a.data(), a.data(), 5), 0.0) << metric.name();
            EXPECT_GE(metric(a.data(), b.data(), 5), 0.0) << metric.name();
            EXPECT_DOUBLE_EQ(metric(a.data(), b.data(), 5), metric(b.data(), a.data(), 5)) << metric.name();
        }
    }
}

TEST_F(DistanceTest, MetricDispatchesToKernel) {
    EXPECT_DOUBLE_EQ(Metric::manhattan()(s1_.data(), u_.data(), 4), manhattan_distance(s1_.data(), u_.data(), 4));
    EXPECT_DOUBLE_EQ(Metric::sorensen()(s1_.data(), u_.data(), 4), sorensen_distance(s1_.data(), u_.data(), 4));
}

TEST_F(DistanceTest, FamilyIsEdMdCdSd) {
    std::vector<Metric> family = Metric::family();
    ASSERT_EQ(family.size(), 4u);
    EXPECT_EQ(family[0].name(), "ED");
    EXPECT_EQ(family[1].name(), "MD");
    EXPECT_EQ(family[2].name(), "CD");
    EXPECT_EQ(family[3].name(), "SD");
}

TEST_F(DistanceTest, ParseAcceptsShortAndLongNames) {
    EXPECT_EQ(Metric::parse("ED"), Metric::euclidean());
    EXPECT_EQ(Metric::parse("manhattan"), Metric::manhattan());
    EXPECT_EQ(Metric::parse("CityBlock"), Metric::manhattan());
    EXPECT_EQ(Metric::parse("cd"), Metric::chebyshev());
    EXPECT_EQ(Metric::parse("Sorensen"), Metric::sorensen());
}

TEST_F(DistanceTest, ParseMinkowski) {
    Metric m = Metric::parse("minkowski:3");
    EXPECT_EQ(m.kind(), MetricKind::Minkowski);
    EXPECT_DOUBLE_EQ(m.exponent(), 3.0);
    EXPECT_EQ(m.reduction(), Reduction::Sum);
    EXPECT_EQ(m.name(), "MK(m=3,sum)");

    Metric mx = Metric::parse("minkowski:2.5:max");
    EXPECT_EQ(mx.reduction(), Reduction::Max);
    EXPECT_EQ(mx.name(), "MK(m=2.5,max)");
    EXPECT_NE(m, mx);
}

TEST_F(DistanceTest, DisplayNameParsesBack) {
    std::vector<Metric> metrics = Metric::family();
    metrics.push_back(Metric::minkowski(3));
    metrics.push_back(Metric::minkowski(2.5, Reduction::Max));
    metrics.push_back(Metric::minkowski(1.1));
    metrics.push_back(Metric::minkowski(1.0 / 3.0 + 1.0, Reduction::Max));

    for (const Metric& m : metrics) {
        EXPECT_EQ(Metric::parse(m.name()), m) << m.name();
    }
    EXPECT_EQ(Metric::minkowski(1.1).name(), "MK(m=1.1,sum)");
    EXPECT_EQ(Metric::parse("mk(m=4,MAX)"), Metric::minkowski(4, Reduction::Max));
    EXPECT_THROW(Metric::parse("MK(m=4,avg)"), InvalidHyperparameter);
    EXPECT_THROW(Metric::parse("MK(m=,sum)"), InvalidHyperparameter);
}

TEST_F(DistanceTest, ParseRejectsUnknownNames) {
    EXPECT_THROW(Metric::parse("cosine"), InvalidHyperparameter);
    EXPECT_THROW(Metric::parse("minkowski:"), InvalidHyperparameter);
    EXPECT_THROW(Metric::parse("minkowski:2:avg"), InvalidHyperparameter);
    EXPECT_THROW(Metric::parse("minkowski:two"), InvalidHyperparameter);
}

TEST_F(DistanceTest, MinkowskiExponentBelowOneThrows) {
    EXPECT_THROW(Metric::minkowski(0.5), InvalidHyperparameter);
    EXPECT_THROW(Metric::minkowski(NAN), InvalidHyperparameter);
    EXPECT_THROW(Metric::parse("minkowski:0"), InvalidHyperparameter);
    EXPECT_NO_THROW(Metric::minkowski(1.0));
}
