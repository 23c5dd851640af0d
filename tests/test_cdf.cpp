#include <gtest/gtest.h>
#include "cdf/cdf.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <vector>

using namespace bayeskit;

namespace {

Cdf<std::string> xyz() {
    return Cdf<std::string>(Pmf<std::string>{{"x", 1.0}, {"y", 1.0}, {"z", 1.0}});
}

} // namespace

// ─── Construction Tests ────────────────────────────────────────

TEST(CdfTest, BuildsCumulativeSums) {
    auto cdf = xyz();
    EXPECT_EQ(cdf.events(), (std::vector<std::string>{"x", "y", "z"}));
    EXPECT_EQ(cdf.cumulative(), (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_EQ(cdf.size(), 3);
    EXPECT_DOUBLE_EQ(cdf.totalWeight(), 3.0);
}

TEST(CdfTest, EmptySourceThrows) {
    Pmf<int> empty;
    EXPECT_THROW(Cdf<int>{empty}, RangeError);
}

TEST(CdfTest, CustomComparator) {
    Pmf<int> pmf{{1, 0.1}, {2, 0.2}, {3, 0.7}};
    Cdf<int> descending(pmf, std::greater<int>());
    EXPECT_EQ(descending.events(), (std::vector<int>{3, 2, 1}));
    EXPECT_NEAR(descending.cumulative()[0], 0.7, 1e-12);
    EXPECT_EQ(descending.percentile(0.5), 3);
}

TEST(CdfTest, SnapshotIgnoresLaterMutation) {
    Pmf<int> pmf{{1, 0.5}, {2, 0.5}};
    Cdf<int> cdf(pmf);
    pmf.set(3, 10.0);
    pmf.scale(0.0);

    EXPECT_EQ(cdf.size(), 2);
    EXPECT_DOUBLE_EQ(cdf.totalWeight(), 1.0);
    EXPECT_EQ(cdf.percentile(0.75), 2);
}

// ─── Percentile Tests ──────────────────────────────────────────

TEST(CdfTest, ExactBoundaryResolvesToLowerIndex) {
    auto cdf = xyz();
    EXPECT_EQ(cdf.floorIndex(2.0), 1);
    EXPECT_EQ(cdf.percentile(2.0), "y");
    EXPECT_EQ(cdf.percentile(1.0), "x");
    EXPECT_EQ(cdf.percentile(3.0), "z");
}

TEST(CdfTest, BetweenBoundariesUsesNextEvent) {
    auto cdf = xyz();
    EXPECT_EQ(cdf.percentile(0.0), "x");
    EXPECT_EQ(cdf.percentile(0.5), "x");
    EXPECT_EQ(cdf.percentile(1.5), "y");
    EXPECT_EQ(cdf.percentile(2.0001), "z");
}

TEST(CdfTest, Percentiles) {
    Pmf<int> pmf;
    pmf.uniformDist({1, 2, 3, 4, 5, 6, 7, 8, 9, 10,
                     11, 12, 13, 14, 15, 16, 17, 18, 19, 20});
    Cdf<int> cdf(pmf);

    auto bounds = cdf.percentiles({0.05, 0.95});
    ASSERT_EQ(bounds.size(), 2);
    // Cumulative mass at or below the lower event reaches 0.05, the
    // event before it stays below.
    EXPECT_GE(cdf.cumulativeAt(bounds[0]) + 1e-12, 0.05);
    EXPECT_EQ(bounds[0], 1);
    EXPECT_GE(cdf.cumulativeAt(bounds[1]) + 1e-12, 0.95);
    EXPECT_LT(cdf.cumulativeAt(bounds[1] - 1), 0.95);

    // Requested order is kept.
    auto reversed = cdf.percentiles({0.95, 0.05, 0.5});
    EXPECT_EQ(reversed[0], bounds[1]);
    EXPECT_EQ(reversed[1], bounds[0]);
}

TEST(CdfTest, CredibleInterval) {
    Pmf<int> pmf;
    for (int i = 1; i <= 100; i++) pmf.set(i, 1.0);
    Cdf<int> cdf(pmf);

    auto interval = cdf.credibleInterval(90.0);
    EXPECT_EQ(interval.first, 5);
    EXPECT_EQ(interval.second, 95);

    auto full = cdf.credibleInterval(100.0);
    EXPECT_EQ(full.first, 1);
    EXPECT_EQ(full.second, 100);

    EXPECT_THROW(cdf.credibleInterval(120.0), RangeError);
}

TEST(CdfTest, LeadingZeroWeightAtZero) {
    // No special casing: p=0 lands on the zero-length first span.
    Pmf<int> pmf{{1, 0.0}, {2, 0.5}, {3, 0.5}};
    Cdf<int> cdf(pmf);
    EXPECT_EQ(cdf.floorIndex(0.0), 0);
    EXPECT_EQ(cdf.percentile(0.0), 1);
    EXPECT_EQ(cdf.percentile(0.25), 2);
}

TEST(CdfTest, OutOfRangeThrows) {
    auto cdf = xyz();
    EXPECT_THROW(cdf.percentile(-0.01), RangeError);
    EXPECT_THROW(cdf.percentile(3.01), RangeError);
    EXPECT_THROW(cdf.floorIndex(std::nan("")), RangeError);
    EXPECT_THROW(cdf.percentiles({0.5, 4.0}), RangeError);
}

TEST(CdfTest, NaNMassRejectsQueries) {
    // Normalizing an all-zero map leaves NaN weights and a NaN total.
    Pmf<int> pmf{{1, 0.0}, {2, 0.0}, {3, 0.0}};
    pmf.normalize();
    Cdf<int> cdf(pmf);
    ASSERT_TRUE(std::isnan(cdf.totalWeight()));

    EXPECT_THROW(cdf.percentile(0.0), RangeError);
    EXPECT_THROW(cdf.floorIndex(0.5), RangeError);
    EXPECT_THROW(cdf.percentiles({0.05, 0.95}), RangeError);
    EXPECT_THROW(cdf.credibleInterval(90.0), RangeError);
}

TEST(CdfTest, InfiniteMassRejectsQueries) {
    Pmf<double> pmf{{1.0, 1.0}, {2.0, std::numeric_limits<double>::infinity()}};
    Cdf<double> cdf(pmf);
    EXPECT_THROW(cdf.percentile(0.5), RangeError);
}

TEST(CdfTest, CumulativeAt) {
    auto cdf = xyz();
    EXPECT_DOUBLE_EQ(cdf.cumulativeAt("a"), 0.0);
    EXPECT_DOUBLE_EQ(cdf.cumulativeAt("x"), 1.0);
    EXPECT_DOUBLE_EQ(cdf.cumulativeAt("xx"), 1.0);
    EXPECT_DOUBLE_EQ(cdf.cumulativeAt("z"), 3.0);
    EXPECT_DOUBLE_EQ(cdf.cumulativeAt("zz"), 3.0);
}
