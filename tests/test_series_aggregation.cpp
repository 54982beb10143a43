// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>
#include <kcenon/topology/timeseries/aggregate.h>
#include <kcenon/topology/timeseries/linear_regression.h>
#include <kcenon/topology/timeseries/series_ops.h>

#include <cmath>

namespace kcenon {
namespace topology {
namespace {

const timestamp t0 = from_unix(1699999200);
const duration step{60};

// =============================================================================
// Reduction functions
// =============================================================================

TEST(SeriesOpsTest, NanSumIgnoresMissing) {
    time_series ts(t0, step, {missing, 2, missing, 3});
    EXPECT_FLOAT_EQ(ts.reduce(series_ops::nan_sum), 5.0f);
}

TEST(SeriesOpsTest, NanSumOfAllMissingIsMissing) {
    time_series ts(t0, step, {missing, missing});
    EXPECT_TRUE(is_missing(ts.reduce(series_ops::nan_sum)));
    EXPECT_TRUE(is_missing(time_series().reduce(series_ops::nan_sum)));
}

TEST(SeriesOpsTest, AnyPrefersFirstDefined) {
    EXPECT_FLOAT_EQ(series_ops::any(t0, 1, 2), 1.0f);
    EXPECT_FLOAT_EQ(series_ops::any(t0, missing, 2), 2.0f);
    EXPECT_TRUE(is_missing(series_ops::any(t0, missing, missing)));
}

TEST(SeriesOpsTest, MaxAndMinSkipMissing) {
    time_series ts(t0, step, {missing, 4, 1, missing, 3});
    EXPECT_FLOAT_EQ(ts.reduce(series_ops::max), 4.0f);
    EXPECT_FLOAT_EQ(ts.reduce(series_ops::min), 1.0f);
}

TEST(SeriesOpsTest, DefinedAndNanToZero) {
    time_series ts(t0, step, {missing, 0, 5});
    auto defined = ts.map(series_ops::defined);
    EXPECT_EQ(defined.values(), (std::vector<float>{0, 1, 1}));
    auto zeroed = ts.map(series_ops::nan_to_zero);
    EXPECT_EQ(zeroed.values(), (std::vector<float>{0, 0, 5}));
}

TEST(SeriesOpsTest, MergeIntoEmptyAccumulatorTakesValue) {
    time_series v(t0, step, {1, 2});
    auto merged = series_ops::merge(time_series(), v, series_ops::nan_sum);
    EXPECT_EQ(merged.values(), v.values());

    auto twice = series_ops::merge(merged, v, series_ops::nan_sum);
    EXPECT_EQ(twice.values(), (std::vector<float>{2, 4}));
}

TEST(SeriesOpsTest, MergeKeepsAccumulatorOnShapeMismatch) {
    time_series acc(t0, step, {1, 2});
    time_series other(t0, step, {1, 2, 3});
    EXPECT_EQ(series_ops::merge(acc, other, series_ops::nan_sum).values(), acc.values());
}

// =============================================================================
// Aggregate
// =============================================================================

class AggregateTest : public ::testing::Test {
  protected:
    aggregate agg_;
};

TEST_F(AggregateTest, StartsEmpty) {
    EXPECT_TRUE(agg_.empty());
    EXPECT_TRUE(agg_.get().empty());
}

TEST_F(AggregateTest, SumsSeriesLazily) {
    EXPECT_TRUE(agg_.add(time_series(t0, step, {1, missing, 3})));
    EXPECT_TRUE(agg_.add(time_series(t0, step, {1, missing, missing})));
    EXPECT_TRUE(agg_.add(time_series(t0, step, {1, missing, 1})));

    const auto& result = agg_.get();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_FLOAT_EQ(result.values()[0], 3.0f);
    EXPECT_TRUE(is_missing(result.values()[1]));
    EXPECT_FLOAT_EQ(result.values()[2], 4.0f);

    EXPECT_TRUE(agg_.add(time_series(t0, step, {1, 1, 1})));
    EXPECT_FLOAT_EQ(agg_.get().values()[1], 1.0f);
}

TEST_F(AggregateTest, RejectsEmptyAndMismatchedSeries) {
    EXPECT_FALSE(agg_.add(time_series()));
    EXPECT_TRUE(agg_.empty());

    EXPECT_TRUE(agg_.add(time_series(t0, step, {1, 2})));
    EXPECT_FALSE(agg_.add(time_series(t0 + step, step, {1, 2})));
    EXPECT_FALSE(agg_.add(time_series(t0, step, {1, 2, 3})));
    EXPECT_EQ(agg_.get().values(), (std::vector<float>{1, 2}));
}

TEST(AggregateCombinerTest, UsesSuppliedFunction) {
    aggregate agg(series_ops::max);
    agg.add(time_series(t0, step, {1, 5}));
    agg.add(time_series(t0, step, {3, 2}));
    EXPECT_EQ(agg.get().values(), (std::vector<float>{3, 5}));
}

// =============================================================================
// Linear regression
// =============================================================================

TEST(LinearRegressionTest, FitsExactLine) {
    time_series ts(t0, step, {10, 16, 22, 28});
    auto lr = linear_regression::fit(ts);
    ASSERT_TRUE(lr.has_value());
    EXPECT_NEAR(lr->slope(), 0.1, 1e-9);
    EXPECT_NEAR(lr->calc(t0), 10.0f, 1e-3);
    EXPECT_NEAR(lr->calc(t0 + hour) - lr->calc(t0), 360.0f, 1e-2);
}

TEST(LinearRegressionTest, IgnoresMissingPoints) {
    time_series ts(t0, step, {10, missing, 22, missing});
    auto lr = linear_regression::fit(ts);
    ASSERT_TRUE(lr.has_value());
    EXPECT_NEAR(lr->calc(t0 + step), 16.0f, 1e-3);
}

TEST(LinearRegressionTest, NeedsTwoDefinedPoints) {
    EXPECT_FALSE(linear_regression::fit(time_series()).has_value());
    EXPECT_FALSE(linear_regression::fit(time_series(t0, step, {missing, 5, missing})).has_value());
}

} // namespace
} // namespace topology
} // namespace kcenon
