#include <gtest/gtest.h>
#include "stats/order_statistics.h"
#include "core/error.h"
#include <algorithm>
#include <random>
#include <vector>

using namespace mobilitykit;

// ========== select_kth ==========

TEST(OrderStatisticsTest, test_select_kth_matches_sorted_position) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dist(-50, 50);
    for (int trial = 0; trial < 40; ++trial) {
        std::vector<double> values(1 + trial % 17);
        for (auto& v : values) v = dist(rng);

        std::vector<double> sorted = values;
        std::sort(sorted.begin(), sorted.end());
        for (size_t k = 0; k < values.size(); ++k) {
            EXPECT_DOUBLE_EQ(select_kth(values, k), sorted[k]) << "trial " << trial << " k " << k;
        }
    }
}

TEST(OrderStatisticsTest, test_select_kth_handles_duplicates) {
    std::vector<double> values = {5, 1, 5, 5, 2, 5, 1};
    EXPECT_DOUBLE_EQ(select_kth(values, 0), 1);
    EXPECT_DOUBLE_EQ(select_kth(values, 1), 1);
    EXPECT_DOUBLE_EQ(select_kth(values, 2), 2);
    EXPECT_DOUBLE_EQ(select_kth(values, 6), 5);
}

TEST(OrderStatisticsTest, test_select_kth_sorted_input_large) {
    // Worst-case shape for a fixed pivot must still complete.
    std::vector<double> values(5000);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i);
    EXPECT_DOUBLE_EQ(select_kth(values, 4321), 4321.0);
}

TEST(OrderStatisticsTest, test_select_kth_rejects_bad_input) {
    EXPECT_THROW(select_kth({}, 0), InvalidArgument);
    EXPECT_THROW(select_kth({1.0, 2.0}, 2), InvalidArgument);
}

TEST(OrderStatisticsTest, test_caller_data_not_reordered) {
    const std::vector<double> values = {9, 3, 7, 1};
    std::vector<double> copy = values;
    percentile(copy, 50);
    median(copy);
    detect_outliers_iqr(copy);
    EXPECT_EQ(copy, values);
}

// ========== percentile / median ==========

TEST(OrderStatisticsTest, test_percentile_95_of_deciles) {
    std::vector<double> values = {10, 20, 30, 40, 50, 60, 70, 80, 90, 100};
    double p95 = percentile(values, 95);
    EXPECT_GE(p95, 90);
    EXPECT_LE(p95, 100);
}

TEST(OrderStatisticsTest, test_percentile_rounds_index) {
    std::vector<double> values = {50, 10, 40, 20, 30};
    // index round(0.3 * 4) = round(1.2) = 1
    EXPECT_DOUBLE_EQ(percentile(values, 30), 20);
    // index round(0.4 * 4) = round(1.6) = 2
    EXPECT_DOUBLE_EQ(percentile(values, 40), 30);
    EXPECT_DOUBLE_EQ(percentile(values, 0), 10);
    EXPECT_DOUBLE_EQ(percentile(values, 100), 50);
}

TEST(OrderStatisticsTest, test_percentile_half_index_rounds_up) {
    std::vector<double> values = {60, 10, 50, 20, 40, 30};
    // index 0.5 * 5 = 2.5 rounds away from zero to 3
    EXPECT_DOUBLE_EQ(percentile(values, 50), 40);
}

TEST(OrderStatisticsTest, test_percentile_out_of_range) {
    std::vector<double> values = {1, 2, 3};
    EXPECT_THROW(percentile(values, -0.1), InvalidArgument);
    EXPECT_THROW(percentile(values, 100.5), InvalidArgument);
    EXPECT_THROW(percentile({}, 50), InvalidArgument);
}

TEST(OrderStatisticsTest, test_median_odd_and_even) {
    EXPECT_DOUBLE_EQ(median({3, 1, 2}), 2);
    EXPECT_DOUBLE_EQ(median({4, 1, 3, 2}), 2.5);
    EXPECT_DOUBLE_EQ(median({7}), 7);
    EXPECT_THROW(median({}), InvalidArgument);
}

// ========== IQR ==========

TEST(OrderStatisticsTest, test_iqr_flags_injected_extremes) {
    std::vector<double> values = {10, 12, 14, 16, 18, 20, 22, 24, 26, 28, 100, 150};
    auto outliers = detect_outliers_iqr(values);
    ASSERT_EQ(outliers.size(), 2u);
    EXPECT_EQ(outliers[0].index, 10u);
    EXPECT_DOUBLE_EQ(outliers[0].value, 100);
    EXPECT_EQ(outliers[1].index, 11u);
    EXPECT_DOUBLE_EQ(outliers[1].value, 150);
}

TEST(OrderStatisticsTest, test_quartile_fences) {
    std::vector<double> values = {10, 12, 14, 16, 18, 20, 22, 24, 26, 28, 100, 150};
    Quartiles q = quartiles(values);
    EXPECT_DOUBLE_EQ(q.q1, 16);
    EXPECT_DOUBLE_EQ(q.q3, 28);
    EXPECT_DOUBLE_EQ(q.iqr, 12);
    EXPECT_DOUBLE_EQ(q.lower_fence, -2);
    EXPECT_DOUBLE_EQ(q.upper_fence, 46);
}

TEST(OrderStatisticsTest, test_iqr_fewer_than_four_values) {
    EXPECT_TRUE(detect_outliers_iqr({}).empty());
    EXPECT_TRUE(detect_outliers_iqr({1, 1000, 2}).empty());
    EXPECT_THROW(quartiles({1, 2, 3}), InvalidArgument);
}

TEST(OrderStatisticsTest, test_iqr_low_outlier) {
    std::vector<double> values = {-500, 50, 51, 52, 53, 54, 55, 56};
    auto outliers = detect_outliers_iqr(values);
    ASSERT_EQ(outliers.size(), 1u);
    EXPECT_EQ(outliers[0].index, 0u);
}
