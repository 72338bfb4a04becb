#include <gtest/gtest.h>
#include "core/session.h"
#include "index/search_tree.h"
#include "queue/top_k.h"
#include "search/rabin_karp.h"
#include "stats/anomaly.h"
#include "stats/order_statistics.h"
#include "stats/sliding_window.h"
#include <string>
#include <utility>
#include <vector>

using namespace mobilitykit;

namespace {

struct Trip {
    int id;
    std::string vendor;
    std::string pickup;
    std::string dropoff;
    double minutes;
};

std::vector<Trip> load_fixture() {
    return {
        {1, "CMT", "Midtown", "Chelsea", 12},
        {2, "VTS", "Chelsea", "SoHo", 9},
        {3, "CMT", "SoHo", "Tribeca", 6},
        {4, "VTS", "Midtown", "Harlem", 22},
        {5, "CMT", "Harlem", "Bronx", 15},
        {6, "VTS", "Tribeca", "Midtown", 18},
        {7, "CMT", "Queens", "Astoria", 11},
        {8, "VTS", "SoHo", "Chelsea", 8},
        {9, "CMT", "Midtown", "JFK", 95},
        {10, "VTS", "Bronx", "Harlem", 14},
        {11, "CMT", "Astoria", "Queens", 7},
        {12, "VTS", "Harlem", "Midtown", 21},
    };
}

std::vector<double> durations(const std::vector<Trip>& trips) {
    std::vector<double> out;
    for (const auto& t : trips) out.push_back(t.minutes);
    return out;
}

}  // namespace

TEST(TripAnalysisTest, test_airport_trip_flagged_by_both_detectors) {
    auto trips = load_fixture();
    auto values = durations(trips);

    auto outliers = detect_outliers_iqr(values);
    ASSERT_EQ(outliers.size(), 1u);
    EXPECT_EQ(trips[outliers[0].index].dropoff, "JFK");

    auto anomalies = detect_anomalies_zscore(values, 3.0);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].index, outliers[0].index);
}

TEST(TripAnalysisTest, test_duration_index_range_and_top_k) {
    auto trips = load_fixture();

    BinarySearchTree<double, int> index;
    std::vector<std::pair<double, int>> ranked;
    for (const auto& t : trips) {
        index.insert(t.minutes, t.id);
        ranked.emplace_back(t.minutes, t.id);
    }

    auto mid_length = index.range_query(10, 20);
    EXPECT_EQ(mid_length.size(), 5u);

    auto longest = find_top_k(ranked, 2);
    ASSERT_EQ(longest.size(), 2u);
    EXPECT_EQ(longest[0].second, 9);
    EXPECT_EQ(longest[1].second, 4);
}

TEST(TripAnalysisTest, test_session_zones_and_routes) {
    Config cfg;
    cfg.hash_buckets = 7;
    Session session(cfg);

    for (const auto& t : load_fixture()) {
        session.lookup().insert(std::to_string(t.id), t.vendor);
        session.zones().unite(t.pickup, t.dropoff);
        session.routes().add_edge(t.pickup, t.dropoff, t.minutes);
    }

    EXPECT_EQ(*session.lookup().get("9"), "CMT");
    EXPECT_EQ(session.lookup().size(), 12u);

    // Queens/Astoria never connect to Manhattan in the fixture.
    EXPECT_TRUE(session.zones().connected("Midtown", "Bronx"));
    EXPECT_FALSE(session.zones().connected("Midtown", "Queens"));
    EXPECT_EQ(session.zones().set_count(), 2u);

    auto dist = session.routes().dijkstra("Midtown");
    EXPECT_DOUBLE_EQ(dist.at("Chelsea"), 12);
    EXPECT_DOUBLE_EQ(dist.at("SoHo"), 21);
    EXPECT_DOUBLE_EQ(dist.at("Tribeca"), 27);
    EXPECT_DOUBLE_EQ(dist.at("Bronx"), 37);
    EXPECT_EQ(dist.at("Queens"), kUnreachable);
}

TEST(TripAnalysisTest, test_moving_average_and_pattern_search) {
    auto values = durations(load_fixture());
    SlidingWindow window(4);
    double avg = 0.0;
    for (double v : values) avg = window.add(v);
    // Window holds the last four trips: 95, 14, 7, 21
    EXPECT_DOUBLE_EQ(avg, (95.0 + 14 + 7 + 21) / 4);
    EXPECT_DOUBLE_EQ(window.max(), 95);

    std::string route_log;
    for (const auto& t : load_fixture()) route_log += t.pickup + ">" + t.dropoff + ";";
    EXPECT_EQ(rabin_karp_search(route_log, "Midtown>").size(), 3u);
    EXPECT_DOUBLE_EQ(median(values), 13);
}
