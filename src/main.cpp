#include "config/config.h"
#include "core/logging.h"
#include "core/session.h"
#include "index/search_tree.h"
#include "queue/top_k.h"
#include "search/rabin_karp.h"
#include "stats/anomaly.h"
#include "stats/order_statistics.h"
#include "stats/sliding_window.h"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Trip {
    std::string vendor;
    std::string pickup_zone;
    std::string dropoff_zone;
    double duration_min;
    double distance_km;
};

const std::vector<Trip>& sample_trips() {
    static const std::vector<Trip> trips = {
        {"CMT", "Midtown", "Chelsea", 12.5, 3.1},
        {"VTS", "Chelsea", "SoHo", 9.0, 2.4},
        {"CMT", "SoHo", "Tribeca", 6.5, 1.2},
        {"VTS", "Midtown", "Harlem", 22.0, 7.8},
        {"CMT", "Harlem", "Bronx", 15.5, 5.0},
        {"VTS", "Tribeca", "Midtown", 18.0, 4.9},
        {"CMT", "Chelsea", "Midtown", 11.0, 3.0},
        {"VTS", "SoHo", "Chelsea", 8.5, 2.2},
        {"CMT", "Midtown", "JFK", 95.0, 27.5},
        {"VTS", "Bronx", "Harlem", 14.0, 4.6},
        {"CMT", "Tribeca", "SoHo", 7.0, 1.3},
        {"VTS", "Harlem", "Midtown", 21.5, 7.6},
    };
    return trips;
}

void run_demo(mobilitykit::Session& session) {
    using namespace mobilitykit;
    const auto& trips = sample_trips();

    std::vector<double> durations;
    for (const auto& t : trips) durations.push_back(t.duration_min);

    spdlog::info("Median duration: {:.2f} min", median(durations));
    spdlog::info("95th percentile duration: {:.2f} min",
                 session.cached_percentile("duration", durations, 95));

    for (const auto& o : detect_outliers_iqr(durations)) {
        spdlog::info("IQR outlier: trip #{} lasted {:.1f} min", o.index, o.value);
    }
    for (const auto& a : detect_anomalies_zscore(durations, session.zscore_threshold())) {
        spdlog::info("z-score anomaly: trip #{} ({:.1f} min, |z|={:.2f})", a.index, a.value, a.zscore);
    }

    BinarySearchTree<double, size_t> by_distance;
    for (size_t i = 0; i < trips.size(); ++i) by_distance.insert(trips[i].distance_km, i);
    spdlog::info("{} trips between 2 and 5 km", by_distance.range_query(2.0, 5.0).size());

    SlidingWindow window(static_cast<long long>(session.window_size()));
    double moving = 0.0;
    for (double d : durations) moving = window.add(d);
    spdlog::info("Moving average over last {} trips: {:.2f} min (min {:.1f}, max {:.1f})",
                 window.size(), moving, window.min(), window.max());

    std::vector<std::pair<double, std::string>> by_zone;
    for (const auto& t : trips) by_zone.emplace_back(t.distance_km, t.pickup_zone);
    for (const auto& [km, zone] : find_top_k(by_zone, 3)) {
        spdlog::info("Long trip from {}: {:.1f} km", zone, km);
    }

    for (const auto& t : trips) {
        session.lookup().insert(t.pickup_zone, t.vendor);
        session.zones().unite(t.pickup_zone, t.dropoff_zone);
        session.routes().add_edge(t.pickup_zone, t.dropoff_zone, t.duration_min);
    }
    spdlog::info("{} connected zone groups across {} zones",
                 session.zones().set_count(), session.zones().size());

    for (const auto& [zone, minutes] : session.routes().dijkstra("Midtown")) {
        spdlog::info("Fastest Midtown -> {}: {:.1f} min", zone, minutes);
    }

    auto counts = frequency_map(std::vector<std::string>{"CMT", "VTS", "CMT"});
    spdlog::info("Vendor sample counts: CMT={} VTS={}", counts["CMT"], counts["VTS"]);

    std::string zone_list;
    for (const auto& t : trips) zone_list += t.pickup_zone + " ";
    spdlog::info("'SoHo' appears {} times in pickup list",
                 rabin_karp_search(zone_list, "SoHo").size());
}

}  // namespace

int main() {
    try {
        auto& config = mobilitykit::get_config();
        mobilitykit::configure_logging(config);
        spdlog::info("Starting MobilityKit demo");

        mobilitykit::Session session(config);
        run_demo(session);

        spdlog::info("MobilityKit demo complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
