#include <doctest/doctest.h>

#include "canopy/overpass.hpp"
#include "canopy/scheduler.hpp"
#include "fixtures.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

    canopy::BoundingBox shifted(double dLat) {
        auto b = fixtures::viewport();
        b.south += dLat;
        b.north += dLat;
        return b;
    }

    struct Harness {
        fixtures::FakeTransport transport;
        canopy::PowerLineIngestor ingestor{transport};
        canopy::ViewportCache cache;
        canopy::FetchScheduler::TimePoint now{};
        canopy::FetchScheduler scheduler;
        std::vector<size_t> delivered;

        explicit Harness(const canopy::SchedulerConfig &config = canopy::SchedulerConfig{})
            : scheduler(ingestor, cache, config, [this] { return now; }) {}

        canopy::FetchScheduler::Callback recorder() {
            return [this](const canopy::FeatureCollection &fc) { delivered.push_back(fc.size()); };
        }

        void at(std::chrono::milliseconds t) { now = canopy::FetchScheduler::TimePoint{} + t; }
    };

} // namespace

TEST_CASE("Scheduler - Trailing-edge debounce") {
    Harness h;

    h.at(0ms);
    h.scheduler.onViewportChange(shifted(0.000), 15, h.recorder());
    h.at(100ms);
    h.scheduler.onViewportChange(shifted(0.001), 15, h.recorder());
    h.at(200ms);
    h.scheduler.onViewportChange(shifted(0.002), 15, h.recorder());
    h.at(700ms);
    h.scheduler.onViewportChange(shifted(0.003), 15, h.recorder());

    REQUIRE(h.scheduler.nextDue().has_value());
    CHECK(*h.scheduler.nextDue() == canopy::FetchScheduler::TimePoint{} + 1500ms);

    h.at(1499ms);
    CHECK(h.scheduler.poll() == 0);
    CHECK(h.transport.calls() == 0);
    CHECK(h.scheduler.hasPendingTimer());

    h.at(1500ms);
    h.scheduler.poll();
    CHECK_FALSE(h.scheduler.hasPendingTimer());
    CHECK(h.scheduler.wait() == 1);

    CHECK(h.transport.calls() == 1);
    CHECK(h.transport.lastBody() == canopy::encodeFormBody(canopy::buildOverpassQuery(shifted(0.003))));
    REQUIRE(h.delivered.size() == 1);
    CHECK(h.delivered[0] == 2);

    SUBCASE("A later change starts a new quiet period") {
        h.at(2000ms);
        h.scheduler.onViewportChange(shifted(0.010), 15, h.recorder());
        h.at(2799ms);
        h.scheduler.poll();
        CHECK(h.transport.calls() == 1);

        h.at(2800ms);
        h.scheduler.poll();
        h.scheduler.wait();
        CHECK(h.transport.calls() == 2);
        CHECK(h.transport.lastBody() == canopy::encodeFormBody(canopy::buildOverpassQuery(shifted(0.010))));
        CHECK(h.delivered.size() == 2);
    }
}

TEST_CASE("Scheduler - Zoom gate") {
    Harness h;

    h.at(0ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 15, h.recorder());
    CHECK(h.scheduler.hasPendingTimer());

    // Zooming out cancels the pending fetch and answers immediately.
    h.at(300ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 10, h.recorder());
    REQUIRE(h.delivered.size() == 1);
    CHECK(h.delivered[0] == 0);
    CHECK_FALSE(h.scheduler.hasPendingTimer());

    h.at(5000ms);
    h.scheduler.poll();
    h.scheduler.wait();
    CHECK(h.transport.calls() == 0);
    CHECK(h.delivered.size() == 1);

    SUBCASE("The threshold itself fetches") {
        h.scheduler.onViewportChange(fixtures::viewport(), 14, h.recorder());
        CHECK(h.scheduler.hasPendingTimer());
    }
}

TEST_CASE("Scheduler - Cache hits skip the network") {
    Harness h;

    h.at(0ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 16, h.recorder());
    h.at(800ms);
    h.scheduler.poll();
    h.scheduler.wait();
    CHECK(h.transport.calls() == 1);
    CHECK(h.cache.size() == 1);

    h.at(1000ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 16, h.recorder());
    h.at(1800ms);
    CHECK(h.scheduler.poll() == 1);
    CHECK(h.scheduler.inFlight() == 0);
    CHECK(h.transport.calls() == 1);
    REQUIRE(h.delivered.size() == 2);
    CHECK(h.delivered[1] == 2);
}

TEST_CASE("Scheduler - Failed fetches are not cached") {
    Harness h;
    h.transport.fail = true;

    h.at(0ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 16, h.recorder());
    h.at(800ms);
    h.scheduler.poll();
    h.scheduler.wait();

    REQUIRE(h.delivered.size() == 1);
    CHECK(h.delivered[0] == 0);
    CHECK(h.cache.size() == 0);

    h.transport.fail = false;
    h.at(1000ms);
    h.scheduler.onViewportChange(fixtures::viewport(), 16, h.recorder());
    h.at(1800ms);
    h.scheduler.poll();
    h.scheduler.wait();

    CHECK(h.transport.calls() == 2);
    REQUIRE(h.delivered.size() == 2);
    CHECK(h.delivered[1] == 2);
    CHECK(h.cache.size() == 1);
}

TEST_CASE("Scheduler - Superseded fetches") {
    canopy::SchedulerConfig config;

    SUBCASE("Dropped when discarding") { config.discardSuperseded = true; }
    SUBCASE("Delivered when not discarding") { config.discardSuperseded = false; }

    Harness h(config);
    h.transport.block();

    std::vector<std::string> order;
    h.at(0ms);
    h.scheduler.onViewportChange(shifted(0.0), 16,
                                 [&order](const canopy::FeatureCollection &) { order.push_back("first"); });
    h.at(800ms);
    h.scheduler.poll();
    CHECK(h.scheduler.inFlight() == 1);

    h.at(900ms);
    h.scheduler.onViewportChange(shifted(0.01), 16,
                                 [&order](const canopy::FeatureCollection &) { order.push_back("second"); });
    h.transport.release();
    h.scheduler.wait();

    // The older result still lands in the cache either way.
    CHECK(h.cache.contains(canopy::cacheKey(shifted(0.0))));

    h.at(1700ms);
    h.scheduler.poll();
    h.scheduler.wait();
    CHECK(h.transport.calls() == 2);

    if (config.discardSuperseded) {
        CHECK(order == std::vector<std::string>{"second"});
    } else {
        CHECK(order == std::vector<std::string>{"first", "second"});
    }
}

TEST_CASE("Scheduler - Invalid bounds deliver an empty collection") {
    Harness h;

    h.at(0ms);
    h.scheduler.onViewportChange(canopy::BoundingBox{45.52, -122.62, 45.49, -122.59}, 16, h.recorder());
    h.at(800ms);
    h.scheduler.poll();
    h.scheduler.wait();

    CHECK(h.transport.calls() == 0);
    REQUIRE(h.delivered.size() == 1);
    CHECK(h.delivered[0] == 0);
    CHECK(h.cache.size() == 0);
}
