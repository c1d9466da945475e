#include <doctest/doctest.h>

#include "canopy/geometry.hpp"

TEST_CASE("Geometry - Unit conversion") {
    CHECK(canopy::feetToMeters(30.0) == doctest::Approx(9.144));
    CHECK(canopy::metersToFeet(9.144) == doctest::Approx(30.0));
}

TEST_CASE("Geometry - Local frame round trip") {
    canopy::LocalFrame frame(canopy::GeoPoint{-122.6, 45.5});

    auto origin = frame.toLocal(canopy::GeoPoint{-122.6, 45.5});
    CHECK(origin.x == doctest::Approx(0.0).epsilon(1e-6));
    CHECK(origin.y == doctest::Approx(0.0).epsilon(1e-6));

    canopy::GeoPoint p{-122.598, 45.5015};
    auto local = frame.toLocal(p);
    CHECK(local.x > 0.0);
    CHECK(local.y > 0.0);

    auto back = frame.toGeo(local);
    CHECK(back.lng == doctest::Approx(p.lng).epsilon(1e-9));
    CHECK(back.lat == doctest::Approx(p.lat).epsilon(1e-9));
}

TEST_CASE("Geometry - Great-circle helpers") {
    canopy::GeoPoint start{-122.6, 45.5};

    SUBCASE("One degree of latitude") {
        CHECK(canopy::haversineMeters(start, canopy::GeoPoint{-122.6, 46.5}) == doctest::Approx(111195.0).epsilon(0.001));
    }

    SUBCASE("Destination then distance") {
        auto east = canopy::destination(start, 0.5, 90.0);
        CHECK(east.lng > start.lng);
        CHECK(canopy::haversineMeters(start, east) == doctest::Approx(500.0).epsilon(1e-6));

        auto north = canopy::destination(start, 1.0, 0.0);
        CHECK(north.lng == doctest::Approx(start.lng));
        CHECK(north.lat > start.lat);
    }
}

TEST_CASE("Geometry - Circle polygon") {
    canopy::GeoPoint center{-122.6, 45.5};
    auto ring = canopy::circlePolygon(center, 10.0, 16);

    REQUIRE(ring.size() == 17);
    CHECK(ring.front() == ring.back());
    for (const auto &p : ring)
        CHECK(canopy::haversineMeters(center, p) == doctest::Approx(10.0).epsilon(1e-6));

    CHECK_THROWS_AS(canopy::circlePolygon(center, 10.0, 2), canopy::GeometryError);
    CHECK_THROWS_AS(canopy::circlePolygon(canopy::GeoPoint{200.0, 0.0}, 10.0), canopy::GeometryError);
}

TEST_CASE("Geometry - Nearest point on a line") {
    canopy::Path line{{-122.61, 45.51}, {-122.605, 45.51}, {-122.60, 45.51}};

    SUBCASE("Point on a vertex") {
        auto nearest = canopy::nearestPointOnLine(canopy::GeoPoint{-122.605, 45.51}, line);
        CHECK(nearest.distanceM == 0.0);
    }

    SUBCASE("Point beside the second segment") {
        auto query = canopy::destination(canopy::GeoPoint{-122.602, 45.51}, 0.015, 180.0);
        auto nearest = canopy::nearestPointOnLine(query, line);
        CHECK(nearest.segmentIndex == 1);
        CHECK(nearest.distanceM == doctest::Approx(15.0).epsilon(0.01));
        CHECK(nearest.location.lng == doctest::Approx(-122.602).epsilon(1e-7));
        CHECK(nearest.location.lat == doctest::Approx(45.51).epsilon(1e-7));
    }

    SUBCASE("Point past the end clamps to the last vertex") {
        auto query = canopy::destination(canopy::GeoPoint{-122.60, 45.51}, 0.030, 90.0);
        auto nearest = canopy::nearestPointOnLine(query, line);
        CHECK(nearest.segmentIndex == 1);
        CHECK(nearest.location.lng == doctest::Approx(-122.60).epsilon(1e-7));
        CHECK(canopy::distanceToLineMeters(query, line) == doctest::Approx(30.0).epsilon(0.01));
    }

    SUBCASE("Degenerate input") {
        CHECK_THROWS_AS(canopy::nearestPointOnLine(canopy::GeoPoint{-122.6, 45.5}, canopy::Path{{-122.6, 45.5}}),
                        canopy::GeometryError);
        CHECK_THROWS_AS(canopy::nearestPointOnLine(canopy::GeoPoint{-122.6, 45.5}, canopy::Path{}),
                        canopy::GeometryError);
        CHECK_THROWS_AS(canopy::nearestPointOnLine(canopy::GeoPoint{-122.6, 95.0}, line), canopy::GeometryError);
    }
}

TEST_CASE("Geometry - Line buffer") {
    canopy::Path line{{-122.6, 45.5}, {-122.6, 45.501}};

    auto polygon = canopy::bufferLine(line, 10.0);
    REQUIRE_FALSE(polygon.empty());
    const auto &outer = polygon.outer();
    CHECK(outer.size() > 4);
    CHECK(outer.front() == outer.back());

    // Every vertex of the outline sits on the radius.
    for (const auto &p : outer)
        CHECK(canopy::distanceToLineMeters(p, line) == doctest::Approx(10.0).epsilon(0.01));

    CHECK_THROWS_AS(canopy::bufferLine(line, 0.0), canopy::GeometryError);
    CHECK_THROWS_AS(canopy::bufferLine(canopy::Path{{-122.6, 45.5}}, 10.0), canopy::GeometryError);
}

TEST_CASE("Geometry - Distance labels") {
    CHECK(canopy::formatDistance(20.0) == "66 ft");
    CHECK(canopy::formatDistance(0.0) == "0 ft");
    CHECK(canopy::formatDistance(1000.0) == "1.00 km");
    CHECK(canopy::formatDistance(1234.0) == "1.23 km");
}
