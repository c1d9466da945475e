#pragma once

#include "canopy/types.hpp"

#include <concord/concord.hpp>
#include <datapod/datapod.hpp>

#include <cstddef>
#include <string>

namespace dp = ::datapod;

namespace canopy {

    inline constexpr double kFeetToMeters = 0.3048;
    inline constexpr double kEarthRadiusMeters = 6371000.0;

    inline double feetToMeters(double ft) { return ft * kFeetToMeters; }
    inline double metersToFeet(double m) { return m / kFeetToMeters; }

    // Tangent-plane (ENU) projection around an origin. Accurate enough for neighborhood-scale work,
    // which is all the proximity and buffering code needs.
    class LocalFrame {
      private:
        dp::Geo datum_;

      public:
        explicit LocalFrame(const GeoPoint &origin);

        dp::Point toLocal(const GeoPoint &p) const;
        GeoPoint toGeo(const dp::Point &p) const;

        const dp::Geo &datum() const { return datum_; }
    };

    struct NearestPoint {
        GeoPoint location;
        double distanceM = 0.0;
        std::size_t segmentIndex = 0; // index of the segment start vertex
    };

    // Throws GeometryError when the line has fewer than 2 vertices or any vertex (or the point) is invalid.
    NearestPoint nearestPointOnLine(const GeoPoint &point, const Path &line);

    double distanceToLineMeters(const GeoPoint &point, const Path &line);

    // Polygon covering everything within radiusM of the line, with round joins and caps.
    // arcSegments is the number of segments used per full circle.
    Polygon bufferLine(const Path &line, double radiusM, int arcSegments = 36);

    // Great-circle distance on a spherical earth.
    double haversineMeters(const GeoPoint &a, const GeoPoint &b);

    // Point reached travelling distanceKm from `from` along bearingDeg (0 = north, 90 = east).
    GeoPoint destination(const GeoPoint &from, double distanceKm, double bearingDeg);

    // Closed ring of steps + 1 vertices approximating a circle.
    Path circlePolygon(const GeoPoint &center, double radiusM, int steps = 32);

    // "42 ft" under 200 ft, "1.25 km" above.
    std::string formatDistance(double meters);

} // namespace canopy
