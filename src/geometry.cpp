#include "canopy/geometry.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace canopy {

    namespace bg = boost::geometry;

    namespace {
        using BgPoint = bg::model::d2::point_xy<double>;
        using BgLine = bg::model::linestring<BgPoint>;
        using BgSegment = bg::model::segment<BgPoint>;
        using BgPolygon = bg::model::polygon<BgPoint>;
        using BgMultiPolygon = bg::model::multi_polygon<BgPolygon>;

        constexpr double kPi = 3.14159265358979323846;
        // A straight lon/lat segment bows by a few centimetres in the tangent plane over ~1 km, so a
        // point on the drawn path can land that far off the planar segment.
        constexpr double kOnLineToleranceM = 0.05;

        double toRadians(double deg) { return deg * kPi / 180.0; }
        double toDegrees(double rad) { return rad * 180.0 / kPi; }

        void validateLine(const Path &line, const char *who) {
            if (line.size() < 2) {
                throw GeometryError(std::string(who) + ": line needs at least 2 coordinates, got " +
                                    std::to_string(line.size()));
            }
            for (const auto &p : line) {
                if (!p.isValid()) {
                    throw GeometryError(std::string(who) + ": invalid coordinate (" + std::to_string(p.lng) + ", " +
                                        std::to_string(p.lat) + ")");
                }
            }
        }

        BgPoint planar(const LocalFrame &frame, const GeoPoint &p) {
            auto local = frame.toLocal(p);
            return BgPoint{local.x, local.y};
        }

        // Midpoint of the line's lon/lat extent keeps projection error symmetric along the line.
        GeoPoint extentCenter(const Path &line) {
            auto [minLng, maxLng] = std::minmax_element(line.begin(), line.end(), [](const auto &a, const auto &b) {
                return a.lng < b.lng;
            });
            auto [minLat, maxLat] = std::minmax_element(line.begin(), line.end(), [](const auto &a, const auto &b) {
                return a.lat < b.lat;
            });
            return GeoPoint{(minLng->lng + maxLng->lng) / 2.0, (minLat->lat + maxLat->lat) / 2.0};
        }

        template <typename RingT> Path toGeoRing(const LocalFrame &frame, const RingT &ring) {
            Path out;
            out.reserve(ring.size());
            for (const auto &p : ring)
                out.push_back(frame.toGeo(dp::Point{bg::get<0>(p), bg::get<1>(p), 0.0}));
            return out;
        }
    } // namespace

    LocalFrame::LocalFrame(const GeoPoint &origin) : datum_{origin.lat, origin.lng, 0.0} {}

    dp::Point LocalFrame::toLocal(const GeoPoint &p) const {
        concord::earth::WGS wgs{p.lat, p.lng, datum_.altitude};
        auto enu = concord::frame::to_enu(datum_, wgs);
        return dp::Point{enu.east(), enu.north(), 0.0};
    }

    GeoPoint LocalFrame::toGeo(const dp::Point &p) const {
        concord::frame::ENU enu{dp::Point{p.x, p.y, 0.0}, datum_};
        auto wgs = concord::frame::to_wgs(enu);
        return GeoPoint{wgs.longitude, wgs.latitude};
    }

    NearestPoint nearestPointOnLine(const GeoPoint &point, const Path &line) {
        validateLine(line, "canopy::nearestPointOnLine()");
        if (!point.isValid())
            throw GeometryError("canopy::nearestPointOnLine(): invalid query point");

        // The frame is centred on the query point, so it sits at the local origin.
        LocalFrame frame(point);
        const BgPoint origin{0.0, 0.0};

        std::vector<BgPoint> pts;
        pts.reserve(line.size());
        for (const auto &p : line)
            pts.push_back(planar(frame, p));

        NearestPoint best;
        best.distanceM = std::numeric_limits<double>::infinity();
        BgPoint bestLocal = pts.front();

        for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
            const auto &a = pts[i];
            const auto &b = pts[i + 1];
            double d = bg::distance(origin, BgSegment{a, b});
            if (!(d < best.distanceM))
                continue;

            BgPoint dir = b;
            bg::subtract_point(dir, a);
            BgPoint toOrigin = origin;
            bg::subtract_point(toOrigin, a);
            double len2 = bg::dot_product(dir, dir);
            double t = len2 > 0.0 ? std::clamp(bg::dot_product(toOrigin, dir) / len2, 0.0, 1.0) : 0.0;

            BgPoint closest = dir;
            bg::multiply_value(closest, t);
            bg::add_point(closest, a);

            best.distanceM = d;
            best.segmentIndex = i;
            bestLocal = closest;
        }

        if (!std::isfinite(best.distanceM))
            throw GeometryError("canopy::nearestPointOnLine(): distance is not finite");
        if (best.distanceM < kOnLineToleranceM)
            best.distanceM = 0.0;

        best.location = frame.toGeo(dp::Point{bg::get<0>(bestLocal), bg::get<1>(bestLocal), 0.0});
        return best;
    }

    double distanceToLineMeters(const GeoPoint &point, const Path &line) {
        return nearestPointOnLine(point, line).distanceM;
    }

    Polygon bufferLine(const Path &line, double radiusM, int arcSegments) {
        validateLine(line, "canopy::bufferLine()");
        if (!std::isfinite(radiusM) || radiusM <= 0.0)
            throw GeometryError("canopy::bufferLine(): radius must be positive, got " + std::to_string(radiusM));
        if (arcSegments < 4)
            arcSegments = 4;

        LocalFrame frame(extentCenter(line));
        BgLine local;
        for (const auto &p : line)
            bg::append(local, planar(frame, p));

        bg::strategy::buffer::distance_symmetric<double> distance(radiusM);
        bg::strategy::buffer::side_straight side;
        bg::strategy::buffer::join_round join(arcSegments);
        bg::strategy::buffer::end_round end(arcSegments);
        bg::strategy::buffer::point_circle circle(arcSegments);

        BgMultiPolygon result;
        try {
            bg::buffer(local, result, distance, side, join, end, circle);
        } catch (const bg::exception &e) {
            throw GeometryError(std::string("canopy::bufferLine(): ") + e.what());
        }
        if (result.empty())
            throw GeometryError("canopy::bufferLine(): buffer produced no polygon");

        // A line buffers into one polygon; keep the largest piece if the kernel splits it.
        auto largest = std::max_element(result.begin(), result.end(),
                                        [](const auto &a, const auto &b) { return bg::area(a) < bg::area(b); });
        if (bg::area(*largest) <= 0.0)
            throw GeometryError("canopy::bufferLine(): buffer polygon has no area");

        Polygon out;
        out.rings.push_back(toGeoRing(frame, largest->outer()));
        for (const auto &inner : largest->inners())
            out.rings.push_back(toGeoRing(frame, inner));
        return out;
    }

    double haversineMeters(const GeoPoint &a, const GeoPoint &b) {
        double dLat = toRadians(b.lat - a.lat);
        double dLng = toRadians(b.lng - a.lng);
        double sinLat = std::sin(dLat / 2.0);
        double sinLng = std::sin(dLng / 2.0);
        double h = sinLat * sinLat + std::cos(toRadians(a.lat)) * std::cos(toRadians(b.lat)) * sinLng * sinLng;
        return kEarthRadiusMeters * 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    }

    GeoPoint destination(const GeoPoint &from, double distanceKm, double bearingDeg) {
        double lat1 = toRadians(from.lat);
        double lng1 = toRadians(from.lng);
        double bearing = toRadians(bearingDeg);
        double angular = distanceKm * 1000.0 / kEarthRadiusMeters;

        double lat2 =
            std::asin(std::sin(lat1) * std::cos(angular) + std::cos(lat1) * std::sin(angular) * std::cos(bearing));
        double lng2 = lng1 + std::atan2(std::sin(bearing) * std::sin(angular) * std::cos(lat1),
                                        std::cos(angular) - std::sin(lat1) * std::sin(lat2));
        return GeoPoint{toDegrees(lng2), toDegrees(lat2)};
    }

    Path circlePolygon(const GeoPoint &center, double radiusM, int steps) {
        if (!center.isValid())
            throw GeometryError("canopy::circlePolygon(): invalid center");
        if (steps < 3)
            throw GeometryError("canopy::circlePolygon(): need at least 3 steps, got " + std::to_string(steps));

        Path ring;
        ring.reserve(static_cast<std::size_t>(steps) + 1);
        double km = std::max(radiusM, 0.0) / 1000.0;
        for (int i = 0; i < steps; ++i)
            ring.push_back(destination(center, km, 360.0 * i / steps));
        ring.push_back(ring.front());
        return ring;
    }

    std::string formatDistance(double meters) {
        double ft = metersToFeet(meters);
        if (ft < 200.0)
            return fmt::format("{} ft", static_cast<long long>(std::llround(ft)));
        return fmt::format("{:.2f} km", meters / 1000.0);
    }

} // namespace canopy
