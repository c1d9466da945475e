#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace canopy {

    // All coordinates are WGS84 degrees. Metric work happens in a local ENU frame (see geometry.hpp).
    struct GeoPoint {
        double lng = 0.0;
        double lat = 0.0;

        bool isValid() const;
    };

    bool operator==(const GeoPoint &a, const GeoPoint &b);
    bool operator!=(const GeoPoint &a, const GeoPoint &b);

    using Path = std::vector<GeoPoint>;

    // First ring is the outer boundary, the rest are holes. Rings are closed (first == last).
    struct Polygon {
        std::vector<Path> rings;

        bool empty() const { return rings.empty() || rings.front().empty(); }
        const Path &outer() const { return rings.at(0); }
    };

    struct BoundingBox {
        double south = 0.0;
        double west = 0.0;
        double north = 0.0;
        double east = 0.0;

        bool isValid() const;
    };

    // Quantizes every bound to 4 decimal degrees (~11 m): "south,west,north,east".
    std::string cacheKey(const BoundingBox &bbox);

    enum class PowerKind { Line, MinorLine, Cable };

    std::string toString(PowerKind kind);

    // Unknown or empty tags fall back to PowerKind::Line.
    PowerKind parsePowerKind(const std::string &tag);

    struct LineFeature {
        std::int64_t id = 0;
        PowerKind powerKind = PowerKind::Line;
        std::optional<std::string> voltage;
        std::optional<std::string> operatorName;
        std::optional<std::string> cableCount;
        Path coordinates; // ingestion order, size >= 2
    };

    struct FeatureCollection {
        std::vector<LineFeature> features;

        bool empty() const { return features.empty(); }
        std::size_t size() const { return features.size(); }
    };

    // A line feature grown into a polygon by a fixed radius.
    struct BufferZone {
        std::int64_t id = 0;
        PowerKind powerKind = PowerKind::Line;
        std::optional<std::string> voltage;
        std::optional<std::string> operatorName;
        std::optional<std::string> cableCount;
        double bufferFt = 0.0;
        Polygon polygon;
    };

    struct BufferCollection {
        std::vector<BufferZone> features;

        bool empty() const { return features.empty(); }
        std::size_t size() const { return features.size(); }
    };

    struct ProximityResult {
        bool near = false;
        std::optional<double> distanceFt; // empty when nothing could be measured
    };

    using Properties = std::unordered_map<std::string, std::string>;
    using Geometry = std::variant<GeoPoint, Path, Polygon>;

    struct Feature {
        Geometry geometry;
        Properties properties;
    };

    class ParseError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class TransportError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class GeometryError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

} // namespace canopy
