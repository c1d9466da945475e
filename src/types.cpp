#include "canopy/types.hpp"

#include <cmath>
#include <fmt/format.h>

namespace canopy {

    bool GeoPoint::isValid() const {
        return std::isfinite(lng) && std::isfinite(lat) && lng >= -180.0 && lng <= 180.0 && lat >= -90.0 &&
               lat <= 90.0;
    }

    bool operator==(const GeoPoint &a, const GeoPoint &b) { return a.lng == b.lng && a.lat == b.lat; }

    bool operator!=(const GeoPoint &a, const GeoPoint &b) { return !(a == b); }

    bool BoundingBox::isValid() const {
        if (!std::isfinite(south) || !std::isfinite(west) || !std::isfinite(north) || !std::isfinite(east))
            return false;
        return south < north && west < east;
    }

    std::string cacheKey(const BoundingBox &bbox) {
        return fmt::format("{:.4f},{:.4f},{:.4f},{:.4f}", bbox.south, bbox.west, bbox.north, bbox.east);
    }

    std::string toString(PowerKind kind) {
        switch (kind) {
        case PowerKind::Line:
            return "line";
        case PowerKind::MinorLine:
            return "minor_line";
        case PowerKind::Cable:
            return "cable";
        }
        return "line";
    }

    PowerKind parsePowerKind(const std::string &tag) {
        if (tag == "minor_line")
            return PowerKind::MinorLine;
        if (tag == "cable")
            return PowerKind::Cable;
        return PowerKind::Line;
    }

} // namespace canopy
