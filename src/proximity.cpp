#include "canopy/proximity.hpp"
#include "canopy/geometry.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

namespace canopy {

    ProximityResult checkProximity(const GeoPoint &point, const FeatureCollection &collection, double bufferFt) {
        ProximityResult result;
        if (collection.empty())
            return result;

        double minFt = std::numeric_limits<double>::infinity();
        for (const auto &feature : collection.features) {
            try {
                double ft = metersToFeet(distanceToLineMeters(point, feature.coordinates));
                if (ft < minFt)
                    minFt = ft;
            } catch (const GeometryError &e) {
                spdlog::debug("ProximityEvaluator: skipping way {}: {}", feature.id, e.what());
            }
        }

        if (!std::isfinite(minFt))
            return result;

        result.near = minFt <= bufferFt;
        result.distanceFt = std::round(minFt);
        return result;
    }

    BufferCollection bufferFeatures(const FeatureCollection &collection, double bufferFt, int arcSegments) {
        BufferCollection out;
        if (collection.empty())
            return out;

        const double radiusM = feetToMeters(bufferFt);
        spdlog::debug("ProximityEvaluator: buffering {} line(s) by {:.4f} km", collection.size(), radiusM / 1000.0);

        out.features.reserve(collection.size());
        for (const auto &feature : collection.features) {
            try {
                BufferZone zone;
                zone.polygon = bufferLine(feature.coordinates, radiusM, arcSegments);
                zone.id = feature.id;
                zone.powerKind = feature.powerKind;
                zone.voltage = feature.voltage;
                zone.operatorName = feature.operatorName;
                zone.cableCount = feature.cableCount;
                zone.bufferFt = bufferFt;
                out.features.push_back(std::move(zone));
            } catch (const GeometryError &e) {
                spdlog::debug("ProximityEvaluator: cannot buffer way {}: {}", feature.id, e.what());
            }
        }
        return out;
    }

} // namespace canopy
