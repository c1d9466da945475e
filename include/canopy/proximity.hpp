#pragma once

#include "canopy/config.hpp"
#include "canopy/types.hpp"

namespace canopy {

    inline constexpr double kDefaultBufferFt = 30.0;

    // Minimum planar distance from point to any line in the collection. Features with unusable
    // geometry are skipped. distanceFt is rounded to whole feet; near compares the unrounded value.
    ProximityResult checkProximity(const GeoPoint &point, const FeatureCollection &collection,
                                   double bufferFt = kDefaultBufferFt);

    // One polygon per bufferable line, carrying the line's attributes and bufferFt.
    BufferCollection bufferFeatures(const FeatureCollection &collection, double bufferFt = kDefaultBufferFt,
                                    int arcSegments = 36);

    class ProximityEvaluator {
      private:
        ProximityConfig config_;

      public:
        explicit ProximityEvaluator(const ProximityConfig &config = ProximityConfig{}) : config_(config) {}

        ProximityResult check(const GeoPoint &point, const FeatureCollection &collection) const {
            return checkProximity(point, collection, config_.bufferFt);
        }

        BufferCollection buffers(const FeatureCollection &collection) const {
            return bufferFeatures(collection, config_.bufferFt, config_.arcSegments);
        }

        const ProximityConfig &config() const { return config_; }
    };

} // namespace canopy
