#pragma once

#include "canopy/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace canopy {

    // Feature collections keyed by quantized bounding box (see cacheKey). No eviction and no expiry:
    // an entry lives as long as the cache, and a put for an existing key replaces it.
    // Not synchronized; owned by a single viewport session.
    class ViewportCache {
      private:
        std::unordered_map<std::string, std::shared_ptr<const FeatureCollection>> entries_;

      public:
        std::shared_ptr<const FeatureCollection> get(const std::string &key) const;
        std::shared_ptr<const FeatureCollection> get(const BoundingBox &bbox) const { return get(cacheKey(bbox)); }

        void put(const std::string &key, FeatureCollection collection);
        void put(const BoundingBox &bbox, FeatureCollection collection) { put(cacheKey(bbox), std::move(collection)); }

        bool contains(const std::string &key) const { return entries_.count(key) > 0; }
        size_t size() const { return entries_.size(); }
        void clear() { entries_.clear(); }
    };

} // namespace canopy
