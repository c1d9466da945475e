#include "canopy/cache.hpp"

namespace canopy {

    std::shared_ptr<const FeatureCollection> ViewportCache::get(const std::string &key) const {
        auto it = entries_.find(key);
        if (it == entries_.end())
            return nullptr;
        return it->second;
    }

    void ViewportCache::put(const std::string &key, FeatureCollection collection) {
        entries_[key] = std::make_shared<const FeatureCollection>(std::move(collection));
    }

} // namespace canopy
