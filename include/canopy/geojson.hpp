#pragma once

#include "canopy/types.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <vector>

namespace canopy {

    // GeoJSON (RFC 7946, [lng, lat] order) for the rendering side.

    boost::json::value geometryToJson(const Geometry &geom);

    boost::json::value featureToJson(const Feature &f);
    boost::json::value featureToJson(const LineFeature &f);
    boost::json::value featureToJson(const BufferZone &f);

    boost::json::value toJson(const std::vector<Feature> &features);
    boost::json::value toJson(const FeatureCollection &fc);
    boost::json::value toJson(const BufferCollection &bc);

    void WriteFeatureCollection(const std::vector<Feature> &features, const std::filesystem::path &outPath);
    void WriteFeatureCollection(const FeatureCollection &fc, const std::filesystem::path &outPath);
    void WriteFeatureCollection(const BufferCollection &bc, const std::filesystem::path &outPath);

} // namespace canopy
