#include "canopy/geojson.hpp"

#include <fstream>
#include <type_traits>
#include <variant>

namespace canopy {

    namespace {
        boost::json::array pointCoords(const GeoPoint &p) {
            boost::json::array arr;
            arr.push_back(p.lng);
            arr.push_back(p.lat);
            return arr;
        }

        boost::json::array pathCoords(const Path &path) {
            boost::json::array arr;
            arr.reserve(path.size());
            for (const auto &p : path)
                arr.push_back(pointCoords(p));
            return arr;
        }

        boost::json::value optionalString(const std::optional<std::string> &s) {
            if (!s)
                return nullptr;
            return boost::json::value(*s);
        }

        boost::json::object lineProperties(std::int64_t id, PowerKind kind, const std::optional<std::string> &voltage,
                                           const std::optional<std::string> &operatorName,
                                           const std::optional<std::string> &cables) {
            boost::json::object props;
            props["id"] = id;
            props["power"] = toString(kind);
            props["voltage"] = optionalString(voltage);
            props["operator"] = optionalString(operatorName);
            props["cables"] = optionalString(cables);
            return props;
        }

        boost::json::value wrap(boost::json::array features) {
            boost::json::object j;
            j["type"] = "FeatureCollection";
            j["features"] = std::move(features);
            return j;
        }

        void writeJson(const boost::json::value &j, const std::filesystem::path &outPath) {
            std::ofstream ofs(outPath);
            if (!ofs)
                throw std::runtime_error("Cannot open for write: " + outPath.string());
            ofs << boost::json::serialize(j) << "\n";
        }
    } // namespace

    boost::json::value geometryToJson(const Geometry &geom) {
        return std::visit(
            [](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                if constexpr (std::is_same_v<T, GeoPoint>) {
                    j["type"] = "Point";
                    j["coordinates"] = pointCoords(shape);
                } else if constexpr (std::is_same_v<T, Path>) {
                    j["type"] = "LineString";
                    j["coordinates"] = pathCoords(shape);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["type"] = "Polygon";
                    boost::json::array rings;
                    for (auto const &ring : shape.rings)
                        rings.push_back(pathCoords(ring));
                    j["coordinates"] = std::move(rings);
                }
                return j;
            },
            geom);
    }

    boost::json::value featureToJson(const Feature &f) {
        boost::json::object j;
        j["type"] = "Feature";
        boost::json::object props;
        for (auto const &kv : f.properties)
            props[kv.first] = kv.second;
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(f.geometry);
        return j;
    }

    boost::json::value featureToJson(const LineFeature &f) {
        boost::json::object j;
        j["type"] = "Feature";
        j["properties"] = lineProperties(f.id, f.powerKind, f.voltage, f.operatorName, f.cableCount);
        j["geometry"] = geometryToJson(f.coordinates);
        return j;
    }

    boost::json::value featureToJson(const BufferZone &f) {
        boost::json::object j;
        j["type"] = "Feature";
        auto props = lineProperties(f.id, f.powerKind, f.voltage, f.operatorName, f.cableCount);
        props["bufferFt"] = f.bufferFt;
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(f.polygon);
        return j;
    }

    boost::json::value toJson(const std::vector<Feature> &features) {
        boost::json::array arr;
        for (auto const &f : features)
            arr.push_back(featureToJson(f));
        return wrap(std::move(arr));
    }

    boost::json::value toJson(const FeatureCollection &fc) {
        boost::json::array arr;
        for (auto const &f : fc.features)
            arr.push_back(featureToJson(f));
        return wrap(std::move(arr));
    }

    boost::json::value toJson(const BufferCollection &bc) {
        boost::json::array arr;
        for (auto const &f : bc.features)
            arr.push_back(featureToJson(f));
        return wrap(std::move(arr));
    }

    void WriteFeatureCollection(const std::vector<Feature> &features, const std::filesystem::path &outPath) {
        writeJson(toJson(features), outPath);
    }

    void WriteFeatureCollection(const FeatureCollection &fc, const std::filesystem::path &outPath) {
        writeJson(toJson(fc), outPath);
    }

    void WriteFeatureCollection(const BufferCollection &bc, const std::filesystem::path &outPath) {
        writeJson(toJson(bc), outPath);
    }

} // namespace canopy
