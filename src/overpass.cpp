#include "canopy/overpass.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace canopy {

    namespace detail {
        // Keeps RFC 3986 unreserved characters, percent-encodes everything else.
        inline std::string urlEncode(const std::string &s) {
            static const char *hex = "0123456789ABCDEF";
            std::string result;
            result.reserve(s.size() * 3);
            for (unsigned char c : s) {
                if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_' || c == '.' || c == '~') {
                    result += static_cast<char>(c);
                } else {
                    result += '%';
                    result += hex[c >> 4];
                    result += hex[c & 0x0F];
                }
            }
            return result;
        }

        inline std::optional<std::string> optionalTag(const boost::json::object &tags, const char *key) {
            auto it = tags.find(key);
            if (it == tags.end() || it->value().is_null())
                return std::nullopt;
            std::string value = it->value().is_string() ? std::string(it->value().as_string())
                                                        : boost::json::serialize(it->value());
            if (value.empty())
                return std::nullopt;
            return value;
        }

        inline std::int64_t readId(const boost::json::object &elem) {
            auto it = elem.find("id");
            if (it == elem.end())
                return 0;
            const auto &v = it->value();
            if (v.is_int64())
                return v.get_int64();
            if (v.is_uint64()) {
                if (v.get_uint64() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    return 0;
                return static_cast<std::int64_t>(v.get_uint64());
            }
            if (v.is_double()) {
                // 2^63 is exact as a double; anything at or beyond it has no int64 value.
                const double d = v.get_double();
                if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
                    return 0;
                return static_cast<std::int64_t>(d);
            }
            return 0;
        }

        inline Path readGeometry(const boost::json::array &geometry) {
            Path coords;
            coords.reserve(geometry.size());
            for (const auto &vertex : geometry) {
                if (!vertex.is_object())
                    continue;
                const auto &obj = vertex.as_object();
                auto lat = obj.find("lat");
                auto lon = obj.find("lon");
                if (lat == obj.end() || lon == obj.end() || !lat->value().is_number() || !lon->value().is_number())
                    continue;
                coords.push_back(GeoPoint{boost::json::value_to<double>(lon->value()),
                                          boost::json::value_to<double>(lat->value())});
            }
            return coords;
        }
    } // namespace detail

    std::string buildOverpassQuery(const BoundingBox &bbox, int timeoutSeconds) {
        auto area = fmt::format("({},{},{},{})", bbox.south, bbox.west, bbox.north, bbox.east);
        return fmt::format("[out:json][timeout:{}];\n"
                           "(\n"
                           "  way[\"power\"=\"line\"]{};\n"
                           "  way[\"power\"=\"minor_line\"]{};\n"
                           "  way[\"power\"=\"cable\"]{};\n"
                           ");\n"
                           "out geom;",
                           timeoutSeconds, area, area, area);
    }

    std::string encodeFormBody(const std::string &query) { return "data=" + detail::urlEncode(query); }

    FeatureCollection parseOverpass(const std::string &json) {
        boost::json::error_code ec;
        boost::json::value root = boost::json::parse(json, ec);
        if (ec)
            throw ParseError("canopy::parseOverpass(): failed to parse JSON: " + ec.message());
        if (!root.is_object())
            throw ParseError("canopy::parseOverpass(): top-level value is not an object");

        FeatureCollection fc;
        const auto &obj = root.as_object();
        auto elementsIt = obj.find("elements");
        if (elementsIt == obj.end() || elementsIt->value().is_null())
            return fc;
        if (!elementsIt->value().is_array())
            throw ParseError("canopy::parseOverpass(): 'elements' is not an array");

        const auto &elements = elementsIt->value().as_array();
        fc.features.reserve(elements.size());

        for (const auto &element : elements) {
            if (!element.is_object())
                continue;
            const auto &elem = element.as_object();

            auto typeIt = elem.find("type");
            if (typeIt == elem.end() || !typeIt->value().is_string() || typeIt->value().as_string() != "way")
                continue;

            auto geomIt = elem.find("geometry");
            if (geomIt == elem.end() || !geomIt->value().is_array())
                continue;

            auto coords = detail::readGeometry(geomIt->value().as_array());
            if (coords.size() < 2)
                continue;

            LineFeature feature;
            feature.id = detail::readId(elem);
            feature.coordinates = std::move(coords);

            auto tagsIt = elem.find("tags");
            if (tagsIt != elem.end() && tagsIt->value().is_object()) {
                const auto &tags = tagsIt->value().as_object();
                feature.powerKind = parsePowerKind(detail::optionalTag(tags, "power").value_or("line"));
                feature.voltage = detail::optionalTag(tags, "voltage");
                feature.operatorName = detail::optionalTag(tags, "operator");
                feature.cableCount = detail::optionalTag(tags, "cables");
            }

            fc.features.push_back(std::move(feature));
        }

        return fc;
    }

    FeatureCollection ReadOverpassFile(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw std::runtime_error("canopy::ReadOverpassFile(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parseOverpass(buffer.str());
    }

} // namespace canopy
