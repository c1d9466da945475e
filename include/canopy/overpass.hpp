#pragma once

#include "canopy/types.hpp"

#include <filesystem>
#include <string>

namespace canopy {

    // Overpass QL selecting power=line|minor_line|cable ways inside bbox, with geometry output.
    std::string buildOverpassQuery(const BoundingBox &bbox, int timeoutSeconds = 15);

    // application/x-www-form-urlencoded body: "data=<percent-encoded query>".
    std::string encodeFormBody(const std::string &query);

    // Converts an Overpass JSON response into line features. Elements that are not ways or carry
    // fewer than 2 geometry vertices are dropped. Throws ParseError on a malformed document.
    FeatureCollection parseOverpass(const std::string &json);

    FeatureCollection ReadOverpassFile(const std::filesystem::path &file);

} // namespace canopy
