#include "canopy/canopy.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

// usage: powerline_check <south> <west> <north> <east> <lng> <lat> [config.json] [out-prefix]
int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 7) {
        std::cerr << "usage: " << argv[0] << " <south> <west> <north> <east> <lng> <lat> [config.json] [out-prefix]\n";
        return 2;
    }

    try {
        canopy::BoundingBox bbox{std::stod(argv[1]), std::stod(argv[2]), std::stod(argv[3]), std::stod(argv[4])};
        canopy::GeoPoint site{std::stod(argv[5]), std::stod(argv[6])};
        auto config = argc > 7 ? canopy::loadConfig(argv[7]) : canopy::Config{};

        // 1) Fetch the lines around the viewport
        canopy::CurlTransport transport(config.http);
        canopy::PowerLineIngestor ingestor(transport, config.ingestor);
        auto report = ingestor.fetch(bbox);
        if (!report.ok()) {
            std::cerr << "WARNING: fetch failed (" << canopy::toString(report.status) << "): " << report.detail
                      << "\n";
        }
        std::cout << "Power lines in view: " << report.collection.size() << "\n";

        // 2) Check the planting site against them
        canopy::ProximityEvaluator evaluator(config.proximity);
        auto result = evaluator.check(site, report.collection);
        if (result.distanceFt) {
            std::cout << "Nearest line: " << canopy::formatDistance(canopy::feetToMeters(*result.distanceFt))
                      << (result.near ? " (inside buffer)" : "") << "\n";
        } else {
            std::cout << "No power lines to compare against\n";
        }

        // 3) Save lines and buffers for the map
        if (argc > 8) {
            std::string prefix = argv[8];
            canopy::WriteFeatureCollection(report.collection, prefix + "_lines.geojson");
            canopy::WriteFeatureCollection(evaluator.buffers(report.collection), prefix + "_buffers.geojson");
            std::cout << "Saved " << prefix << "_lines.geojson and " << prefix << "_buffers.geojson\n";
        }

        return result.near ? 1 : 0;
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
