#pragma once

#include "canopy/transport.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace canopy {

    struct IngestorConfig {
        std::string endpoint = "https://overpass-api.de/api/interpreter";
        int serverTimeoutSeconds = 15; // declared inside the query text
    };

    struct SchedulerConfig {
        std::chrono::milliseconds quietPeriod{800};
        double minZoom = 14.0;
        // Drop callbacks of fetches whose viewport has since been replaced. Results are still cached.
        bool discardSuperseded = true;
    };

    struct ProximityConfig {
        double bufferFt = 30.0;
        int arcSegments = 36;
    };

    struct Config {
        IngestorConfig ingestor;
        SchedulerConfig scheduler;
        ProximityConfig proximity;
        CurlOptions http;
    };

    // Reads optional "ingestor", "scheduler", "proximity" and "http" sections. Missing keys keep their
    // defaults, unknown keys are ignored, a key of the wrong type throws ConfigError.
    Config parseConfig(const std::string &json);

    Config loadConfig(const std::filesystem::path &file);

} // namespace canopy
