#include "canopy/ingestor.hpp"
#include "canopy/overpass.hpp"

#include <spdlog/spdlog.h>

namespace canopy {

    std::string toString(FetchStatus status) {
        switch (status) {
        case FetchStatus::Ok:
            return "ok";
        case FetchStatus::InvalidBounds:
            return "invalid_bounds";
        case FetchStatus::TransportError:
            return "transport_error";
        case FetchStatus::HttpError:
            return "http_error";
        case FetchStatus::ParseError:
            return "parse_error";
        }
        return "unknown";
    }

    PowerLineIngestor::PowerLineIngestor(HttpTransport &transport, const IngestorConfig &config)
        : transport_(transport), config_(config) {}

    IngestReport PowerLineIngestor::fetch(const BoundingBox &bbox) const {
        IngestReport report;
        const auto key = cacheKey(bbox);

        if (!bbox.isValid()) {
            report.status = FetchStatus::InvalidBounds;
            report.detail = "bounding box is empty or not finite";
            spdlog::warn("PowerLineIngestor: skipping fetch for [{}]: {}", key, report.detail);
            return report;
        }

        const auto body = encodeFormBody(buildOverpassQuery(bbox, config_.serverTimeoutSeconds));

        HttpResponse response;
        try {
            response = transport_.post(config_.endpoint, body, "application/x-www-form-urlencoded");
        } catch (const std::exception &e) {
            report.status = FetchStatus::TransportError;
            report.detail = e.what();
            spdlog::warn("PowerLineIngestor: query error for [{}]: {}", key, report.detail);
            return report;
        }

        if (!response.ok()) {
            report.status = FetchStatus::HttpError;
            report.detail = "HTTP " + std::to_string(response.status);
            spdlog::warn("PowerLineIngestor: query failed for [{}]: {}", key, report.detail);
            return report;
        }

        try {
            report.collection = parseOverpass(response.body);
        } catch (const std::exception &e) {
            report.status = FetchStatus::ParseError;
            report.detail = e.what();
            spdlog::warn("PowerLineIngestor: bad response for [{}]: {}", key, report.detail);
            return report;
        }

        spdlog::info("PowerLineIngestor: {} power line(s) in [{}]", report.collection.size(), key);
        return report;
    }

} // namespace canopy
