#pragma once

#include "canopy/config.hpp"
#include "canopy/transport.hpp"
#include "canopy/types.hpp"

#include <string>

namespace canopy {

    enum class FetchStatus { Ok, InvalidBounds, TransportError, HttpError, ParseError };

    std::string toString(FetchStatus status);

    struct IngestReport {
        FeatureCollection collection; // empty unless status == Ok
        FetchStatus status = FetchStatus::Ok;
        std::string detail;

        bool ok() const { return status == FetchStatus::Ok; }
    };

    // Fetches power lines for a viewport window. One transport call per fetch, no retries, and no
    // exceptions: every failure degrades to an empty collection.
    class PowerLineIngestor {
      private:
        HttpTransport &transport_;
        IngestorConfig config_;

      public:
        explicit PowerLineIngestor(HttpTransport &transport, const IngestorConfig &config = IngestorConfig{});

        IngestReport fetch(const BoundingBox &bbox) const;

        FeatureCollection ingest(const BoundingBox &bbox) const { return fetch(bbox).collection; }

        const IngestorConfig &config() const { return config_; }
    };

} // namespace canopy
