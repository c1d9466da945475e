#pragma once

#include "canopy/transport.hpp"
#include "canopy/types.hpp"

#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace fixtures {

    // Two power=line ways running north-south / east-west near 45.5N 122.6W, and a cable way with a
    // single vertex that must be dropped.
    inline const std::string kOverpassResponse = R"({
        "version": 0.6,
        "elements": [
            {
                "type": "way",
                "id": 1001,
                "tags": {"power": "line", "voltage": "115000", "operator": "PGE", "cables": "3"},
                "geometry": [{"lat": 45.5000, "lon": -122.6000}, {"lat": 45.5010, "lon": -122.6000}]
            },
            {
                "type": "way",
                "id": 1002,
                "tags": {"power": "line"},
                "geometry": [{"lat": 45.5100, "lon": -122.6100}, {"lat": 45.5100, "lon": -122.6050},
                             {"lat": 45.5100, "lon": -122.6000}]
            },
            {
                "type": "way",
                "id": 1003,
                "tags": {"power": "cable"},
                "geometry": [{"lat": 45.5050, "lon": -122.6050}]
            }
        ]
    })";

    inline canopy::BoundingBox viewport() { return canopy::BoundingBox{45.49, -122.62, 45.52, -122.59}; }

    inline canopy::LineFeature meridianLine() {
        canopy::LineFeature f;
        f.id = 1;
        f.coordinates = {{-122.6000, 45.5000}, {-122.6000, 45.5010}};
        return f;
    }

    // HttpTransport double. Records every call; can fail, or hold calls until released.
    class FakeTransport : public canopy::HttpTransport {
      private:
        mutable std::mutex mutex_;
        std::vector<std::string> urls_;
        std::vector<std::string> bodies_;
        std::vector<std::string> contentTypes_;
        std::promise<void> release_;
        std::shared_future<void> gate_;
        bool blocking_ = false;

      public:
        canopy::HttpResponse response{200, kOverpassResponse};
        bool fail = false;

        void block() {
            std::lock_guard<std::mutex> lock(mutex_);
            release_ = std::promise<void>();
            gate_ = release_.get_future().share();
            blocking_ = true;
        }

        void release() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (blocking_) {
                release_.set_value();
                blocking_ = false;
            }
        }

        canopy::HttpResponse post(const std::string &url, const std::string &body,
                                  const std::string &contentType) override {
            std::shared_future<void> gate;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                urls_.push_back(url);
                bodies_.push_back(body);
                contentTypes_.push_back(contentType);
                if (blocking_)
                    gate = gate_;
            }
            if (gate.valid())
                gate.wait();
            if (fail)
                throw canopy::TransportError("connection refused");
            return response;
        }

        size_t calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return bodies_.size();
        }

        std::string lastBody() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return bodies_.empty() ? std::string() : bodies_.back();
        }

        std::string lastUrl() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return urls_.empty() ? std::string() : urls_.back();
        }

        std::string lastContentType() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return contentTypes_.empty() ? std::string() : contentTypes_.back();
        }
    };

} // namespace fixtures
