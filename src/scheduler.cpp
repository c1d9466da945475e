#include "canopy/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace canopy {

    FetchScheduler::FetchScheduler(const PowerLineIngestor &ingestor, ViewportCache &cache,
                                   const SchedulerConfig &config, NowFn now)
        : ingestor_(ingestor), cache_(cache), config_(config), now_(std::move(now)) {}

    void FetchScheduler::onViewportChange(const BoundingBox &bbox, double zoom, Callback callback) {
        ++generation_;
        pending_.reset();

        if (zoom < config_.minZoom) {
            spdlog::debug("FetchScheduler: zoom {} below {}, not fetching", zoom, config_.minZoom);
            callback(FeatureCollection{});
            return;
        }

        pending_ = PendingRequest{bbox, std::move(callback), now_() + config_.quietPeriod, generation_};
    }

    size_t FetchScheduler::poll() {
        size_t delivered = fireDueTimer();
        delivered += harvest();
        return delivered;
    }

    size_t FetchScheduler::wait() {
        size_t delivered = 0;
        while (!inFlight_.empty()) {
            for (auto &flight : inFlight_)
                flight.result.wait();
            delivered += harvest();
        }
        return delivered;
    }

    std::optional<FetchScheduler::TimePoint> FetchScheduler::nextDue() const {
        if (!pending_)
            return std::nullopt;
        return pending_->due;
    }

    size_t FetchScheduler::fireDueTimer() {
        if (!pending_ || now_() < pending_->due)
            return 0;

        PendingRequest request = std::move(*pending_);
        pending_.reset();

        auto key = cacheKey(request.bbox);
        if (auto cached = cache_.get(key)) {
            spdlog::debug("FetchScheduler: cache hit for [{}]", key);
            request.callback(*cached);
            return 1;
        }

        spdlog::debug("FetchScheduler: fetching [{}] (generation {})", key, request.generation);
        const PowerLineIngestor *ingestor = &ingestor_;
        BoundingBox bbox = request.bbox;
        inFlight_.push_back(InFlight{std::move(key), std::move(request.callback), request.generation,
                                     std::async(std::launch::async, [ingestor, bbox] { return ingestor->fetch(bbox); })});
        return 0;
    }

    size_t FetchScheduler::harvest() {
        // Callbacks may call back into the scheduler, so finished fetches leave inFlight_ before delivery.
        std::vector<InFlight> ready;
        auto split = std::stable_partition(inFlight_.begin(), inFlight_.end(), [](const InFlight &flight) {
            return flight.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        std::move(split, inFlight_.end(), std::back_inserter(ready));
        inFlight_.erase(split, inFlight_.end());

        size_t delivered = 0;
        for (auto &flight : ready)
            delivered += deliver(flight);
        return delivered;
    }

    size_t FetchScheduler::deliver(InFlight &flight) {
        IngestReport report = flight.result.get();

        std::shared_ptr<const FeatureCollection> stored;
        if (report.ok()) {
            cache_.put(flight.key, std::move(report.collection));
            stored = cache_.get(flight.key);
        }

        if (flight.generation != generation_ && config_.discardSuperseded) {
            spdlog::debug("FetchScheduler: dropping superseded result for [{}] (generation {} < {})", flight.key,
                          flight.generation, generation_);
            return 0;
        }

        if (stored) {
            flight.callback(*stored);
        } else {
            spdlog::debug("FetchScheduler: delivering empty collection for [{}] after {}", flight.key,
                          toString(report.status));
            flight.callback(FeatureCollection{});
        }
        return 1;
    }

} // namespace canopy
