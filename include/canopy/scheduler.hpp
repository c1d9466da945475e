#pragma once

#include "canopy/cache.hpp"
#include "canopy/config.hpp"
#include "canopy/ingestor.hpp"
#include "canopy/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace canopy {

    // Trailing-edge debounce of viewport changes in front of the power-line ingestor.
    //
    // The scheduler is cooperative: the host calls poll() from its event loop (every frame, or when
    // nextDue() passes). poll() fires the debounce timer once the quiet period has elapsed and hands
    // finished fetches to their callbacks. Fetches themselves run on std::async workers; cache writes
    // and callbacks always happen on the thread calling poll()/wait().
    //
    // Every viewport change bumps a generation counter. A fetch that completes after a newer change
    // still refreshes the cache, but its callback is dropped when discardSuperseded is set.
    class FetchScheduler {
      public:
        using Clock = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;
        using NowFn = std::function<TimePoint()>;
        using Callback = std::function<void(const FeatureCollection &)>;

      private:
        struct PendingRequest {
            BoundingBox bbox;
            Callback callback;
            TimePoint due;
            std::uint64_t generation = 0;
        };

        struct InFlight {
            std::string key;
            Callback callback;
            std::uint64_t generation = 0;
            std::future<IngestReport> result;
        };

        const PowerLineIngestor &ingestor_;
        ViewportCache &cache_;
        SchedulerConfig config_;
        NowFn now_;

        std::optional<PendingRequest> pending_;
        std::vector<InFlight> inFlight_;
        std::uint64_t generation_ = 0;

        size_t fireDueTimer();
        size_t harvest();
        size_t deliver(InFlight &flight);

      public:
        FetchScheduler(const PowerLineIngestor &ingestor, ViewportCache &cache,
                       const SchedulerConfig &config = SchedulerConfig{}, NowFn now = &Clock::now);

        FetchScheduler(const FetchScheduler &) = delete;
        FetchScheduler &operator=(const FetchScheduler &) = delete;

        // Replaces any pending request. Below minZoom the callback runs immediately with an empty
        // collection and nothing is fetched.
        void onViewportChange(const BoundingBox &bbox, double zoom, Callback callback);

        // Returns the number of callbacks invoked.
        size_t poll();

        // Blocks until every in-flight fetch has finished, then delivers them. Does not fire a timer
        // that is not yet due.
        size_t wait();

        bool hasPendingTimer() const { return pending_.has_value(); }
        size_t inFlight() const { return inFlight_.size(); }
        std::uint64_t generation() const { return generation_; }
        std::optional<TimePoint> nextDue() const;

        const SchedulerConfig &config() const { return config_; }
    };

} // namespace canopy
