#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <knotstore/events/event.hpp>
#include <knotstore/events/publisher.hpp>

namespace knotstore::events {

    struct PublisherStats {
        std::string name;
        std::uint64_t delivered{0};
        std::uint64_t failed{0};
        std::uint64_t dropped{0};
    };

    struct DispatcherStats {
        std::uint64_t posted{0};
        /// Events dropped from the central queue because it was full
        std::uint64_t dropped{0};
        std::vector<PublisherStats> publishers;

        std::uint64_t totalFailures() const;
        std::uint64_t totalDropped() const;
    };

    /// Fans events out to publishers.
    /// post() never blocks: a bounded central queue feeds one bounded lane (queue + thread) per publisher,
    /// so a slow or failing publisher only ever delays its own lane. Full queues drop their oldest event.
    class EventDispatcher {
      public:
        EventDispatcher(std::string network, std::string node_id, std::size_t queue_capacity,
                        std::size_t lane_capacity);
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher &) = delete;
        EventDispatcher &operator=(const EventDispatcher &) = delete;

        /// Register before start()
        void addPublisher(std::shared_ptr<IPublisher> publisher);

        void start();
        /// Stop accepting events, shut publishers down and join threads.
        /// Events not yet handed to a publisher are counted as dropped.
        void stop();

        /// Wrap the payload in an envelope and enqueue it; returns the assigned event id
        std::uint64_t post(EventPayload payload);

        /// Wait until every queued event has been handed to every publisher
        bool waitIdle(std::chrono::milliseconds timeout);

        DispatcherStats stats() const;

      private:
        struct Lane {
            std::shared_ptr<IPublisher> publisher;
            std::deque<std::shared_ptr<const Event>> queue;
            std::mutex mutex;
            std::condition_variable cv;
            std::thread thread;
            bool busy{false};
            bool closed{false};
            std::atomic<std::uint64_t> delivered{0};
            std::atomic<std::uint64_t> failed{0};
            std::atomic<std::uint64_t> dropped{0};
        };

        std::string network_;
        std::string node_id_;
        std::size_t queue_capacity_;
        std::size_t lane_capacity_;

        std::deque<std::shared_ptr<const Event>> queue_;
        mutable std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        bool dispatching_{false};
        std::thread dispatch_thread_;

        std::vector<std::unique_ptr<Lane>> lanes_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::atomic<std::uint64_t> next_id_{1};
        std::atomic<std::uint64_t> posted_{0};
        std::atomic<std::uint64_t> dropped_{0};

        void dispatchLoop();
        void laneLoop(Lane &lane);
    };

} // namespace knotstore::events
