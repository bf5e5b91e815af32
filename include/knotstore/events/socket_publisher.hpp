#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <knotstore/common/config.hpp>
#include <knotstore/events/publisher.hpp>

namespace knotstore::events {

    /// TCP pub/sub endpoint. Subscribers receive newline-terminated frames "<topic> <json>".
    /// Sends never block the caller: each subscriber has a bounded frame buffer and the
    /// oldest frame is dropped when it is full. Subscribers whose socket errors are disconnected.
    class SocketPublisher : public IPublisher {
      public:
        explicit SocketPublisher(SocketPublisherConfig config);
        ~SocketPublisher() override;

        SocketPublisher(const SocketPublisher &) = delete;
        SocketPublisher &operator=(const SocketPublisher &) = delete;

        /// Bind and listen (port 0 picks a free port) and start the I/O thread
        dp::Result<void, dp::Error> start();

        std::string name() const override { return "socket"; }
        dp::Result<void, dp::Error> publish(const Event &event) override;
        void shutdown() override;

        std::uint16_t boundPort() const { return bound_port_; }
        std::size_t subscriberCount() const;
        std::uint64_t droppedFrames() const { return dropped_frames_; }

        std::string frame(const Event &event) const;

      private:
        struct Subscriber {
            int fd{-1};
            std::deque<std::string> pending;
            std::size_t offset{0};
        };

        SocketPublisherConfig config_;
        int listen_fd_{-1};
        int wake_fds_[2]{-1, -1};
        std::uint16_t bound_port_{0};
        std::thread io_thread_;
        std::atomic<bool> running_{false};
        std::atomic<std::uint64_t> dropped_frames_{0};

        mutable std::mutex mutex_;
        std::vector<Subscriber> subscribers_;

        void ioLoop();
        void acceptPending();
        void flushSubscriber(Subscriber &sub);
        void wake();
        bool wantsTopic(const std::string &topic) const;
    };

} // namespace knotstore::events
