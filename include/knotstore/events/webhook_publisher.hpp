#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

#include <knotstore/common/config.hpp>
#include <knotstore/events/http_transport.hpp>
#include <knotstore/events/publisher.hpp>

namespace knotstore::events {

    /// POSTs each event as JSON to every configured endpoint.
    /// A failed attempt is retried up to retry_attempts times, waiting backoff_ms * attempt in between;
    /// after that the event is dropped for that endpoint and the failure is logged and counted.
    class WebhookPublisher : public IPublisher {
      public:
        WebhookPublisher(WebhookPublisherConfig config, std::shared_ptr<HttpTransport> transport);

        std::string name() const override { return "webhook"; }
        dp::Result<void, dp::Error> publish(const Event &event) override;
        void shutdown() override;

        std::uint64_t attempts() const { return attempts_; }
        std::uint64_t failures() const { return failures_; }

      private:
        WebhookPublisherConfig config_;
        std::shared_ptr<HttpTransport> transport_;
        std::atomic<std::uint64_t> attempts_{0};
        std::atomic<std::uint64_t> failures_{0};

        std::mutex sleep_mutex_;
        std::condition_variable sleep_cv_;
        bool shutting_down_{false};

        bool stopped();
        /// Returns false if shutdown interrupted the wait
        bool backoff(std::uint32_t attempt);
        bool deliver(const std::string &endpoint, const std::string &body, std::string &last_error);
    };

} // namespace knotstore::events
