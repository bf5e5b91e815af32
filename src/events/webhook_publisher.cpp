#include <knotstore/common/error.hpp>
#include <knotstore/common/logger.hpp>
#include <knotstore/events/webhook_publisher.hpp>

#include <chrono>

namespace knotstore::events {

    namespace {
        const char *CATEGORY = "webhook";
    }

    WebhookPublisher::WebhookPublisher(WebhookPublisherConfig config, std::shared_ptr<HttpTransport> transport)
        : config_(std::move(config)), transport_(std::move(transport)) {}

    void WebhookPublisher::shutdown() {
        {
            std::lock_guard<std::mutex> lock(sleep_mutex_);
            shutting_down_ = true;
        }
        sleep_cv_.notify_all();
    }

    bool WebhookPublisher::stopped() {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        return shutting_down_;
    }

    bool WebhookPublisher::backoff(std::uint32_t attempt) {
        std::unique_lock<std::mutex> lock(sleep_mutex_);
        auto delay = std::chrono::milliseconds(static_cast<std::int64_t>(config_.backoff_ms) * attempt);
        return !sleep_cv_.wait_for(lock, delay, [this] { return shutting_down_; });
    }

    bool WebhookPublisher::deliver(const std::string &endpoint, const std::string &body, std::string &last_error) {
        HttpRequest request;
        request.url = endpoint;
        request.headers = {"Content-Type: application/json", "User-Agent: knotstore"};
        request.body = body;
        request.timeout_secs = config_.timeout_secs;

        std::uint32_t total = config_.retry_attempts + 1;
        for (std::uint32_t attempt = 1; attempt <= total; ++attempt) {
            if (stopped()) {
                last_error = "publisher shut down";
                break;
            }
            attempts_++;
            HttpResponse response = transport_->post(request);
            if (response.ok())
                return true;

            last_error = response.error.empty() ? "HTTP status " + std::to_string(response.status) : response.error;
            KNOTSTORE_LOG_WARN(CATEGORY, "attempt " + std::to_string(attempt) + "/" + std::to_string(total) + " to " +
                                             endpoint + " failed: " + last_error);
            if (attempt < total && !backoff(attempt))
                break;
        }
        return false;
    }

    dp::Result<void, dp::Error> WebhookPublisher::publish(const Event &event) {
        std::string body = event.toJson();
        std::string failed_endpoints;

        for (const auto &endpoint : config_.endpoints) {
            std::string last_error;
            if (deliver(endpoint, body, last_error))
                continue;

            failures_++;
            KNOTSTORE_LOG_ERROR(CATEGORY, "dropping event " + std::to_string(event.id) + " for " + endpoint +
                                              " after retries: " + last_error);
            if (!failed_endpoints.empty())
                failed_endpoints += ", ";
            failed_endpoints += endpoint;
        }

        if (!failed_endpoints.empty()) {
            return dp::Result<void, dp::Error>::err(
                publisher_failure(dp::String(("webhook delivery failed: " + failed_endpoints).c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace knotstore::events
