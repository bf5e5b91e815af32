#include <knotstore/common/error.hpp>
#include <knotstore/common/logger.hpp>
#include <knotstore/events/dispatcher.hpp>

namespace knotstore::events {

    namespace {
        const char *CATEGORY = "events";
    }

    std::uint64_t DispatcherStats::totalFailures() const {
        std::uint64_t total = 0;
        for (const auto &p : publishers)
            total += p.failed;
        return total;
    }

    std::uint64_t DispatcherStats::totalDropped() const {
        std::uint64_t total = dropped;
        for (const auto &p : publishers)
            total += p.dropped;
        return total;
    }

    EventDispatcher::EventDispatcher(std::string network, std::string node_id, std::size_t queue_capacity,
                                     std::size_t lane_capacity)
        : network_(std::move(network)), node_id_(std::move(node_id)),
          queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity),
          lane_capacity_(lane_capacity == 0 ? 1 : lane_capacity) {}

    EventDispatcher::~EventDispatcher() { stop(); }

    void EventDispatcher::addPublisher(std::shared_ptr<IPublisher> publisher) {
        if (running_) {
            KNOTSTORE_LOG_WARN(CATEGORY, "publisher " + publisher->name() + " registered after start; ignored");
            return;
        }
        auto lane = std::make_unique<Lane>();
        lane->publisher = std::move(publisher);
        lanes_.push_back(std::move(lane));
    }

    void EventDispatcher::start() {
        if (running_.exchange(true))
            return;
        stopping_ = false;
        for (auto &lane : lanes_) {
            lane->closed = false;
            Lane *raw = lane.get();
            lane->thread = std::thread([this, raw] { laneLoop(*raw); });
        }
        dispatch_thread_ = std::thread([this] { dispatchLoop(); });
        KNOTSTORE_LOG_INFO(CATEGORY, "event dispatcher started with " + std::to_string(lanes_.size()) + " publishers");
    }

    void EventDispatcher::stop() {
        if (!running_)
            return;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        if (dispatch_thread_.joinable())
            dispatch_thread_.join();

        // Wake sleeping retries first; events still queued in a lane are dropped, not delivered
        for (auto &lane : lanes_) {
            lane->publisher->shutdown();
            {
                std::lock_guard<std::mutex> lock(lane->mutex);
                lane->closed = true;
            }
            lane->cv.notify_all();
        }
        for (auto &lane : lanes_) {
            if (lane->thread.joinable())
                lane->thread.join();
        }
        running_ = false;
    }

    std::uint64_t EventDispatcher::post(EventPayload payload) {
        auto event = std::make_shared<Event>();
        event->id = next_id_++;
        event->timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        event->network = network_;
        event->node_id = node_id_;
        event->payload = std::move(payload);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stopping_) {
                dropped_++;
                return event->id;
            }
            if (queue_.size() >= queue_capacity_) {
                queue_.pop_front();
                dropped_++;
            }
            queue_.push_back(event);
            posted_++;
        }
        queue_cv_.notify_one();
        return event->id;
    }

    void EventDispatcher::dispatchLoop() {
        while (true) {
            std::shared_ptr<const Event> event;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                    return;
                event = queue_.front();
                queue_.pop_front();
                dispatching_ = true;
            }

            for (auto &lane : lanes_) {
                {
                    std::lock_guard<std::mutex> lock(lane->mutex);
                    if (lane->queue.size() >= lane_capacity_) {
                        lane->queue.pop_front();
                        lane->dropped++;
                        KNOTSTORE_LOG_WARN(CATEGORY, "lane " + lane->publisher->name() + " full; dropped oldest event");
                    }
                    lane->queue.push_back(event);
                }
                lane->cv.notify_one();
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                dispatching_ = false;
            }
        }
    }

    void EventDispatcher::laneLoop(Lane &lane) {
        while (true) {
            std::shared_ptr<const Event> event;
            {
                std::unique_lock<std::mutex> lock(lane.mutex);
                lane.cv.wait(lock, [&] { return lane.closed || !lane.queue.empty(); });
                if (lane.closed) {
                    if (!lane.queue.empty()) {
                        lane.dropped += lane.queue.size();
                        KNOTSTORE_LOG_WARN(CATEGORY, "lane " + lane.publisher->name() + " closed with " +
                                                         std::to_string(lane.queue.size()) + " undelivered events");
                        lane.queue.clear();
                    }
                    return;
                }
                event = lane.queue.front();
                lane.queue.pop_front();
                lane.busy = true;
            }

            auto result = [&]() -> dp::Result<void, dp::Error> {
                try {
                    return lane.publisher->publish(*event);
                } catch (const std::exception &e) {
                    return dp::Result<void, dp::Error>::err(publisher_failure(dp::String(e.what())));
                }
            }();

            if (result.is_ok()) {
                lane.delivered++;
            } else {
                lane.failed++;
                KNOTSTORE_LOG_ERROR(CATEGORY, "publisher " + lane.publisher->name() + " failed on event " +
                                                  std::to_string(event->id) + ": " + error_text(result.error()));
            }

            {
                std::lock_guard<std::mutex> lock(lane.mutex);
                lane.busy = false;
            }
        }
    }

    bool EventDispatcher::waitIdle(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            bool idle = true;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                idle = queue_.empty() && !dispatching_;
            }
            for (auto &lane : lanes_) {
                if (!idle)
                    break;
                std::lock_guard<std::mutex> lock(lane->mutex);
                idle = lane->queue.empty() && !lane->busy;
            }
            if (idle)
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    DispatcherStats EventDispatcher::stats() const {
        DispatcherStats s;
        s.posted = posted_;
        s.dropped = dropped_;
        for (const auto &lane : lanes_)
            s.publishers.push_back(PublisherStats{lane->publisher->name(), lane->delivered, lane->failed, lane->dropped});
        return s;
    }

} // namespace knotstore::events
