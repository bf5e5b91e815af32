#pragma once

#include <condition_variable>
#include <cstddef>
#include <datapod/datapod.hpp>
#include <deque>
#include <mutex>
#include <optional>

#include <knotstore/common/error.hpp>

namespace knotstore::node {

    /// Bounded FIFO between senders and one consuming worker thread
    template <typename T> class Mailbox {
      public:
        explicit Mailbox(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        Mailbox(const Mailbox &) = delete;
        Mailbox &operator=(const Mailbox &) = delete;

        /// Enqueue, waiting for capacity; fails only once the mailbox is closed
        inline dp::Result<void, dp::Error> send(T message) {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
            if (closed_)
                return dp::Result<void, dp::Error>::err(mailbox_closed());
            queue_.push_back(std::move(message));
            lock.unlock();
            not_empty_.notify_one();
            return dp::Result<void, dp::Error>::ok();
        }

        /// Enqueue without waiting; MailboxFull if at capacity
        inline dp::Result<void, dp::Error> trySend(T message) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_)
                return dp::Result<void, dp::Error>::err(mailbox_closed());
            if (queue_.size() >= capacity_)
                return dp::Result<void, dp::Error>::err(mailbox_full());
            queue_.push_back(std::move(message));
            lock.unlock();
            not_empty_.notify_one();
            return dp::Result<void, dp::Error>::ok();
        }

        /// Next message in arrival order; nullopt once closed and drained
        inline std::optional<T> receive() {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty())
                return std::nullopt;
            T message = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            not_full_.notify_one();
            return std::optional<T>(std::move(message));
        }

        inline void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            not_empty_.notify_all();
            not_full_.notify_all();
        }

        /// Re-open after close(); queued messages are kept
        inline void reopen() {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = false;
        }

        inline std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

        std::size_t capacity() const { return capacity_; }

      private:
        const std::size_t capacity_;
        std::deque<T> queue_;
        bool closed_{false};
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
    };

} // namespace knotstore::node
