#pragma once

#include <functional>
#include <future>
#include <string>
#include <thread>

#include <knotstore/common/error.hpp>
#include <knotstore/common/logger.hpp>
#include <knotstore/node/mailbox.hpp>

namespace knotstore::node {

    template <typename T> using Reply = std::promise<dp::Result<T, dp::Error>>;

    /// Wait for a worker's reply; a worker that stopped without answering reports MailboxClosed
    template <typename T> inline dp::Result<T, dp::Error> awaitReply(std::future<dp::Result<T, dp::Error>> &future) {
        try {
            return future.get();
        } catch (const std::future_error &e) {
            return dp::Result<T, dp::Error>::err(mailbox_closed(dp::String(e.what())));
        }
    }

    /// One thread draining one mailbox. Messages are handled strictly in arrival order.
    template <typename Message> class Worker {
      public:
        using Handler = std::function<void(Message &)>;

        Worker(std::string name, std::size_t capacity, Handler handler)
            : name_(std::move(name)), mailbox_(capacity), handler_(std::move(handler)) {}

        ~Worker() { stop(); }

        Worker(const Worker &) = delete;
        Worker &operator=(const Worker &) = delete;

        inline void start() {
            if (thread_.joinable())
                return;
            mailbox_.reopen();
            thread_ = std::thread([this] { run(); });
        }

        /// Close the mailbox, process what is already queued and join
        inline void stop() {
            mailbox_.close();
            if (thread_.joinable())
                thread_.join();
        }

        inline dp::Result<void, dp::Error> send(Message message) { return mailbox_.send(std::move(message)); }
        inline dp::Result<void, dp::Error> trySend(Message message) { return mailbox_.trySend(std::move(message)); }

        const std::string &name() const { return name_; }
        std::size_t queued() const { return mailbox_.size(); }

      private:
        std::string name_;
        Mailbox<Message> mailbox_;
        Handler handler_;
        std::thread thread_;

        inline void run() {
            while (auto message = mailbox_.receive()) {
                try {
                    handler_(*message);
                } catch (const std::exception &e) {
                    KNOTSTORE_LOG_ERROR(name_, std::string("unhandled exception: ") + e.what());
                }
            }
        }
    };

} // namespace knotstore::node
