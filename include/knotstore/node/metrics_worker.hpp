#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <knotstore/node/worker.hpp>

namespace knotstore::node {

    /// Pull-based view of node counters
    struct MetricsSnapshot {
        std::uint64_t blocks_processed{0};
        std::uint64_t transactions_processed{0};
        std::uint64_t reorgs{0};
        std::uint64_t mempool_count{0};
        std::uint64_t mempool_bytes{0};
        std::int64_t storage_size_bytes{0};
        std::uint64_t storage_failures{0};
        std::uint64_t consecutive_storage_failures{0};
        std::uint64_t events_posted{0};
        std::uint64_t events_dropped{0};
        std::uint64_t publisher_failures{0};
        bool healthy{true};
        std::string last_storage_error;
    };

    namespace metrics_msg {
        struct BlockProcessed {
            std::size_t tx_count{0};
        };
        struct TransactionProcessed {};
        struct ReorgProcessed {
            std::size_t depth{0};
        };
        struct StorageOutcome {
            bool ok{true};
            std::string error;
        };
        struct MempoolLevel {
            std::uint64_t count{0};
            std::uint64_t bytes{0};
        };
        struct GetMetrics {
            Reply<MetricsSnapshot> reply;
        };
    } // namespace metrics_msg

    using MetricsMessage =
        std::variant<metrics_msg::BlockProcessed, metrics_msg::TransactionProcessed, metrics_msg::ReorgProcessed,
                     metrics_msg::StorageOutcome, metrics_msg::MempoolLevel, metrics_msg::GetMetrics>;

    /// Owns the node counters and the storage health state
    class MetricsWorker {
      public:
        MetricsWorker(std::size_t capacity, std::uint32_t max_storage_failures);

        void start() { worker_.start(); }
        void stop() { worker_.stop(); }

        void blockProcessed(std::size_t tx_count);
        void transactionProcessed();
        void reorgProcessed(std::size_t depth);
        /// Only StorageUnavailable counts as a failure; any committed mutation resets the streak
        void storageOutcome(bool ok, const std::string &error = "");
        void mempoolLevel(std::uint64_t count, std::uint64_t bytes);

        dp::Result<MetricsSnapshot, dp::Error> snapshot();

      private:
        std::uint32_t max_storage_failures_;
        MetricsSnapshot counters_;
        Worker<MetricsMessage> worker_;

        void handle(MetricsMessage &message);
        void post(MetricsMessage message);
    };

} // namespace knotstore::node
