#include <knotstore/common/overloaded.hpp>
#include <knotstore/node/metrics_worker.hpp>

namespace knotstore::node {

    MetricsWorker::MetricsWorker(std::size_t capacity, std::uint32_t max_storage_failures)
        : max_storage_failures_(max_storage_failures == 0 ? 1 : max_storage_failures),
          worker_("metrics", capacity, [this](MetricsMessage &message) { handle(message); }) {}

    void MetricsWorker::post(MetricsMessage message) {
        auto sent = worker_.send(std::move(message));
        if (sent.is_err())
            KNOTSTORE_LOG_DEBUG("metrics", "update discarded: " + error_text(sent.error()));
    }

    void MetricsWorker::blockProcessed(std::size_t tx_count) { post(metrics_msg::BlockProcessed{tx_count}); }

    void MetricsWorker::transactionProcessed() { post(metrics_msg::TransactionProcessed{}); }

    void MetricsWorker::reorgProcessed(std::size_t depth) { post(metrics_msg::ReorgProcessed{depth}); }

    void MetricsWorker::storageOutcome(bool ok, const std::string &error) {
        post(metrics_msg::StorageOutcome{ok, error});
    }

    void MetricsWorker::mempoolLevel(std::uint64_t count, std::uint64_t bytes) {
        post(metrics_msg::MempoolLevel{count, bytes});
    }

    dp::Result<MetricsSnapshot, dp::Error> MetricsWorker::snapshot() {
        Reply<MetricsSnapshot> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(metrics_msg::GetMetrics{std::move(reply)});
        if (sent.is_err())
            return dp::Result<MetricsSnapshot, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    void MetricsWorker::handle(MetricsMessage &message) {
        std::visit(overloaded{[this](metrics_msg::BlockProcessed &) { counters_.blocks_processed++; },
                              [this](metrics_msg::TransactionProcessed &) { counters_.transactions_processed++; },
                              [this](metrics_msg::ReorgProcessed &) { counters_.reorgs++; },
                              [this](metrics_msg::StorageOutcome &m) {
                                  if (m.ok) {
                                      counters_.consecutive_storage_failures = 0;
                                  } else {
                                      counters_.storage_failures++;
                                      counters_.consecutive_storage_failures++;
                                      counters_.last_storage_error = m.error;
                                  }
                                  bool healthy = counters_.consecutive_storage_failures < max_storage_failures_;
                                  if (counters_.healthy && !healthy)
                                      KNOTSTORE_LOG_ERROR("metrics", "node unhealthy after " +
                                                                         std::to_string(max_storage_failures_) +
                                                                         " consecutive storage failures");
                                  counters_.healthy = healthy;
                              },
                              [this](metrics_msg::MempoolLevel &m) {
                                  counters_.mempool_count = m.count;
                                  counters_.mempool_bytes = m.bytes;
                              },
                              [this](metrics_msg::GetMetrics &m) {
                                  m.reply.set_value(dp::Result<MetricsSnapshot, dp::Error>::ok(counters_));
                              }},
                   message);
    }

} // namespace knotstore::node
