#include <knotstore/common/overloaded.hpp>
#include <knotstore/node/mempool_worker.hpp>

namespace knotstore::node {

    namespace {
        const char *CATEGORY = "mempool-worker";
    }

    MempoolWorker::MempoolWorker(mempool::Mempool &pool, MetricsWorker &metrics, Emitter emit,
                                 std::uint64_t max_bytes, std::size_t capacity)
        : pool_(pool), metrics_(metrics), emit_(std::move(emit)), max_bytes_(max_bytes),
          worker_("mempool", capacity, [this](MempoolMessage &message) { handle(message); }) {}

    dp::Result<mempool::EntryPtr, dp::Error> MempoolWorker::submit(ledger::Transaction tx, std::int64_t fee) {
        Reply<mempool::EntryPtr> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(mempool_msg::Submit{std::move(tx), fee, std::move(reply)});
        if (sent.is_err())
            return dp::Result<mempool::EntryPtr, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    dp::Result<std::size_t, dp::Error> MempoolWorker::blockConfirmed(std::vector<ledger::Transaction> txs) {
        Reply<std::size_t> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(mempool_msg::BlockConfirmed{std::move(txs), std::move(reply)});
        if (sent.is_err())
            return dp::Result<std::size_t, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    dp::Result<std::size_t, dp::Error>
    MempoolWorker::chainReorganized(std::vector<ledger::Transaction> connected_txs) {
        Reply<std::size_t> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(mempool_msg::ChainReorganized{std::move(connected_txs), std::move(reply)});
        if (sent.is_err())
            return dp::Result<std::size_t, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    void MempoolWorker::reportLevel() { metrics_.mempoolLevel(pool_.size(), pool_.bytes()); }

    void MempoolWorker::handle(MempoolMessage &message) {
        std::visit(
            overloaded{
                [this](mempool_msg::Submit &m) {
                    auto admitted = pool_.admit(m.tx, m.fee);
                    if (admitted.is_err()) {
                        KNOTSTORE_LOG_DEBUG(CATEGORY, "rejected " + ledger::toHex(m.tx.txid) + ": " +
                                                          error_text(admitted.error()));
                        m.reply.set_value(admitted);
                        return;
                    }

                    auto evicted = pool_.evictToCapacity(max_bytes_);
                    if (!evicted.empty())
                        KNOTSTORE_LOG_INFO(CATEGORY, "evicted " + std::to_string(evicted.size()) + " entries");
                    reportLevel();

                    if (!pool_.contains(m.tx.txid)) {
                        m.reply.set_value(dp::Result<mempool::EntryPtr, dp::Error>::err(
                            dp::Error::out_of_range("mempool full: fee rate below eviction threshold")));
                        return;
                    }

                    const auto &entry = admitted.value();
                    metrics_.transactionProcessed();
                    if (emit_)
                        emit_(events::TransactionAccepted{entry->tx.txid, entry->size, entry->fee, entry->fee_rate});
                    m.reply.set_value(admitted);
                },
                [this](mempool_msg::BlockConfirmed &m) {
                    auto removed = pool_.removeForBlock(m.txs);
                    if (!removed.empty())
                        KNOTSTORE_LOG_DEBUG(CATEGORY,
                                            "block confirmed or conflicted " + std::to_string(removed.size()) +
                                                " entries");
                    reportLevel();
                    m.reply.set_value(dp::Result<std::size_t, dp::Error>::ok(removed.size()));
                },
                [this](mempool_msg::ChainReorganized &m) {
                    auto removed = pool_.removeForBlock(m.connected_txs);
                    auto stale = pool_.removeUnspendable();
                    if (!stale.empty())
                        KNOTSTORE_LOG_INFO(CATEGORY, "dropped " + std::to_string(stale.size()) +
                                                         " entries spending disconnected outputs");
                    reportLevel();
                    m.reply.set_value(dp::Result<std::size_t, dp::Error>::ok(removed.size() + stale.size()));
                }},
            message);
    }

} // namespace knotstore::node
