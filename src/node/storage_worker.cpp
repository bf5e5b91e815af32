#include <knotstore/common/overloaded.hpp>
#include <knotstore/node/storage_worker.hpp>

namespace knotstore::node {

    namespace {
        const char *CATEGORY = "storage-worker";
    }

    StorageWorker::StorageWorker(storage::LedgerStore &store, MetricsWorker &metrics, std::size_t capacity)
        : store_(store), metrics_(metrics),
          worker_("storage", capacity, [this](StorageMessage &message) { handle(message); }) {}

    template <typename T> void StorageWorker::report(const dp::Result<T, dp::Error> &result) {
        if (result.is_ok()) {
            metrics_.storageOutcome(true);
        } else if (is_error(result.error(), ERR_STORAGE_UNAVAILABLE)) {
            KNOTSTORE_LOG_ERROR(CATEGORY, error_text(result.error()));
            metrics_.storageOutcome(false, error_text(result.error()));
        }
    }

    dp::Result<void, dp::Error> StorageWorker::connect(ledger::Block block, ledger::UtxoDiff diff,
                                                       ledger::ChainTip tip) {
        Reply<void> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(storage_msg::Connect{std::move(block), std::move(diff), tip, std::move(reply)});
        if (sent.is_err())
            return sent;
        return awaitReply(future);
    }

    dp::Result<std::vector<ledger::Transaction>, dp::Error>
    StorageWorker::reorganize(std::vector<ledger::Hash256> disconnect, std::vector<ledger::Hash256> connect,
                              ledger::ChainTip tip, ledger::Block incoming, ledger::UtxoDiff diff) {
        Reply<std::vector<ledger::Transaction>> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(storage_msg::Reorganize{std::move(disconnect), std::move(connect), tip,
                                                         std::move(incoming), std::move(diff), std::move(reply)});
        if (sent.is_err())
            return dp::Result<std::vector<ledger::Transaction>, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    dp::Result<void, dp::Error> StorageWorker::storeSide(ledger::Block block, ledger::UtxoDiff diff) {
        Reply<void> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(storage_msg::StoreSide{std::move(block), std::move(diff), std::move(reply)});
        if (sent.is_err())
            return sent;
        return awaitReply(future);
    }

    dp::Result<void, dp::Error> StorageWorker::backup(std::string destination) {
        Reply<void> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(storage_msg::Backup{std::move(destination), std::move(reply)});
        if (sent.is_err())
            return sent;
        return awaitReply(future);
    }

    void StorageWorker::handle(StorageMessage &message) {
        std::visit(
            overloaded{
                [this](storage_msg::Connect &m) {
                    auto result = store_.connectBlock(m.block, m.diff, m.tip);
                    report(result);
                    m.reply.set_value(result);
                },
                [this](storage_msg::Reorganize &m) {
                    auto result = store_.reorganize(m.disconnect, m.connect, m.tip, &m.incoming, &m.diff);
                    report(result);
                    if (result.is_err()) {
                        m.reply.set_value(dp::Result<std::vector<ledger::Transaction>, dp::Error>::err(result.error()));
                        return;
                    }

                    // Transactions of previously stored side blocks, read back after the commit
                    std::vector<ledger::Transaction> confirmed;
                    for (const auto &hash : m.connect) {
                        if (hash == m.incoming.hash) {
                            confirmed.insert(confirmed.end(), m.incoming.transactions.begin(),
                                             m.incoming.transactions.end());
                            continue;
                        }
                        auto block = store_.getBlock(hash);
                        if (block.is_err()) {
                            KNOTSTORE_LOG_WARN(CATEGORY, "cannot read connected block: " + error_text(block.error()));
                            continue;
                        }
                        const auto &txs = block.value().transactions;
                        confirmed.insert(confirmed.end(), txs.begin(), txs.end());
                    }
                    m.reply.set_value(dp::Result<std::vector<ledger::Transaction>, dp::Error>::ok(std::move(confirmed)));
                },
                [this](storage_msg::StoreSide &m) {
                    auto result = store_.putBlock(m.block, &m.diff);
                    report(result);
                    m.reply.set_value(result);
                },
                [this](storage_msg::Backup &m) { m.reply.set_value(store_.backup(m.destination)); }},
            message);
    }

} // namespace knotstore::node
