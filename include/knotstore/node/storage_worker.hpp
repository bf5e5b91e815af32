#pragma once

#include <string>
#include <variant>
#include <vector>

#include <knotstore/ledger/types.hpp>
#include <knotstore/node/metrics_worker.hpp>
#include <knotstore/node/worker.hpp>
#include <knotstore/storage/ledger_store.hpp>

namespace knotstore::node {

    namespace storage_msg {
        struct Connect {
            ledger::Block block;
            ledger::UtxoDiff diff;
            ledger::ChainTip tip;
            Reply<void> reply;
        };
        /// Reply carries the transactions of every connected block, incoming block last
        struct Reorganize {
            std::vector<ledger::Hash256> disconnect;
            std::vector<ledger::Hash256> connect;
            ledger::ChainTip tip;
            ledger::Block incoming;
            ledger::UtxoDiff diff;
            Reply<std::vector<ledger::Transaction>> reply;
        };
        struct StoreSide {
            ledger::Block block;
            ledger::UtxoDiff diff;
            Reply<void> reply;
        };
        struct Backup {
            std::string destination;
            Reply<void> reply;
        };
    } // namespace storage_msg

    using StorageMessage =
        std::variant<storage_msg::Connect, storage_msg::Reorganize, storage_msg::StoreSide, storage_msg::Backup>;

    /// Sole user of the ledger store's write path; mutations are applied one message at a time
    class StorageWorker {
      public:
        StorageWorker(storage::LedgerStore &store, MetricsWorker &metrics, std::size_t capacity);

        void start() { worker_.start(); }
        void stop() { worker_.stop(); }

        dp::Result<void, dp::Error> connect(ledger::Block block, ledger::UtxoDiff diff, ledger::ChainTip tip);
        dp::Result<std::vector<ledger::Transaction>, dp::Error>
        reorganize(std::vector<ledger::Hash256> disconnect, std::vector<ledger::Hash256> connect,
                   ledger::ChainTip tip, ledger::Block incoming, ledger::UtxoDiff diff);
        dp::Result<void, dp::Error> storeSide(ledger::Block block, ledger::UtxoDiff diff);
        dp::Result<void, dp::Error> backup(std::string destination);

      private:
        storage::LedgerStore &store_;
        MetricsWorker &metrics_;
        Worker<StorageMessage> worker_;

        void handle(StorageMessage &message);
        template <typename T> void report(const dp::Result<T, dp::Error> &result);
    };

} // namespace knotstore::node
