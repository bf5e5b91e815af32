#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <knotstore/common/config.hpp>
#include <knotstore/events/dispatcher.hpp>
#include <knotstore/events/http_transport.hpp>
#include <knotstore/events/socket_publisher.hpp>
#include <knotstore/mempool/mempool.hpp>
#include <knotstore/node/chain_worker.hpp>
#include <knotstore/node/mempool_worker.hpp>
#include <knotstore/node/metrics_worker.hpp>
#include <knotstore/node/storage_worker.hpp>
#include <knotstore/storage/ledger_store.hpp>

namespace knotstore::node {

    // ===========================================
    // Node - storage, workers and event fan-out behind one facade
    // ===========================================

    class Node {
      public:
        /// `transport` serves the HTTP publishers; a CurlTransport is created when none is given
        explicit Node(NodeConfig config, std::shared_ptr<events::HttpTransport> transport = nullptr);
        ~Node();

        Node(const Node &) = delete;
        Node &operator=(const Node &) = delete;

        /// Open the store, start the workers and publishers, and resume the chain from disk
        dp::Result<void, dp::Error> start();
        void stop();
        bool isRunning() const { return running_; }

        // Submission
        dp::Result<AcceptResult, dp::Error> acceptBlock(ledger::Block block, ledger::UtxoDiff diff);
        dp::Result<mempool::EntryPtr, dp::Error> submitTransaction(ledger::Transaction tx, std::int64_t fee);
        dp::Result<void, dp::Error> notifyPeer(const std::string &peer_id, const std::string &address,
                                               bool connected, const std::string &reason = "");

        // Queries
        dp::Result<ledger::Block, dp::Error> getBlock(const ledger::Hash256 &hash);
        dp::Result<ledger::Block, dp::Error> getBlockByHeight(std::uint64_t height);
        dp::Result<ledger::Transaction, dp::Error> getTransaction(const ledger::Hash256 &txid);
        dp::Result<ledger::Utxo, dp::Error> getUtxo(const ledger::OutPoint &outpoint);
        dp::Result<ledger::ChainTip, dp::Error> getChainTip();
        mempool::MempoolSnapshot mempoolSnapshot() const;
        dp::Result<MetricsSnapshot, dp::Error> metrics();
        /// Copy the store to `destination`, or to storage.backup_path when empty
        dp::Result<void, dp::Error> backup(const std::string &destination = "");

        const NodeConfig &config() const { return config_; }
        events::EventDispatcher *events() { return dispatcher_.get(); }
        /// Bound port of the socket publisher, 0 when it is not enabled
        std::uint16_t socketPort() const;

      private:
        NodeConfig config_;
        std::shared_ptr<events::HttpTransport> transport_;
        std::atomic<bool> running_{false};

        storage::LedgerStore store_;
        std::unique_ptr<mempool::Mempool> mempool_;
        std::unique_ptr<events::EventDispatcher> dispatcher_;
        std::shared_ptr<events::SocketPublisher> socket_;

        std::unique_ptr<MetricsWorker> metrics_;
        std::unique_ptr<StorageWorker> storage_worker_;
        std::unique_ptr<MempoolWorker> mempool_worker_;
        std::unique_ptr<ChainWorker> chain_worker_;

        dp::Result<void, dp::Error> startEvents();
        dp::Result<void, dp::Error> resumeChain();
        void emit(events::EventPayload payload);
        dp::Error notRunning() const;
    };

} // namespace knotstore::node
