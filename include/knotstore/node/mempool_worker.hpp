#pragma once

#include <functional>
#include <variant>
#include <vector>

#include <knotstore/events/event.hpp>
#include <knotstore/mempool/mempool.hpp>
#include <knotstore/node/metrics_worker.hpp>
#include <knotstore/node/worker.hpp>

namespace knotstore::node {

    /// Hands an event payload to the fan-out layer
    using Emitter = std::function<void(events::EventPayload)>;

    namespace mempool_msg {
        struct Submit {
            ledger::Transaction tx;
            std::int64_t fee{0};
            Reply<mempool::EntryPtr> reply;
        };
        /// Reply carries how many pending entries the block removed
        struct BlockConfirmed {
            std::vector<ledger::Transaction> txs;
            Reply<std::size_t> reply;
        };
        /// Like BlockConfirmed for the connected branch, then drops entries left spending rolled-back outputs
        struct ChainReorganized {
            std::vector<ledger::Transaction> connected_txs;
            Reply<std::size_t> reply;
        };
    } // namespace mempool_msg

    using MempoolMessage =
        std::variant<mempool_msg::Submit, mempool_msg::BlockConfirmed, mempool_msg::ChainReorganized>;

    /// Single writer of the mempool; readers take snapshots directly
    class MempoolWorker {
      public:
        MempoolWorker(mempool::Mempool &pool, MetricsWorker &metrics, Emitter emit, std::uint64_t max_bytes,
                      std::size_t capacity);

        void start() { worker_.start(); }
        void stop() { worker_.stop(); }

        dp::Result<mempool::EntryPtr, dp::Error> submit(ledger::Transaction tx, std::int64_t fee);
        dp::Result<std::size_t, dp::Error> blockConfirmed(std::vector<ledger::Transaction> txs);
        dp::Result<std::size_t, dp::Error> chainReorganized(std::vector<ledger::Transaction> connected_txs);

      private:
        mempool::Mempool &pool_;
        MetricsWorker &metrics_;
        Emitter emit_;
        std::uint64_t max_bytes_;
        Worker<MempoolMessage> worker_;

        void handle(MempoolMessage &message);
        void reportLevel();
    };

} // namespace knotstore::node
