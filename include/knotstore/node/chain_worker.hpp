#pragma once

#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

#include <knotstore/ledger/types.hpp>
#include <knotstore/node/mempool_worker.hpp>
#include <knotstore/node/metrics_worker.hpp>
#include <knotstore/node/storage_worker.hpp>

namespace knotstore::node {

    enum class AcceptOutcome { Connected, Reorganized, SideChain };

    struct AcceptResult {
        AcceptOutcome outcome{AcceptOutcome::Connected};
        ledger::ChainTip tip;
        /// Blocks rolled back, old tip first
        std::vector<ledger::Hash256> disconnected;
        /// Blocks applied, fork side first
        std::vector<ledger::Hash256> connected;
    };

    namespace chain_msg {
        struct AcceptBlock {
            ledger::Block block;
            ledger::UtxoDiff diff;
            Reply<AcceptResult> reply;
        };
        struct GetTip {
            Reply<ledger::ChainTip> reply;
        };
        /// Rebuild the in-memory block tree from stored headers
        struct Load {
            std::vector<ledger::BlockIndexEntry> index;
            std::optional<ledger::ChainTip> tip;
            Reply<void> reply;
        };
    } // namespace chain_msg

    using ChainMessage = std::variant<chain_msg::AcceptBlock, chain_msg::GetTip, chain_msg::Load>;

    /// Owns the block tree and the active tip. Blocks are accepted one at a time, so the
    /// storage commit, mempool confirmation and events of one block complete before the next starts.
    class ChainWorker {
      public:
        ChainWorker(StorageWorker &storage, MempoolWorker &mempool, MetricsWorker &metrics, Emitter emit,
                    std::size_t capacity);

        void start() { worker_.start(); }
        void stop() { worker_.stop(); }

        dp::Result<AcceptResult, dp::Error> acceptBlock(ledger::Block block, ledger::UtxoDiff diff);
        dp::Result<ledger::ChainTip, dp::Error> tip();
        dp::Result<void, dp::Error> load(std::vector<ledger::BlockIndexEntry> index,
                                         std::optional<ledger::ChainTip> tip);

      private:
        struct TreeNode {
            ledger::Hash256 previous_hash{};
            std::uint64_t height{0};
            std::uint64_t work{0};
            std::uint64_t chain_work{0};
        };

        StorageWorker &storage_;
        MempoolWorker &mempool_;
        MetricsWorker &metrics_;
        Emitter emit_;

        std::unordered_map<ledger::Hash256, TreeNode, ledger::HashHasher> tree_;
        std::optional<ledger::ChainTip> tip_;
        bool has_genesis_{false};

        Worker<ChainMessage> worker_;

        void handle(ChainMessage &message);
        dp::Result<AcceptResult, dp::Error> accept(const ledger::Block &block, const ledger::UtxoDiff &diff);
        dp::Result<AcceptResult, dp::Error> connectTip(const ledger::Block &block, const ledger::UtxoDiff &diff,
                                                       const ledger::ChainTip &new_tip);
        dp::Result<AcceptResult, dp::Error> reorganizeTo(const ledger::Block &block, const ledger::UtxoDiff &diff,
                                                         const ledger::ChainTip &new_tip);
        void confirmInMempool(std::vector<ledger::Transaction> txs);
        void emitBlockAccepted(const ledger::Block &block);
        void remember(const ledger::Block &block, std::uint64_t chain_work);
    };

} // namespace knotstore::node
