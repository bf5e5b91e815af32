#include <algorithm>

#include <knotstore/common/overloaded.hpp>
#include <knotstore/node/chain_worker.hpp>

namespace knotstore::node {

    namespace {
        const char *CATEGORY = "chain";

        std::string shortHash(const ledger::Hash256 &hash) { return ledger::toHex(hash).substr(0, 16); }
    } // namespace

    ChainWorker::ChainWorker(StorageWorker &storage, MempoolWorker &mempool, MetricsWorker &metrics, Emitter emit,
                             std::size_t capacity)
        : storage_(storage), mempool_(mempool), metrics_(metrics), emit_(std::move(emit)),
          worker_("chain", capacity, [this](ChainMessage &message) { handle(message); }) {}

    dp::Result<AcceptResult, dp::Error> ChainWorker::acceptBlock(ledger::Block block, ledger::UtxoDiff diff) {
        Reply<AcceptResult> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(chain_msg::AcceptBlock{std::move(block), std::move(diff), std::move(reply)});
        if (sent.is_err())
            return dp::Result<AcceptResult, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    dp::Result<ledger::ChainTip, dp::Error> ChainWorker::tip() {
        Reply<ledger::ChainTip> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(chain_msg::GetTip{std::move(reply)});
        if (sent.is_err())
            return dp::Result<ledger::ChainTip, dp::Error>::err(sent.error());
        return awaitReply(future);
    }

    dp::Result<void, dp::Error> ChainWorker::load(std::vector<ledger::BlockIndexEntry> index,
                                                  std::optional<ledger::ChainTip> tip) {
        Reply<void> reply;
        auto future = reply.get_future();
        auto sent = worker_.send(chain_msg::Load{std::move(index), tip, std::move(reply)});
        if (sent.is_err())
            return sent;
        return awaitReply(future);
    }

    void ChainWorker::handle(ChainMessage &message) {
        std::visit(overloaded{[this](chain_msg::AcceptBlock &m) { m.reply.set_value(accept(m.block, m.diff)); },
                              [this](chain_msg::GetTip &m) {
                                  if (!tip_) {
                                      m.reply.set_value(dp::Result<ledger::ChainTip, dp::Error>::err(
                                          not_found("no chain tip yet")));
                                      return;
                                  }
                                  m.reply.set_value(dp::Result<ledger::ChainTip, dp::Error>::ok(*tip_));
                              },
                              [this](chain_msg::Load &m) {
                                  tree_.clear();
                                  has_genesis_ = false;
                                  // Entries arrive ordered by height, so parents are seen first
                                  for (const auto &entry : m.index) {
                                      std::uint64_t chain_work = entry.work;
                                      auto parent = tree_.find(entry.previous_hash);
                                      if (parent != tree_.end())
                                          chain_work += parent->second.chain_work;
                                      if (entry.height == 0 && ledger::isZero(entry.previous_hash))
                                          has_genesis_ = true;
                                      tree_[entry.hash] =
                                          TreeNode{entry.previous_hash, entry.height, entry.work, chain_work};
                                  }
                                  tip_ = m.tip;
                                  KNOTSTORE_LOG_INFO(CATEGORY, "loaded " + std::to_string(tree_.size()) + " blocks" +
                                                                   (tip_ ? ", tip height " +
                                                                               std::to_string(tip_->height)
                                                                         : std::string(", empty chain")));
                                  m.reply.set_value(dp::Result<void, dp::Error>::ok());
                              }},
                   message);
    }

    dp::Result<AcceptResult, dp::Error> ChainWorker::accept(const ledger::Block &block,
                                                            const ledger::UtxoDiff &diff) {
        using R = dp::Result<AcceptResult, dp::Error>;

        if (tree_.count(block.hash))
            return R::err(duplicate_key(dp::String(("block already known: " + ledger::toHex(block.hash)).c_str())));

        std::uint64_t chain_work = block.work;
        if (block.isGenesis()) {
            if (has_genesis_)
                return R::err(invalid_block("a genesis block is already stored"));
        } else {
            auto parent = tree_.find(block.previous_hash);
            if (parent == tree_.end()) {
                return R::err(
                    not_found(dp::String(("unknown parent: " + ledger::toHex(block.previous_hash)).c_str())));
            }
            if (block.height != parent->second.height + 1) {
                return R::err(invalid_block(dp::String(("height " + std::to_string(block.height) +
                                                        " does not follow parent height " +
                                                        std::to_string(parent->second.height))
                                                           .c_str())));
            }
            chain_work += parent->second.chain_work;
        }

        ledger::ChainTip new_tip{block.hash, block.height, chain_work};

        if (!tip_ || block.previous_hash == tip_->hash)
            return connectTip(block, diff, new_tip);

        if (chain_work > tip_->work)
            return reorganizeTo(block, diff, new_tip);

        auto stored = storage_.storeSide(block, diff);
        if (stored.is_err())
            return R::err(stored.error());
        remember(block, chain_work);
        KNOTSTORE_LOG_DEBUG(CATEGORY, "side block " + shortHash(block.hash) + " at height " +
                                          std::to_string(block.height));

        AcceptResult result;
        result.outcome = AcceptOutcome::SideChain;
        result.tip = *tip_;
        return R::ok(std::move(result));
    }

    dp::Result<AcceptResult, dp::Error> ChainWorker::connectTip(const ledger::Block &block,
                                                                const ledger::UtxoDiff &diff,
                                                                const ledger::ChainTip &new_tip) {
        auto stored = storage_.connect(block, diff, new_tip);
        if (stored.is_err())
            return dp::Result<AcceptResult, dp::Error>::err(stored.error());

        remember(block, new_tip.work);
        tip_ = new_tip;

        confirmInMempool(block.transactions);
        emitBlockAccepted(block);
        metrics_.blockProcessed(block.transactions.size());
        KNOTSTORE_LOG_INFO(CATEGORY, "connected " + shortHash(block.hash) + " at height " +
                                         std::to_string(block.height));

        AcceptResult result;
        result.outcome = AcceptOutcome::Connected;
        result.tip = new_tip;
        result.connected.push_back(block.hash);
        return dp::Result<AcceptResult, dp::Error>::ok(std::move(result));
    }

    dp::Result<AcceptResult, dp::Error> ChainWorker::reorganizeTo(const ledger::Block &block,
                                                                  const ledger::UtxoDiff &diff,
                                                                  const ledger::ChainTip &new_tip) {
        using R = dp::Result<AcceptResult, dp::Error>;
        const ledger::ChainTip old_tip = *tip_;

        // Walk both branches back to their common ancestor
        std::vector<ledger::Hash256> disconnect;
        std::vector<ledger::Hash256> connect{block.hash};
        ledger::Hash256 old_cursor = old_tip.hash;
        ledger::Hash256 new_cursor = block.previous_hash;
        auto height_of = [this](const ledger::Hash256 &hash) { return tree_.at(hash).height; };

        while (old_cursor != new_cursor) {
            std::uint64_t old_height = height_of(old_cursor);
            std::uint64_t new_height = height_of(new_cursor);
            if (old_height >= new_height) {
                disconnect.push_back(old_cursor);
                if (old_height == 0)
                    return R::err(invariant_violation("branches share no common ancestor"));
                old_cursor = tree_.at(old_cursor).previous_hash;
            }
            if (new_height >= old_height && old_cursor != new_cursor) {
                connect.push_back(new_cursor);
                if (new_height == 0)
                    return R::err(invariant_violation("branches share no common ancestor"));
                new_cursor = tree_.at(new_cursor).previous_hash;
            }
        }
        std::reverse(connect.begin(), connect.end());
        const std::uint64_t fork_height = height_of(old_cursor);

        auto confirmed = storage_.reorganize(disconnect, connect, new_tip, block, diff);
        if (confirmed.is_err())
            return R::err(confirmed.error());

        remember(block, new_tip.work);
        tip_ = new_tip;

        KNOTSTORE_LOG_WARN(CATEGORY, "reorganized from " + shortHash(old_tip.hash) + " to " +
                                         shortHash(new_tip.hash) + ", depth " + std::to_string(disconnect.size()));

        auto removed = mempool_.chainReorganized(std::move(confirmed.value()));
        if (removed.is_err())
            KNOTSTORE_LOG_WARN(CATEGORY, "mempool update after reorg failed: " + error_text(removed.error()));
        if (emit_) {
            emit_(events::ChainReorg{old_tip.hash, new_tip.hash, old_tip.height, new_tip.height, fork_height,
                                     disconnect.size()});
        }
        emitBlockAccepted(block);
        metrics_.reorgProcessed(disconnect.size());
        metrics_.blockProcessed(block.transactions.size());

        AcceptResult result;
        result.outcome = AcceptOutcome::Reorganized;
        result.tip = new_tip;
        result.disconnected = std::move(disconnect);
        result.connected = std::move(connect);
        return R::ok(std::move(result));
    }

    void ChainWorker::confirmInMempool(std::vector<ledger::Transaction> txs) {
        if (txs.empty())
            return;
        auto removed = mempool_.blockConfirmed(std::move(txs));
        if (removed.is_err())
            KNOTSTORE_LOG_WARN(CATEGORY, "mempool confirmation failed: " + error_text(removed.error()));
    }

    void ChainWorker::emitBlockAccepted(const ledger::Block &block) {
        if (!emit_)
            return;
        std::size_t size = block.payload.size();
        for (const auto &tx : block.transactions)
            size += tx.size();
        emit_(events::BlockAccepted{block.hash, block.height, size, block.transactions.size(), block.timestamp});
    }

    void ChainWorker::remember(const ledger::Block &block, std::uint64_t chain_work) {
        tree_[block.hash] = TreeNode{block.previous_hash, block.height, block.work, chain_work};
        if (block.isGenesis())
            has_genesis_ = true;
    }

} // namespace knotstore::node
