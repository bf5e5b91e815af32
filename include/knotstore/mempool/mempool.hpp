#pragma once

#include <chrono>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <knotstore/common/error.hpp>
#include <knotstore/ledger/types.hpp>

namespace knotstore::mempool {

    using ledger::Hash256;
    using ledger::OutPoint;
    using ledger::Transaction;

    /// Pending transaction with fee data and package aggregates (each aggregate includes the entry itself)
    struct MempoolEntry {
        Transaction tx;
        std::int64_t fee{0};
        std::size_t size{0};
        double fee_rate{0.0};
        std::int64_t admitted_at{0};
        std::uint64_t sequence{0};

        std::size_t ancestor_count{1};
        std::size_t ancestor_size{0};
        std::int64_t ancestor_fees{0};
        std::size_t descendant_count{1};
        std::size_t descendant_size{0};
        std::int64_t descendant_fees{0};
    };

    using EntryPtr = std::shared_ptr<const MempoolEntry>;

    /// Immutable view of the pool at one instant, highest fee rate first
    class MempoolSnapshot {
      public:
        MempoolSnapshot() : entries_(std::make_shared<const std::vector<EntryPtr>>()) {}
        explicit MempoolSnapshot(std::vector<EntryPtr> entries)
            : entries_(std::make_shared<const std::vector<EntryPtr>>(std::move(entries))) {}

        std::vector<EntryPtr>::const_iterator begin() const { return entries_->begin(); }
        std::vector<EntryPtr>::const_iterator end() const { return entries_->end(); }
        std::size_t size() const { return entries_->size(); }
        bool empty() const { return entries_->empty(); }

        bool contains(const Hash256 &txid) const {
            for (const auto &entry : *entries_)
                if (entry->tx.txid == txid)
                    return true;
            return false;
        }

      private:
        std::shared_ptr<const std::vector<EntryPtr>> entries_;
    };

    struct MempoolInfo {
        std::size_t count{0};
        std::uint64_t bytes{0};
        double min_fee_rate{0.0};
        double max_fee_rate{0.0};
    };

    /// Answers whether an outpoint is in the confirmed UTXO set
    using UtxoLookup = std::function<bool(const OutPoint &)>;

    /// Pending-transaction pool.
    /// Mutations are expected from one owner (the mempool worker); snapshots may be taken from any thread.
    class Mempool {
      public:
        explicit Mempool(UtxoLookup lookup) : utxo_lookup_(std::move(lookup)) {}

        Mempool(const Mempool &) = delete;
        Mempool &operator=(const Mempool &) = delete;

        /// Admit a transaction whose inputs are all confirmed UTXOs or outputs of pending entries
        inline dp::Result<EntryPtr, dp::Error> admit(const Transaction &tx, std::int64_t fee) {
            // Confirmed-set lookups happen outside the exclusive lock
            std::vector<OutPoint> confirmed_inputs;
            {
                std::shared_lock lock(mutex_);
                if (entries_.count(tx.txid)) {
                    return dp::Result<EntryPtr, dp::Error>::err(
                        duplicate_entry(dp::String(("transaction already pending: " + ledger::toHex(tx.txid)).c_str())));
                }
                for (const auto &input : tx.inputs) {
                    if (!entries_.count(input.txid))
                        confirmed_inputs.push_back(input);
                }
            }
            for (const auto &input : confirmed_inputs) {
                if (!utxo_lookup_ || !utxo_lookup_(input)) {
                    return dp::Result<EntryPtr, dp::Error>::err(
                        missing_input(dp::String(("input not available: " + input.toString()).c_str())));
                }
            }

            std::unique_lock lock(mutex_);
            if (entries_.count(tx.txid)) {
                return dp::Result<EntryPtr, dp::Error>::err(
                    duplicate_entry(dp::String(("transaction already pending: " + ledger::toHex(tx.txid)).c_str())));
            }

            std::set<OutPoint> seen;
            for (const auto &input : tx.inputs) {
                if (!seen.insert(input).second) {
                    return dp::Result<EntryPtr, dp::Error>::err(
                        invariant_violation(dp::String(("input spent twice: " + input.toString()).c_str())));
                }
                auto spender = spent_by_.find(input);
                if (spender != spent_by_.end()) {
                    return dp::Result<EntryPtr, dp::Error>::err(invariant_violation(dp::String(
                        ("input already spent by pending " + ledger::toHex(spender->second)).c_str())));
                }
                auto parent = entries_.find(input.txid);
                if (parent != entries_.end() && input.index >= parent->second->tx.outputs.size()) {
                    return dp::Result<EntryPtr, dp::Error>::err(
                        missing_input(dp::String(("input not available: " + input.toString()).c_str())));
                }
            }

            auto entry = std::make_shared<MempoolEntry>();
            entry->tx = tx;
            entry->fee = fee;
            entry->size = tx.size() == 0 ? 1 : tx.size();
            entry->fee_rate = static_cast<double>(fee) / static_cast<double>(entry->size);
            entry->admitted_at = std::chrono::duration_cast<std::chrono::seconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count();
            entry->sequence = next_sequence_++;
            entry->ancestor_size = entry->size;
            entry->ancestor_fees = fee;
            entry->descendant_size = entry->size;
            entry->descendant_fees = fee;

            auto ancestors = collectAncestors(tx);
            for (const auto &id : ancestors) {
                const auto &anc = entries_.at(id);
                entry->ancestor_count += 1;
                entry->ancestor_size += anc->size;
                entry->ancestor_fees += anc->fee;
                auto updated = std::make_shared<MempoolEntry>(*anc);
                updated->descendant_count += 1;
                updated->descendant_size += entry->size;
                updated->descendant_fees += fee;
                entries_[id] = updated;
            }

            EntryPtr stored = entry;
            entries_[tx.txid] = stored;
            by_fee_rate_.insert(FeeKey{entry->fee_rate, entry->sequence, tx.txid});
            for (const auto &input : tx.inputs)
                spent_by_[input] = tx.txid;
            total_bytes_ += entry->size;

            return dp::Result<EntryPtr, dp::Error>::ok(stored);
        }

        /// Drop a transaction that was confirmed in a block; absent txids are ignored
        inline bool removeConfirmed(const Hash256 &txid) {
            std::unique_lock lock(mutex_);
            if (!entries_.count(txid))
                return false;
            removeEntry(txid);
            return true;
        }

        /// Drop a block's transactions and every pending entry that conflicts with its spends
        inline std::vector<Hash256> removeForBlock(const std::vector<Transaction> &block_txs) {
            std::unique_lock lock(mutex_);
            std::vector<Hash256> removed;
            for (const auto &tx : block_txs) {
                if (entries_.count(tx.txid)) {
                    removeEntry(tx.txid);
                    removed.push_back(tx.txid);
                }
            }
            for (const auto &tx : block_txs) {
                for (const auto &input : tx.inputs) {
                    auto spender = spent_by_.find(input);
                    if (spender == spent_by_.end() || spender->second == tx.txid)
                        continue;
                    auto evicted = removeWithDescendants(spender->second);
                    removed.insert(removed.end(), evicted.begin(), evicted.end());
                }
            }
            return removed;
        }

        /// Drop every entry with a confirmed input that is no longer in the UTXO set, with its descendants.
        /// Needed after a reorg rolls back the blocks that created those outputs.
        inline std::vector<Hash256> removeUnspendable() {
            std::vector<std::pair<Hash256, OutPoint>> confirmed_inputs;
            {
                std::shared_lock lock(mutex_);
                for (const auto &[txid, entry] : entries_) {
                    for (const auto &input : entry->tx.inputs)
                        if (!entries_.count(input.txid))
                            confirmed_inputs.emplace_back(txid, input);
                }
            }

            std::vector<Hash256> stale;
            for (const auto &[txid, input] : confirmed_inputs) {
                if (!utxo_lookup_ || !utxo_lookup_(input))
                    stale.push_back(txid);
            }

            std::unique_lock lock(mutex_);
            std::vector<Hash256> removed;
            for (const auto &txid : stale) {
                // Already gone as a descendant of an earlier stale entry
                if (!entries_.count(txid))
                    continue;
                auto evicted = removeWithDescendants(txid);
                removed.insert(removed.end(), evicted.begin(), evicted.end());
            }
            return removed;
        }

        /// Evict lowest fee-rate entries (oldest first on equal rates), with their descendants,
        /// until the pool fits in max_bytes. Returns evicted txids in eviction order.
        inline std::vector<Hash256> evictToCapacity(std::uint64_t max_bytes) {
            std::unique_lock lock(mutex_);
            std::vector<Hash256> evicted;
            while (total_bytes_ > max_bytes && !by_fee_rate_.empty()) {
                Hash256 victim = std::get<2>(*by_fee_rate_.begin());
                auto removed = removeWithDescendants(victim);
                evicted.insert(evicted.end(), removed.begin(), removed.end());
            }
            return evicted;
        }

        inline MempoolSnapshot snapshot() const {
            std::vector<EntryPtr> view;
            {
                std::shared_lock lock(mutex_);
                view.reserve(entries_.size());
                for (auto it = by_fee_rate_.rbegin(); it != by_fee_rate_.rend(); ++it)
                    view.push_back(entries_.at(std::get<2>(*it)));
            }
            return MempoolSnapshot(std::move(view));
        }

        inline dp::Result<EntryPtr, dp::Error> get(const Hash256 &txid) const {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(txid);
            if (it == entries_.end()) {
                return dp::Result<EntryPtr, dp::Error>::err(
                    not_found(dp::String(("transaction not pending: " + ledger::toHex(txid)).c_str())));
            }
            return dp::Result<EntryPtr, dp::Error>::ok(it->second);
        }

        inline bool contains(const Hash256 &txid) const {
            std::shared_lock lock(mutex_);
            return entries_.count(txid) > 0;
        }

        /// True if a pending entry creates this outpoint
        inline bool providesOutput(const OutPoint &outpoint) const {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(outpoint.txid);
            return it != entries_.end() && outpoint.index < it->second->tx.outputs.size();
        }

        inline MempoolInfo info() const {
            std::shared_lock lock(mutex_);
            MempoolInfo result;
            result.count = entries_.size();
            result.bytes = total_bytes_;
            if (!by_fee_rate_.empty()) {
                result.min_fee_rate = std::get<0>(*by_fee_rate_.begin());
                result.max_fee_rate = std::get<0>(*by_fee_rate_.rbegin());
            }
            return result;
        }

        inline std::size_t size() const {
            std::shared_lock lock(mutex_);
            return entries_.size();
        }

        inline std::uint64_t bytes() const {
            std::shared_lock lock(mutex_);
            return total_bytes_;
        }

      private:
        // (fee rate, admission sequence, txid): begin() is the next eviction victim
        using FeeKey = std::tuple<double, std::uint64_t, Hash256>;

        UtxoLookup utxo_lookup_;
        std::unordered_map<Hash256, EntryPtr, ledger::HashHasher> entries_;
        std::set<FeeKey> by_fee_rate_;
        std::unordered_map<OutPoint, Hash256, ledger::OutPointHasher> spent_by_;
        std::uint64_t total_bytes_{0};
        std::uint64_t next_sequence_{0};
        mutable std::shared_mutex mutex_;

        inline std::unordered_set<Hash256, ledger::HashHasher> collectAncestors(const Transaction &tx) const {
            std::unordered_set<Hash256, ledger::HashHasher> result;
            std::vector<Hash256> stack;
            for (const auto &input : tx.inputs)
                if (entries_.count(input.txid))
                    stack.push_back(input.txid);
            while (!stack.empty()) {
                Hash256 id = stack.back();
                stack.pop_back();
                if (!result.insert(id).second)
                    continue;
                for (const auto &input : entries_.at(id)->tx.inputs)
                    if (entries_.count(input.txid))
                        stack.push_back(input.txid);
            }
            return result;
        }

        /// Descendants in breadth-first order, not including txid itself
        inline std::vector<Hash256> collectDescendants(const Hash256 &txid) const {
            std::vector<Hash256> order;
            std::unordered_set<Hash256, ledger::HashHasher> seen{txid};
            std::vector<Hash256> frontier{txid};
            while (!frontier.empty()) {
                std::vector<Hash256> next;
                for (const auto &id : frontier) {
                    const auto &entry = entries_.at(id);
                    for (std::uint32_t i = 0; i < entry->tx.outputs.size(); ++i) {
                        auto child = spent_by_.find(OutPoint{id, i});
                        if (child != spent_by_.end() && seen.insert(child->second).second) {
                            order.push_back(child->second);
                            next.push_back(child->second);
                        }
                    }
                }
                frontier = std::move(next);
            }
            return order;
        }

        /// Remove one entry and fix the aggregates of everything still linked to it
        inline void removeEntry(const Hash256 &txid) {
            EntryPtr entry = entries_.at(txid);

            for (const auto &id : collectAncestors(entry->tx)) {
                auto updated = std::make_shared<MempoolEntry>(*entries_.at(id));
                updated->descendant_count -= 1;
                updated->descendant_size -= entry->size;
                updated->descendant_fees -= entry->fee;
                entries_[id] = updated;
            }
            for (const auto &id : collectDescendants(txid)) {
                auto updated = std::make_shared<MempoolEntry>(*entries_.at(id));
                updated->ancestor_count -= 1;
                updated->ancestor_size -= entry->size;
                updated->ancestor_fees -= entry->fee;
                entries_[id] = updated;
            }

            for (const auto &input : entry->tx.inputs) {
                auto it = spent_by_.find(input);
                if (it != spent_by_.end() && it->second == txid)
                    spent_by_.erase(it);
            }
            by_fee_rate_.erase(FeeKey{entry->fee_rate, entry->sequence, txid});
            total_bytes_ -= entry->size;
            entries_.erase(txid);
        }

        /// Remove an entry and its descendants, leaves first; returns removed txids with txid first
        inline std::vector<Hash256> removeWithDescendants(const Hash256 &txid) {
            std::vector<Hash256> removed{txid};
            auto descendants = collectDescendants(txid);
            removed.insert(removed.end(), descendants.begin(), descendants.end());
            for (auto it = removed.rbegin(); it != removed.rend(); ++it)
                removeEntry(*it);
            return removed;
        }
    };

} // namespace knotstore::mempool
