#pragma once

#include <datapod/datapod.hpp>
#include <knotstore/common/error.hpp>
#include <knotstore/ledger/types.hpp>

#include <string>
#include <vector>

namespace knotstore::storage {

    // ===========================================
    // On-disk records (datapod, versioned)
    // ===========================================

    /// Value stored under a UTXO key. Layout is part of the on-disk format.
    struct UtxoRecord {
        dp::i64 value{0};
        dp::Vector<dp::u8> script{};
        dp::u64 height{0};

        auto members() { return std::tie(value, script, height); }
        auto members() const { return std::tie(value, script, height); }
    };

    struct OutPointRecord {
        dp::Vector<dp::u8> txid{};
        dp::u32 index{0};

        auto members() { return std::tie(txid, index); }
        auto members() const { return std::tie(txid, index); }
    };

    struct CreatedRecord {
        OutPointRecord outpoint{};
        UtxoRecord utxo{};

        auto members() { return std::tie(outpoint, utxo); }
        auto members() const { return std::tie(outpoint, utxo); }
    };

    /// Validator-supplied diff kept with each block so side-chain blocks can be connected later
    struct DiffRecord {
        dp::Vector<OutPointRecord> spent{};
        dp::Vector<CreatedRecord> created{};

        auto members() { return std::tie(spent, created); }
        auto members() const { return std::tie(spent, created); }
    };

    /// A consumed UTXO row, kept as raw key/value bytes so rollback restores it byte-for-byte
    struct UndoEntry {
        dp::Vector<dp::u8> key{};
        dp::Vector<dp::u8> record{};

        auto members() { return std::tie(key, record); }
        auto members() const { return std::tie(key, record); }
    };

    struct BlockUndoRecord {
        dp::Vector<UndoEntry> spent{};
        dp::Vector<dp::Vector<dp::u8>> created{};

        auto members() { return std::tie(spent, created); }
        auto members() const { return std::tie(spent, created); }
    };

    struct TxOutRecord {
        dp::i64 value{0};
        dp::Vector<dp::u8> script{};

        auto members() { return std::tie(value, script); }
        auto members() const { return std::tie(value, script); }
    };

    struct TransactionRecord {
        dp::Vector<dp::u8> txid{};
        dp::Vector<dp::u8> raw{};
        dp::Vector<OutPointRecord> inputs{};
        dp::Vector<TxOutRecord> outputs{};

        auto members() { return std::tie(txid, raw, inputs, outputs); }
        auto members() const { return std::tie(txid, raw, inputs, outputs); }
    };

    struct ChainTipRecord {
        dp::Vector<dp::u8> hash{};
        dp::u64 height{0};
        dp::u64 work{0};

        auto members() { return std::tie(hash, height, work); }
        auto members() const { return std::tie(hash, height, work); }
    };

    // ===========================================
    // Encoding helpers
    // ===========================================

    template <typename T> inline std::vector<dp::u8> encodeRecord(const T &record) {
        auto &self = const_cast<T &>(record);
        auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
        return std::vector<dp::u8>(buf.begin(), buf.end());
    }

    template <typename T> inline dp::Result<T, dp::Error> decodeRecord(const dp::u8 *data, std::size_t size) {
        try {
            dp::ByteBuf buf(data, data + size);
            auto result = dp::deserialize<dp::Mode::WITH_VERSION, T>(buf);
            return dp::Result<T, dp::Error>::ok(std::move(result));
        } catch (const std::exception &e) {
            return dp::Result<T, dp::Error>::err(
                storage_unavailable(dp::String((std::string("corrupt record: ") + e.what()).c_str())));
        }
    }

    template <typename T> inline dp::Result<T, dp::Error> decodeRecord(const std::vector<dp::u8> &bytes) {
        return decodeRecord<T>(bytes.data(), bytes.size());
    }

    inline dp::Vector<dp::u8> toDp(const std::vector<dp::u8> &bytes) {
        return dp::Vector<dp::u8>(bytes.begin(), bytes.end());
    }

    inline dp::Vector<dp::u8> toDp(const ledger::Hash256 &hash) { return dp::Vector<dp::u8>(hash.begin(), hash.end()); }

    inline std::vector<dp::u8> fromDp(const dp::Vector<dp::u8> &bytes) {
        return std::vector<dp::u8>(bytes.begin(), bytes.end());
    }

    inline ledger::Hash256 hashFromDp(const dp::Vector<dp::u8> &bytes) {
        return ledger::hashFromBytes(bytes.data(), bytes.size());
    }

    /// 36-byte UTXO key: txid followed by the big-endian output index, so keys sort by outpoint
    inline std::vector<dp::u8> outpointKey(const ledger::OutPoint &op) {
        std::vector<dp::u8> key(op.txid.begin(), op.txid.end());
        key.push_back(static_cast<dp::u8>(op.index >> 24));
        key.push_back(static_cast<dp::u8>(op.index >> 16));
        key.push_back(static_cast<dp::u8>(op.index >> 8));
        key.push_back(static_cast<dp::u8>(op.index));
        return key;
    }

    inline OutPointRecord toRecord(const ledger::OutPoint &op) { return OutPointRecord{toDp(op.txid), op.index}; }

    inline ledger::OutPoint fromRecord(const OutPointRecord &rec) {
        return ledger::OutPoint{hashFromDp(rec.txid), rec.index};
    }

    inline UtxoRecord toRecord(const ledger::Utxo &utxo) {
        return UtxoRecord{utxo.value, toDp(utxo.script), utxo.height};
    }

    inline ledger::Utxo fromRecord(const ledger::OutPoint &op, const UtxoRecord &rec) {
        return ledger::Utxo{op, rec.value, fromDp(rec.script), rec.height};
    }

    inline DiffRecord toRecord(const ledger::UtxoDiff &diff) {
        DiffRecord rec;
        for (const auto &op : diff.spent)
            rec.spent.push_back(toRecord(op));
        for (const auto &utxo : diff.created)
            rec.created.push_back(CreatedRecord{toRecord(utxo.outpoint), toRecord(utxo)});
        return rec;
    }

    inline ledger::UtxoDiff fromRecord(const DiffRecord &rec) {
        ledger::UtxoDiff diff;
        for (const auto &op : rec.spent)
            diff.spent.push_back(fromRecord(op));
        for (const auto &created : rec.created)
            diff.created.push_back(fromRecord(fromRecord(created.outpoint), created.utxo));
        return diff;
    }

    inline TransactionRecord toRecord(const ledger::Transaction &tx) {
        TransactionRecord rec;
        rec.txid = toDp(tx.txid);
        rec.raw = toDp(tx.raw);
        for (const auto &in : tx.inputs)
            rec.inputs.push_back(toRecord(in));
        for (const auto &out : tx.outputs)
            rec.outputs.push_back(TxOutRecord{out.value, toDp(out.script)});
        return rec;
    }

    inline ledger::Transaction fromRecord(const TransactionRecord &rec) {
        ledger::Transaction tx;
        tx.txid = hashFromDp(rec.txid);
        tx.raw = fromDp(rec.raw);
        for (const auto &in : rec.inputs)
            tx.inputs.push_back(fromRecord(in));
        for (const auto &out : rec.outputs)
            tx.outputs.push_back(ledger::TxOut{out.value, fromDp(out.script)});
        return tx;
    }

} // namespace knotstore::storage
