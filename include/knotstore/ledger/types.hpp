#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <keylock/keylock.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace knotstore::ledger {

    using Bytes = std::vector<std::uint8_t>;
    using Hash256 = std::array<std::uint8_t, 32>;

    /// All-zero hash, used as the parent of genesis
    inline Hash256 zeroHash() { return Hash256{}; }

    inline bool isZero(const Hash256 &h) {
        for (auto b : h)
            if (b != 0)
                return false;
        return true;
    }

    inline std::string toHex(const Hash256 &h) { return keylock::keylock::to_hex(Bytes(h.begin(), h.end())); }

    inline Hash256 hashFromHex(const std::string &hex) {
        Bytes raw = keylock::keylock::from_hex(hex);
        if (raw.size() != 32)
            throw std::invalid_argument("hash must be 32 bytes");
        Hash256 out{};
        std::memcpy(out.data(), raw.data(), 32);
        return out;
    }

    inline Hash256 hashFromBytes(const void *data, std::size_t size) {
        Hash256 out{};
        std::memcpy(out.data(), data, size < 32 ? size : 32);
        return out;
    }

    /// SHA-256 digest of arbitrary bytes
    inline Hash256 sha256(const Bytes &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success || result.data.size() != 32)
            throw std::runtime_error("SHA256 hashing failed");
        return hashFromBytes(result.data.data(), 32);
    }

    inline Hash256 sha256(const std::string &text) { return sha256(Bytes(text.begin(), text.end())); }

    // ===========================================
    // Ledger entities
    // ===========================================

    struct OutPoint {
        Hash256 txid{};
        std::uint32_t index{0};

        bool operator==(const OutPoint &o) const { return txid == o.txid && index == o.index; }
        bool operator!=(const OutPoint &o) const { return !(*this == o); }
        bool operator<(const OutPoint &o) const { return txid != o.txid ? txid < o.txid : index < o.index; }

        std::string toString() const { return toHex(txid) + ":" + std::to_string(index); }
    };

    struct OutPointHasher {
        std::size_t operator()(const OutPoint &op) const {
            std::size_t h = 0;
            std::memcpy(&h, op.txid.data(), sizeof(h));
            return h ^ (static_cast<std::size_t>(op.index) * 0x9e3779b97f4a7c15ULL);
        }
    };

    struct HashHasher {
        std::size_t operator()(const Hash256 &h) const {
            std::size_t v = 0;
            std::memcpy(&v, h.data(), sizeof(v));
            return v;
        }
    };

    struct TxOut {
        std::int64_t value{0};
        Bytes script;

        bool operator==(const TxOut &o) const { return value == o.value && script == o.script; }
    };

    struct Transaction {
        Hash256 txid{};
        Bytes raw;
        std::vector<OutPoint> inputs;
        std::vector<TxOut> outputs;

        /// Serialized size in bytes; used for fee rate and mempool capacity
        std::size_t size() const { return raw.size(); }

        bool operator==(const Transaction &o) const {
            return txid == o.txid && raw == o.raw && inputs == o.inputs && outputs == o.outputs;
        }
    };

    /// Unspent output together with its creation height
    struct Utxo {
        OutPoint outpoint;
        std::int64_t value{0};
        Bytes script;
        std::uint64_t height{0};

        bool operator==(const Utxo &o) const {
            return outpoint == o.outpoint && value == o.value && script == o.script && height == o.height;
        }
    };

    /// UTXO changes a block makes, as computed by the validator
    struct UtxoDiff {
        std::vector<OutPoint> spent;
        std::vector<Utxo> created;
    };

    struct Block {
        Hash256 hash{};
        Hash256 previous_hash{};
        std::uint64_t height{0};
        std::int64_t timestamp{0};
        std::uint64_t work{1};
        Bytes payload;
        std::vector<Transaction> transactions;

        bool isGenesis() const { return height == 0 && isZero(previous_hash); }
    };

    struct ChainTip {
        Hash256 hash{};
        std::uint64_t height{0};
        std::uint64_t work{0};

        bool operator==(const ChainTip &o) const { return hash == o.hash && height == o.height && work == o.work; }
    };

    /// Header-level view of a stored block, used to rebuild the block arena
    struct BlockIndexEntry {
        Hash256 hash{};
        Hash256 previous_hash{};
        std::uint64_t height{0};
        std::uint64_t work{0};
    };

} // namespace knotstore::ledger
